#pragma once
#include "scanner_plugin.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Static table of scanner plugins.
// Plugins are looked up by name; the table is fixed at compile time.

class PluginRegistry {
public:
    using Factory = std::function<std::unique_ptr<ScannerPlugin>()>;

    /**
     * @brief Names usable as scan types, sorted
     */
    static std::vector<std::string> available_plugin_names();

    /**
     * @brief Create a fresh plugin instance
     * @param name Plugin name or alias ("sqli" for "sql_injection")
     * @return New instance, or nullptr if the name is unknown
     */
    static std::unique_ptr<ScannerPlugin> create(const std::string& name);

    /**
     * @brief Resolve an alias to its plugin name
     * @return Canonical name, or empty string if unknown
     */
    static std::string canonical_name(const std::string& name);

private:
    static const std::map<std::string, Factory>& table();
};

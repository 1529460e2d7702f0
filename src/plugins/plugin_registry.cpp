// Scanner plugin registration table

#include "plugin_registry.h"
#include "sql_injection_plugin.h"
#include "xss_plugin.h"
#include "core/url_utils.h"

const std::map<std::string, PluginRegistry::Factory>& PluginRegistry::table() {
    static const std::map<std::string, Factory> plugins = {
        {"sql_injection", [] { return std::unique_ptr<ScannerPlugin>(new SqlInjectionPlugin()); }},
        {"xss", [] { return std::unique_ptr<ScannerPlugin>(new XssPlugin()); }},
    };
    return plugins;
}

std::vector<std::string> PluginRegistry::available_plugin_names() {
    std::vector<std::string> names;
    for (const auto& entry : table()) {
        names.push_back(entry.first);
    }
    return names;
}

std::string PluginRegistry::canonical_name(const std::string& name) {
    std::string n = url::to_lower(name);
    if (n == "sqli" || n == "sql") return "sql_injection";
    if (n == "cross_site_scripting") return "xss";
    return table().count(n) ? n : "";
}

std::unique_ptr<ScannerPlugin> PluginRegistry::create(const std::string& name) {
    auto it = table().find(canonical_name(name));
    if (it == table().end()) {
        return nullptr;
    }
    return it->second();
}

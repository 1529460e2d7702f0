#pragma once
#include <schema/scan_options.h>
#include <string>

namespace config {

// Scan configuration loader.
// Reads JSON, or failing that a YAML subset: flat "key: value" lines plus the
// "auth:", "headers:" and "cookies:" sections, one indented "key: value" per
// line. Unknown keys are ignored with a debug message.

/**
 * @brief Load scan options from a file
 * @param path JSON or YAML file
 * @return Options with file values applied over the defaults; defaults (and a
 *         warning) when the file cannot be opened
 */
ScanOptions load_scan_config(const std::string& path);

/**
 * @brief Parse scan options from file content
 * @param content JSON or YAML text
 * @param base Options the content is applied over
 * @return Updated options
 */
ScanOptions parse_scan_config(const std::string& content, const ScanOptions& base = ScanOptions());

/**
 * @brief Apply one setting, as from a config line or a CLI flag
 * @param opts Options to update
 * @param key Setting name; "auth.x", "headers.x" and "cookies.x" address sections
 * @param value Raw value (quotes already removed)
 * @return false if the key is unknown or the value does not parse
 */
bool apply_setting(ScanOptions& opts, const std::string& key, const std::string& value);

} // namespace config

// Scan configuration loading (JSON or YAML subset)

#include "scan_config.h"
#include "core/url_utils.h"
#include "logging/console.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace config {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

/// Drop a trailing comment that starts at '#' preceded by whitespace, outside quotes.
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

bool parse_bool(const std::string& v, bool& out) {
    std::string l = url::to_lower(v);
    if (l == "true" || l == "yes" || l == "on" || l == "1") { out = true; return true; }
    if (l == "false" || l == "no" || l == "off" || l == "0") { out = false; return true; }
    return false;
}

template <typename T>
bool parse_number(const std::string& v, T& out) {
    try {
        size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size()) return false;
        out = static_cast<T>(d);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::string scalar_text(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return v.dump();
}

void apply_json(ScanOptions& opts, const json& j) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();
        if (value.is_object()) {
            for (auto inner = value.begin(); inner != value.end(); ++inner) {
                if (inner.value().is_structured()) continue;
                std::string full = key + "." + inner.key();
                if (!apply_setting(opts, full, scalar_text(inner.value()))) {
                    logging::debug("config: ignoring '" + full + "'");
                }
            }
            continue;
        }
        if (value.is_structured() || value.is_null()) continue;
        if (!apply_setting(opts, key, scalar_text(value))) {
            logging::debug("config: ignoring '" + key + "'");
        }
    }
}

void apply_yaml(ScanOptions& opts, const std::string& content) {
    std::istringstream in(content);
    std::string raw;
    std::string section;
    int line_no = 0;

    while (std::getline(in, raw)) {
        ++line_no;
        std::string line = strip_comment(raw);
        if (trim(line).empty()) continue;
        if (trim(line) == "---") continue;

        bool indented = line[0] == ' ' || line[0] == '\t';
        line = trim(line);
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            logging::warn("config: line " + std::to_string(line_no) + " is not 'key: value'");
            continue;
        }
        std::string key = trim(line.substr(0, colon));
        std::string value = unquote(trim(line.substr(colon + 1)));

        if (!indented) {
            section.clear();
            if (value.empty()) {
                // Opens a section
                section = key;
                continue;
            }
        }

        std::string full = (indented && !section.empty()) ? section + "." + key : key;
        if (!apply_setting(opts, full, value)) {
            logging::debug("config: ignoring '" + full + "' on line " + std::to_string(line_no));
        }
    }
}

} // namespace

bool apply_setting(ScanOptions& opts, const std::string& key, const std::string& value) {
    if (key.rfind("headers.", 0) == 0) {
        opts.headers[key.substr(8)] = value;
        return true;
    }
    if (key.rfind("cookies.", 0) == 0) {
        opts.cookies[key.substr(8)] = value;
        return true;
    }
    if (key == "auth.login_url") { opts.auth.login_url = value; return true; }
    if (key == "auth.username") { opts.auth.username = value; return true; }
    if (key == "auth.password") { opts.auth.password = value; return true; }
    if (key == "auth.token_field") { opts.auth.token_field = value; return true; }

    if (key == "max_depth") return parse_number(value, opts.max_depth);
    if (key == "max_urls") return parse_number(value, opts.max_urls);
    if (key == "max_requests") return parse_number(value, opts.max_requests);
    if (key == "request_delay_ms") return parse_number(value, opts.request_delay_ms);
    if (key == "max_concurrent") return parse_number(value, opts.max_concurrent);
    if (key == "timeout_seconds") return parse_number(value, opts.timeout_seconds);
    if (key == "scan_timeout_seconds") return parse_number(value, opts.scan_timeout_seconds);
    if (key == "confidence_threshold") return parse_number(value, opts.confidence_threshold);
    if (key == "union_confidence_threshold") return parse_number(value, opts.union_confidence_threshold);
    if (key == "stored_xss_threshold") return parse_number(value, opts.stored_xss_threshold);
    if (key == "time_base_delay_seconds") return parse_number(value, opts.time_base_delay_seconds);
    if (key == "union_max_columns") return parse_number(value, opts.union_max_columns);

    if (key == "follow_redirects") return parse_bool(value, opts.follow_redirects);
    if (key == "verify_tls") return parse_bool(value, opts.verify_tls);
    if (key == "respect_robots") return parse_bool(value, opts.respect_robots);
    if (key == "crawl") return parse_bool(value, opts.crawl);
    if (key == "waf_bypass") return parse_bool(value, opts.waf_bypass);
    if (key == "allow_private_targets") return parse_bool(value, opts.allow_private_targets);

    if (key == "user_agent") { opts.user_agent = value; return true; }
    if (key == "log_level") { opts.log_level = value; return true; }
    if (key == "audit_log") { opts.audit_log = value; return true; }
    if (key == "error_patterns_file") { opts.error_patterns_file = value; return true; }

    return false;
}

ScanOptions parse_scan_config(const std::string& content, const ScanOptions& base) {
    ScanOptions opts = base;

    // Try parsing as JSON first
    json j = json::parse(content, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        apply_json(opts, j);
        return opts;
    }

    apply_yaml(opts, content);
    return opts;
}

ScanOptions load_scan_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        logging::warn("could not open config file " + path + ", using defaults");
        return ScanOptions();
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    return parse_scan_config(content);
}

} // namespace config

// Response pattern analysis implementation

#include "response_analyzer.h"
#include "logging/console.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <nlohmann/json.hpp>

const char* database_type_name(DatabaseType t) {
    switch (t) {
        case DatabaseType::MYSQL: return "mysql";
        case DatabaseType::POSTGRESQL: return "postgresql";
        case DatabaseType::SQL_SERVER: return "mssql";
        case DatabaseType::ORACLE: return "oracle";
        case DatabaseType::SQLITE: return "sqlite";
        case DatabaseType::GENERIC: return "generic";
        case DatabaseType::UNKNOWN: break;
    }
    return "unknown";
}

double AnalysisResult::best_confidence() const {
    double best = 0.0;
    for (const auto& m : matches) {
        best = std::max(best, m.confidence);
    }
    return best;
}

ResponseAnalyzer::ResponseAnalyzer() {
    initialize_default_patterns();
}

ResponseAnalyzer::ResponseAnalyzer(const std::string& config_path) {
    initialize_default_patterns();
    if (!load_patterns(config_path)) {
        logging::warn("could not read SQL error patterns from " + config_path + ", using built-in set");
    }
}

void ResponseAnalyzer::add_default(const std::string& name, const std::string& regex,
                                   const std::string& db_type, double confidence,
                                   const std::string& description) {
    PatternConfig p;
    p.name = name;
    p.regex_pattern = regex;
    p.database_type = db_type;
    p.confidence = confidence;
    p.description = description;
    add_pattern(p);
}

void ResponseAnalyzer::initialize_default_patterns() {
    patterns_.clear();

    // MySQL / MariaDB
    add_default("mysql_syntax_error", R"(You have an error in your SQL syntax)", "mysql", 0.95,
                "MySQL syntax error");
    add_default("mysql_syntax_banner", R"(SQL syntax.*?MySQL)", "mysql", 0.95, "MySQL syntax error banner");
    add_default("mariadb_syntax_banner", R"(SQL syntax.*?MariaDB server)", "mysql", 0.95,
                "MariaDB syntax error banner");
    add_default("mysqli_exception", R"(mysqli_sql_exception)", "mysql", 0.95, "PHP mysqli exception");
    add_default("mysql_warning", R"(Warning.*?\Wmysqli?_)", "mysql", 0.90, "PHP MySQL warning");
    add_default("mysql_valid_result", R"(valid MySQL result)", "mysql", 0.90, "MySQL result warning");
    add_default("mysql_client", R"(MySqlClient\.)", "mysql", 0.90, ".NET MySQL client error");
    add_default("mysql_query_fail", R"(MySQL Query fail)", "mysql", 0.90, "MySQL query failure");
    add_default("mysql_column_count", R"(The used SELECT statements have a different number of columns)",
                "mysql", 0.95, "UNION column count mismatch");
    add_default("mysql_table_not_found", R"(Table ['"]?([^'"]+)['"]? doesn't exist)", "mysql", 0.90,
                "MySQL table not found");

    // PostgreSQL
    add_default("postgresql_syntax_error", R"(ERROR:\s+syntax error at or near)", "postgresql", 0.95,
                "PostgreSQL syntax error");
    add_default("postgresql_error_banner", R"(PostgreSQL.*?ERROR)", "postgresql", 0.90,
                "PostgreSQL error banner");
    add_default("postgresql_warning", R"(Warning.*?\Wpg_)", "postgresql", 0.90, "PHP pg_* warning");
    add_default("postgresql_valid_result", R"(valid PostgreSQL result)", "postgresql", 0.90,
                "PostgreSQL result warning");
    add_default("postgresql_npgsql", R"(Npgsql\.)", "postgresql", 0.90, ".NET Npgsql error");
    add_default("postgresql_unterminated", R"(unterminated quoted string at or near)", "postgresql", 0.95,
                "PostgreSQL unterminated string");

    // SQL Server
    add_default("mssql_unclosed_quote", R"(Unclosed quotation mark after the character string)", "mssql", 0.95,
                "SQL Server unclosed quotation mark");
    add_default("mssql_incorrect_syntax", R"(Incorrect syntax near)", "mssql", 0.90,
                "SQL Server syntax error");
    add_default("mssql_driver", R"(Driver.*? SQL[\-\_\ ]*Server)", "mssql", 0.90, "SQL Server driver error");
    add_default("mssql_oledb", R"(OLE DB.*? SQL Server)", "mssql", 0.90, "OLE DB SQL Server error");
    add_default("mssql_native_client", R"(Microsoft SQL Native Client)", "mssql", 0.90,
                "SQL Server native client error");
    add_default("mssql_error_banner", R"(\bSQL Server.*?Error)", "mssql", 0.85, "SQL Server error banner");

    // Oracle
    add_default("oracle_error_code", R"(\bORA-[0-9]{4,5})", "oracle", 0.95, "Oracle error code");
    add_default("oracle_error", R"(Oracle error)", "oracle", 0.90, "Oracle error banner");
    add_default("oracle_driver", R"(Oracle.*?Driver)", "oracle", 0.85, "Oracle driver error");
    add_default("oracle_oci_warning", R"(Warning.*?\W(oci|ora)_)", "oracle", 0.90, "PHP OCI warning");

    // SQLite
    add_default("sqlite_jdbc", R"(SQLite/JDBCDriver)", "sqlite", 0.95, "SQLite JDBC driver error");
    add_default("sqlite_exception", R"(SQLite\.Exception)", "sqlite", 0.95, "SQLite exception");
    add_default("sqlite_dotnet", R"(System\.Data\.SQLite\.SQLiteException)", "sqlite", 0.95,
                ".NET SQLite exception");
    add_default("sqlite_error_code", R"(SQLITE_ERROR)", "sqlite", 0.95, "SQLite error code");
    add_default("sqlite_operational", R"(sqlite3\.OperationalError)", "sqlite", 0.95,
                "Python sqlite3 error");

    // Generic
    add_default("generic_sql_error", R"(SQL (syntax|command|statement).*?error)", "generic", 0.85,
                "Generic SQL error");
    add_default("generic_query_expression", R"(Syntax error.*?in query expression)", "generic", 0.90,
                "Syntax error in query expression");
    add_default("generic_unexpected", R"(Unexpected (end of SQL|token ".*?"))", "generic", 0.85,
                "Unexpected SQL token");
    add_default("generic_unknown_column", R"(Unknown column '.*?' in '(field list|where clause|order clause)')",
                "generic", 0.90, "Unknown column");
    add_default("generic_stack_mysqli_query", R"(Stack trace.*?mysqli_query)", "generic", 0.90,
                "Stack trace through mysqli_query");
}

bool ResponseAnalyzer::load_patterns(const std::string& config_path) {
    std::ifstream in(config_path);
    if (!in.is_open()) {
        return false;
    }

    // Simple YAML parser for pattern configuration
    // Expected format:
    // patterns:
    //   - name: "custom_pattern"
    //     regex: "pattern here"
    //     database_type: "mysql"
    //     confidence: 0.9

    std::string line;
    bool in_patterns = false;
    bool in_pattern = false;
    PatternConfig current_pattern;

    auto flush = [&]() {
        if (in_pattern && !current_pattern.name.empty() && !current_pattern.regex_pattern.empty()) {
            if (!add_pattern(current_pattern)) {
                logging::warn("skipping SQL error pattern '" + current_pattern.name + "': invalid regex");
            }
        }
    };

    while (std::getline(in, line)) {
        // Whole-line comments only; regexes may contain '#'
        size_t leading_spaces = line.find_first_not_of(' ');
        if (leading_spaces == std::string::npos || line[leading_spaces] == '#') continue;

        line.erase(0, line.find_first_not_of(" \t"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line.empty()) continue;

        bool item_start = false;
        if (line.rfind("- ", 0) == 0) {
            item_start = true;
            line = line.substr(2);
            line.erase(0, line.find_first_not_of(" \t"));
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string key = line.substr(0, colon_pos);
        key.erase(key.find_last_not_of(" \t") + 1);

        std::string value = line.substr(colon_pos + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        if (value.size() >= 2 && ((value[0] == '"' && value.back() == '"') ||
                                  (value[0] == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "patterns" && leading_spaces == 0) {
            in_patterns = true;
            continue;
        }
        if (!in_patterns) continue;

        if (item_start) {
            flush();
            current_pattern = PatternConfig();
            in_pattern = true;
        }
        if (!in_pattern) continue;

        if (key == "name") {
            current_pattern.name = value;
        } else if (key == "regex" || key == "pattern") {
            current_pattern.regex_pattern = value;
        } else if (key == "database_type" || key == "db_type") {
            current_pattern.database_type = value;
        } else if (key == "confidence") {
            try {
                current_pattern.confidence = std::stod(value);
            } catch (const std::exception&) {
                current_pattern.confidence = 0.9;
            }
        } else if (key == "case_sensitive") {
            current_pattern.case_sensitive = (value == "true" || value == "1");
        } else if (key == "description") {
            current_pattern.description = value;
        }
    }

    // Save last pattern if any
    flush();
    return true;
}

bool ResponseAnalyzer::add_pattern(const PatternConfig& pattern) {
    try {
        auto flags = std::regex_constants::ECMAScript;
        if (!pattern.case_sensitive) {
            flags |= std::regex_constants::icase;
        }
        patterns_.push_back(CompiledPattern{pattern, std::regex(pattern.regex_pattern, flags)});
        return true;
    } catch (const std::regex_error&) {
        return false;
    }
}

std::vector<PatternConfig> ResponseAnalyzer::get_patterns() const {
    std::vector<PatternConfig> out;
    out.reserve(patterns_.size());
    for (const auto& p : patterns_) {
        out.push_back(p.config);
    }
    return out;
}

std::string ResponseAnalyzer::extract_json_errors(const std::string& response_body) {
    size_t first = response_body.find_first_not_of(" \t\r\n");
    if (first == std::string::npos || (response_body[first] != '{' && response_body[first] != '[')) {
        return "";
    }

    nlohmann::json doc = nlohmann::json::parse(response_body, nullptr, false);
    if (doc.is_discarded()) {
        return "";
    }

    static const std::vector<std::string> error_keys = {
        "error", "message", "errorMessage", "sqlMessage", "sqlError", "exception", "detail"
    };

    std::string collected;
    // Walk objects and arrays, keeping string values stored under error-ish keys
    std::vector<const nlohmann::json*> stack{&doc};
    while (!stack.empty()) {
        const nlohmann::json* node = stack.back();
        stack.pop_back();
        if (node->is_object()) {
            for (auto it = node->begin(); it != node->end(); ++it) {
                if (it.value().is_string() &&
                    std::find(error_keys.begin(), error_keys.end(), it.key()) != error_keys.end()) {
                    collected += it.value().get<std::string>();
                    collected += "\n";
                } else if (it.value().is_structured()) {
                    stack.push_back(&it.value());
                }
            }
        } else if (node->is_array()) {
            for (const auto& item : *node) {
                if (item.is_structured()) stack.push_back(&item);
            }
        }
    }
    return collected;
}

AnalysisResult ResponseAnalyzer::analyze(const std::string& response_body) const {
    AnalysisResult result;

    if (response_body.empty()) {
        return result;
    }

    // JSON APIs carry the driver message inside a field; scan that text too
    std::string json_errors = extract_json_errors(response_body);

    for (const auto& pattern : patterns_) {
        PatternMatch match;
        bool matched = match_pattern(pattern, response_body, match) &&
                       validate_context(match, response_body);
        if (!matched && !json_errors.empty()) {
            matched = match_pattern(pattern, json_errors, match);
        }
        if (!matched) continue;

        result.matches.push_back(match);
        result.has_sql_error = true;
        if (result.detected_db_type == DatabaseType::UNKNOWN ||
            result.detected_db_type == DatabaseType::GENERIC) {
            result.detected_db_type = match.db_type;
        }
    }

    result.summary = build_summary(result);
    return result;
}

bool ResponseAnalyzer::match_pattern(const CompiledPattern& pattern,
                                     const std::string& response_body,
                                     PatternMatch& match) const {
    std::smatch regex_match;
    if (!std::regex_search(response_body, regex_match, pattern.regex)) {
        return false;
    }

    match.pattern_name = pattern.config.name;
    match.confidence = pattern.config.confidence;
    match.evidence = regex_match[0].str();

    size_t match_pos = regex_match.position(0);
    size_t match_length = regex_match.length(0);
    match.context = extract_context(response_body, match_pos, match_length);
    match.db_type = parse_database_type(pattern.config.database_type);
    return true;
}

std::string ResponseAnalyzer::extract_context(const std::string& response_body,
                                              size_t match_pos,
                                              size_t match_length,
                                              size_t context_size) const {
    size_t start = (match_pos > context_size) ? match_pos - context_size : 0;
    size_t end = std::min(response_body.length(), match_pos + match_length + context_size);

    std::string context = response_body.substr(start, end - start);

    // Replace newlines with spaces for readability
    std::replace(context.begin(), context.end(), '\n', ' ');
    std::replace(context.begin(), context.end(), '\r', ' ');

    return context;
}

bool ResponseAnalyzer::validate_context(const PatternMatch& match,
                                        const std::string& response_body) const {
    size_t match_pos = response_body.find(match.evidence);
    if (match_pos == std::string::npos) {
        return true;
    }

    // Error text inside an HTML comment is developer noise, not a live error
    size_t comment_start = response_body.rfind("<!--", match_pos);
    if (comment_start != std::string::npos) {
        size_t comment_close = response_body.find("-->", comment_start);
        if (comment_close == std::string::npos || comment_close > match_pos) {
            return false;
        }
    }

    // Client-side error handling code that merely mentions a driver
    size_t script_start = response_body.rfind("<script", match_pos);
    if (script_start != std::string::npos) {
        size_t script_close = response_body.find("</script>", script_start);
        if (script_close != std::string::npos && script_close > match_pos) {
            std::string script_lower = response_body.substr(script_start, script_close - script_start);
            std::transform(script_lower.begin(), script_lower.end(), script_lower.begin(), ::tolower);
            if (script_lower.find("catch") != std::string::npos) {
                return match.confidence > 0.9;
            }
        }
    }

    return true;
}

DatabaseType ResponseAnalyzer::parse_database_type(const std::string& db_type_str) {
    std::string lower = db_type_str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "mysql" || lower == "mariadb") {
        return DatabaseType::MYSQL;
    } else if (lower == "postgresql" || lower == "postgres") {
        return DatabaseType::POSTGRESQL;
    } else if (lower == "sql_server" || lower == "mssql" || lower == "sqlserver") {
        return DatabaseType::SQL_SERVER;
    } else if (lower == "oracle") {
        return DatabaseType::ORACLE;
    } else if (lower == "sqlite") {
        return DatabaseType::SQLITE;
    } else if (lower == "generic") {
        return DatabaseType::GENERIC;
    }

    return DatabaseType::UNKNOWN;
}

std::string ResponseAnalyzer::build_summary(const AnalysisResult& result) const {
    if (!result.has_sql_error) {
        return "No database error detected";
    }

    std::ostringstream summary;
    summary << "SQL error (" << database_type_name(result.detected_db_type) << ")"
            << " (" << result.matches.size() << " pattern(s) matched)";
    return summary.str();
}

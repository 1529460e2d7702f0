#pragma once
#include <string>
#include <vector>
#include <map>
#include <regex>
#include <memory>

// Response pattern analysis for database error signatures.
// Recognises the error text that MySQL/MariaDB, PostgreSQL, SQL Server, Oracle
// and SQLite drivers leak into pages, including errors wrapped in JSON bodies.

enum class DatabaseType {
    UNKNOWN,
    MYSQL,
    POSTGRESQL,
    SQL_SERVER,
    ORACLE,
    SQLITE,
    GENERIC
};

const char* database_type_name(DatabaseType t);

struct PatternMatch {
    std::string pattern_name;
    std::string evidence;           // Matched text snippet
    std::string context;            // Surrounding context
    DatabaseType db_type;
    double confidence;              // Confidence score (0.0-1.0)

    PatternMatch()
        : db_type(DatabaseType::UNKNOWN),
          confidence(0.0)
    {}
};

struct AnalysisResult {
    bool has_sql_error;
    DatabaseType detected_db_type;
    std::vector<PatternMatch> matches;  // All detected patterns
    std::string summary;                // Human-readable summary

    AnalysisResult()
        : has_sql_error(false),
          detected_db_type(DatabaseType::UNKNOWN)
    {}

    /**
     * @brief Highest confidence among the matches, 0 when nothing matched
     */
    double best_confidence() const;
};

// Pattern configuration, built in or loaded from YAML
struct PatternConfig {
    std::string name;
    std::string regex_pattern;
    std::string database_type;        // "mysql", "postgresql", "mssql", "oracle", "sqlite", "generic"
    double confidence;                // Default confidence for this pattern
    bool case_sensitive;
    std::string description;

    PatternConfig()
        : confidence(0.9),
          case_sensitive(false)
    {}
};

class ResponseAnalyzer {
public:
    /**
     * @brief Create a response analyzer with default patterns
     */
    ResponseAnalyzer();

    /**
     * @brief Create a response analyzer and load extra patterns from YAML
     * @param config_path Path to a patterns file
     */
    explicit ResponseAnalyzer(const std::string& config_path);

    /**
     * @brief Scan a response body for database error signatures
     * @param response_body HTTP response body content
     * @return Analysis result with detected patterns
     */
    AnalysisResult analyze(const std::string& response_body) const;

    /**
     * @brief Quick check used by callers that only need a yes/no
     */
    bool contains_sql_error(const std::string& response_body) const {
        return analyze(response_body).has_sql_error;
    }

    /**
     * @brief Load patterns from YAML configuration file
     * @param config_path Path to patterns file
     * @return true if loaded successfully, false otherwise
     */
    bool load_patterns(const std::string& config_path);

    /**
     * @brief Add a custom pattern
     * @param pattern Pattern configuration to add
     * @return false if the regex does not compile
     */
    bool add_pattern(const PatternConfig& pattern);

    /**
     * @brief Get all loaded patterns
     * @return Vector of pattern configurations
     */
    std::vector<PatternConfig> get_patterns() const;

private:
    struct CompiledPattern {
        PatternConfig config;
        std::regex regex;
    };

    std::vector<CompiledPattern> patterns_;

    /**
     * @brief Initialize default patterns (hardcoded)
     */
    void initialize_default_patterns();

    void add_default(const std::string& name, const std::string& regex,
                     const std::string& db_type, double confidence,
                     const std::string& description);

    /**
     * @brief Match a single pattern against response body
     * @return true if pattern matched
     */
    bool match_pattern(const CompiledPattern& pattern,
                       const std::string& response_body,
                       PatternMatch& match) const;

    /**
     * @brief Pull error strings out of a JSON body ({"error": "..."} and friends)
     * @return Concatenated error texts, empty if the body is not JSON
     */
    static std::string extract_json_errors(const std::string& response_body);

    /**
     * @brief Extract context around a match (surrounding text)
     */
    std::string extract_context(const std::string& response_body,
                                size_t match_pos,
                                size_t match_length,
                                size_t context_size = 100) const;

    /**
     * @brief Validate pattern context to reduce false positives
     * @param match Pattern match to validate
     * @param response_body Full response body
     * @return true if match is likely a true positive
     */
    bool validate_context(const PatternMatch& match,
                          const std::string& response_body) const;

    /**
     * @brief Convert database type string to enum
     */
    static DatabaseType parse_database_type(const std::string& db_type_str);

    std::string build_summary(const AnalysisResult& result) const;
};

#pragma once
#include <string>

namespace logging {

// Operator-facing diagnostics on stdout/stderr.
// Lines from concurrent plugin threads are serialized so they never interleave.
// The audit trail lives in ChainLogger; this is for humans watching a scan.

enum class Level {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    QUIET = 4
};

/**
 * @brief Set the minimum level that gets printed
 * @param level Messages below this level are dropped
 */
void set_level(Level level);

/**
 * @brief Parse "debug", "info", "warn", "error" or "quiet"
 * @param name Level name from configuration
 * @return Parsed level, INFO for unknown names
 */
Level parse_level(const std::string& name);

Level level();

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace logging

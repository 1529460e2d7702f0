/**
 * @file console.cpp
 * @brief Serialized console output with a level filter
 */

#include "console.h"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>

namespace logging {

static std::atomic<int> g_level{static_cast<int>(Level::INFO)};
static std::mutex g_out_mutex;

static void emit(Level lvl, const char* tag, const std::string& msg) {
    if (static_cast<int>(lvl) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_out_mutex);
    // Progress goes to stdout, problems to stderr
    std::ostream& os = (lvl >= Level::WARN) ? std::cerr : std::cout;
    os << tag << msg << "\n";
}

void set_level(Level level) {
    g_level.store(static_cast<int>(level));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

Level parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    if (lower == "quiet" || lower == "off") return Level::QUIET;
    return Level::INFO;
}

void debug(const std::string& msg) { emit(Level::DEBUG, "[debug] ", msg); }
void info(const std::string& msg) { emit(Level::INFO, "", msg); }
void warn(const std::string& msg) { emit(Level::WARN, "Warning: ", msg); }
void error(const std::string& msg) { emit(Level::ERROR, "Error: ", msg); }

} // namespace logging

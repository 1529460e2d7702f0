#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Append-only audit log with hash chaining for tamper detection.
// Each entry carries the hash of the previous one, so editing or deleting an
// entry breaks the chain. One logger per scan; plugin threads share it.

struct LogEntry {
    std::string event_type;
    std::string scan_id;
    std::string run_id;
    nlohmann::json payload;
    std::string prev_hash;
    std::string entry_hash;
    std::string timestamp;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

struct ChainVerification {
    bool ok = true;
    size_t entries = 0;
    long broken_at = -1;        // index of the first bad entry, -1 if intact
    std::string reason;
};

class ChainLogger {
public:
    /**
     * @brief Create a logger that writes to a JSONL file
     * @param log_path Path to the log file (appended to if it exists)
     * @param run_id Unique ID for this scan run
     */
    ChainLogger(const std::string& log_path, const std::string& run_id);

    /**
     * @brief Add a new entry to the log with automatic hash chaining
     * @param event_type What happened (e.g., "finding_recorded", "scan_start")
     * @param payload JSON data for this event
     * @return true if written successfully
     */
    bool append(const std::string& event_type, const nlohmann::json& payload);

    void set_scan_id(const std::string& scan_id);

    /**
     * @brief Get the hash of the most recent entry
     * @return Hash string, or empty if no entries yet
     */
    std::string last_hash() const;

    const std::string& path() const { return log_path_; }

    /**
     * @brief Verify that a log file's hash chain is intact
     * @param log_path Path to the log file to check
     * @return Verdict with the first broken entry, if any
     */
    static ChainVerification check(const std::string& log_path);

    /// Shorthand for check(log_path).ok
    static bool verify(const std::string& log_path) { return check(log_path).ok; }

    /**
     * @brief Read all entries from a log file
     * @param log_path Path to the log file
     * @return Entries in file order; unparsable lines are skipped
     */
    static std::vector<LogEntry> load(const std::string& log_path);

private:
    std::string log_path_;
    std::string run_id_;
    std::string scan_id_;
    std::string last_hash_;
    std::ofstream log_stream_;
    mutable std::mutex mutex_;

    /**
     * @brief Compute SHA-256 hash of a log entry's canonical form
     * @param entry The entry to hash
     * @return "sha256:" + hex digest
     */
    static std::string compute_hash(const LogEntry& entry);

    static std::string get_timestamp();

    /**
     * @brief Convert JSON to a canonical string format for consistent hashing
     * @param j JSON object to canonicalize
     * @return Canonical string representation
     */
    static std::string canonicalize_json(const nlohmann::json& j);
};

} // namespace logging

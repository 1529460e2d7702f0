/**
 * @file chain.cpp
 * @brief Implementation of tamper-evident hash-chained JSONL logger
 */

#include "chain.h"
#include "console.h"
#include <openssl/sha.h>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace logging {

using json = nlohmann::json;

namespace {
const char* kGenesis = "sha256:genesis";
}

// Convert LogEntry to JSON
json LogEntry::to_json() const {
    json j;
    j["event_type"] = event_type;
    j["run_id"] = run_id;
    j["timestamp"] = timestamp;
    j["prev_hash"] = prev_hash;
    j["entry_hash"] = entry_hash;
    j["payload"] = payload;
    if (!scan_id.empty()) {
        j["scan_id"] = scan_id;
    }
    return j;
}

// Parse LogEntry from JSON
LogEntry LogEntry::from_json(const json& j) {
    LogEntry entry;
    entry.event_type = j.value("event_type", "");
    entry.run_id = j.value("run_id", "");
    entry.scan_id = j.value("scan_id", "");
    entry.timestamp = j.value("timestamp", "");
    entry.prev_hash = j.value("prev_hash", "");
    entry.entry_hash = j.value("entry_hash", "");
    entry.payload = j.value("payload", json::object());
    return entry;
}

ChainLogger::ChainLogger(const std::string& log_path, const std::string& run_id)
    : log_path_(log_path), run_id_(run_id) {

    // Continue an existing chain
    if (std::ifstream test(log_path); test.good()) {
        auto entries = load(log_path);
        if (!entries.empty()) {
            last_hash_ = entries.back().entry_hash;
        }
    }

    log_stream_.open(log_path_, std::ios::app);
    if (!log_stream_.is_open()) {
        logging::warn("audit log " + log_path_ + " cannot be opened for writing");
    }
}

void ChainLogger::set_scan_id(const std::string& scan_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    scan_id_ = scan_id;
}

std::string ChainLogger::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_hash_;
}

// Get current ISO8601 timestamp
std::string ChainLogger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

// Sorted keys (nlohmann objects are ordered maps), no whitespace. Response
// snippets may hold invalid UTF-8, which is replaced rather than thrown on.
std::string ChainLogger::canonicalize_json(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string ChainLogger::compute_hash(const LogEntry& entry) {
    // prev_hash + timestamp + event_type + run_id + scan_id + payload
    std::ostringstream canonical;
    canonical << entry.prev_hash;
    canonical << entry.timestamp;
    canonical << entry.event_type;
    canonical << entry.run_id;
    canonical << entry.scan_id;
    canonical << canonicalize_json(entry.payload);

    std::string data = canonical.str();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()),
           data.size(), hash);

    std::ostringstream hex;
    hex << "sha256:";
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(hash[i]);
    }
    return hex.str();
}

bool ChainLogger::append(const std::string& event_type, const json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_stream_.is_open()) {
        return false;
    }

    LogEntry entry;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.scan_id = scan_id_;
    entry.timestamp = get_timestamp();
    entry.prev_hash = last_hash_.empty() ? kGenesis : last_hash_;
    entry.payload = payload;
    entry.entry_hash = compute_hash(entry);

    log_stream_ << canonicalize_json(entry.to_json()) << "\n";
    log_stream_.flush();
    if (!log_stream_.good()) {
        return false;
    }

    last_hash_ = entry.entry_hash;
    return true;
}

std::vector<LogEntry> ChainLogger::load(const std::string& log_path) {
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    if (!in.is_open()) {
        return entries;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            logging::warn("audit log " + log_path + ": line " + std::to_string(line_no) + " is not JSON");
            continue;
        }
        entries.push_back(LogEntry::from_json(j));
    }
    return entries;
}

ChainVerification ChainLogger::check(const std::string& log_path) {
    ChainVerification result;

    std::ifstream in(log_path);
    if (!in.is_open()) {
        result.ok = false;
        result.reason = "cannot open " + log_path;
        return result;
    }

    // Parse here rather than through load(): a line that is not JSON is a break
    std::vector<LogEntry> entries;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            result.ok = false;
            result.broken_at = static_cast<long>(entries.size());
            result.reason = "entry is not valid JSON";
            return result;
        }
        entries.push_back(LogEntry::from_json(j));
    }
    result.entries = entries.size();

    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        std::string expected_prev = i == 0 ? kGenesis : entries[i - 1].entry_hash;

        if (entry.prev_hash != expected_prev) {
            result.ok = false;
            result.broken_at = static_cast<long>(i);
            result.reason = i == 0 ? "first entry does not start from genesis"
                                   : "prev_hash does not match the previous entry";
            return result;
        }

        if (compute_hash(entry) != entry.entry_hash) {
            result.ok = false;
            result.broken_at = static_cast<long>(i);
            result.reason = "entry_hash mismatch (" + entry.event_type + " at " + entry.timestamp + ")";
            return result;
        }
    }
    return result;
}

} // namespace logging

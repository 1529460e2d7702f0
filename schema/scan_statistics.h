#pragma once
#include <map>
#include <string>

/**
 * @file scan_statistics.h
 * @brief Pollable snapshot of a running or finished scan
 */

enum class ScanStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

inline const char* scan_status_name(ScanStatus s) {
    switch (s) {
        case ScanStatus::PENDING: return "pending";
        case ScanStatus::RUNNING: return "running";
        case ScanStatus::COMPLETED: return "completed";
        case ScanStatus::FAILED: return "failed";
        case ScanStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline bool is_terminal(ScanStatus s) {
    return s == ScanStatus::COMPLETED || s == ScanStatus::FAILED || s == ScanStatus::CANCELLED;
}

struct ScanStatistics {
    ScanStatus status = ScanStatus::PENDING;
    std::string current_phase;       // "crawling", "scanning", "done"
    std::string current_url;
    long urls_crawled = 0;
    long forms_tested = 0;
    long requests_sent = 0;
    long vulnerabilities_found = 0;
    double elapsed_seconds = 0.0;
    bool timed_out = false;
    std::map<std::string, long> plugins_executed;
};

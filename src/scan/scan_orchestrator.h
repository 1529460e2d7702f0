#pragma once
#include "finding_aggregator.h"
#include "target_validator.h"
#include "core/cancel_token.h"
#include "core/request_budget.h"
#include "core/http_client.h"
#include "logging/chain.h"
#include "plugins/scanner_plugin.h"
#include <schema/crawl_result.h>
#include <schema/scan_options.h>
#include <schema/scan_statistics.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// Drives one scan from seed URL to findings.
// start() validates the target and returns; the scan then runs on its own
// thread: crawl (optional), fan the crawl surface out across the selected
// plugins (plugins in parallel, each with a pool of workers), aggregate
// findings. Statistics and findings can be polled at any time. The overall
// deadline cancels in-flight work and keeps what was found so far.

class ScanOrchestrator {
public:
    /**
     * @brief Create an orchestrator for one scan
     * @param transport Transport for every request of the scan (outlives it)
     * @param opts Scan options, read-only once started
     */
    ScanOrchestrator(const HttpTransport& transport, const ScanOptions& opts = ScanOptions());

    /// Cancels a running scan and waits for it.
    ~ScanOrchestrator();

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /**
     * @brief Begin a scan without blocking
     * @param target Seed URL
     * @param scan_types Plugin names; unknown names are logged and skipped,
     *        an empty list selects every plugin
     * @throws std::invalid_argument for a malformed or refused target, or
     *         when no usable scan type is left
     * @throws std::logic_error if this orchestrator already started a scan
     */
    void start(const std::string& target, const std::vector<std::string>& scan_types);

    /// Block until the scan reaches a terminal state.
    void wait();

    /// Request cancellation; findings so far are kept.
    void cancel();

    ScanStatus status() const;

    /// Pollable snapshot; safe from any thread.
    ScanStatistics statistics() const;

    /// Findings recorded so far (all of them once the scan is terminal).
    std::vector<Finding> findings() const;

    /// Failure message when status() is FAILED.
    std::string error() const;

    const std::string& scan_id() const { return scan_id_; }

    /**
     * @brief Record scan events to a hash-chained audit log
     * @param logger Shared logger; must be set before start()
     */
    void set_audit_log(std::shared_ptr<logging::ChainLogger> logger);

    /**
     * @brief Replace the address check (tests inject a resolver)
     */
    void set_target_validator(const TargetValidator& validator);

    /// Plugin names usable as scan types.
    static std::vector<std::string> available_plugins();

private:
    struct PluginRun {
        std::string name;
        std::unique_ptr<ScannerPlugin> plugin;
    };

    const HttpTransport& transport_;
    ScanOptions opts_;
    TargetValidator validator_;
    std::shared_ptr<CancelToken> cancel_;
    std::shared_ptr<RequestBudget> budget_;
    std::shared_ptr<logging::ChainLogger> audit_;
    FindingAggregator aggregator_;
    std::string scan_id_;
    std::string target_;
    std::vector<std::string> types_;

    std::thread runner_;
    std::thread watchdog_;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point finished_at_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ScanStatistics stats_;
    std::string error_;
    std::set<std::string> forms_seen_;
    bool started_;
    bool finished_;
    bool user_cancelled_;

    mutable std::mutex plugins_mutex_;
    std::vector<PluginRun> plugins_;
    std::atomic<long> crawl_requests_;
    std::atomic<bool> timed_out_;

    void run();
    void watch_deadline();

    std::vector<CrawlResult> discover();
    std::vector<PluginRun> prepare_plugins();
    void run_plugin(ScannerPlugin& plugin, const std::vector<CrawlResult>& surface);

    void set_phase(const std::string& phase);
    void set_current_url(const std::string& u);
    void finish(ScanStatus status, const std::string& error);

    void audit(const std::string& event, const nlohmann::json& payload);
};

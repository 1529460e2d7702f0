#pragma once
#include "core/http_client.h"
#include "core/request_executor.h"
#include "core/cancel_token.h"
#include "core/request_budget.h"
#include "detection/injection_point.h"
#include "payloads/payload_catalog.h"
#include <schema/crawl_result.h>
#include <schema/finding.h>
#include <schema/scan_options.h>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Scanner plugin contract.
// One instance per vulnerability class per scan. setup() allocates the
// plugin's own request executor and session, scan() may be called from
// several worker threads at once, cleanup() releases everything and may be
// called any number of times.

class ScannerPlugin {
public:
    virtual ~ScannerPlugin() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    /**
     * @brief Allocate per-scan state; calling it again re-initialises
     * @param opts Scan options (read-only for the rest of the scan)
     * @param transport Transport shared by the scan
     * @param cancel Scan-wide cancellation token
     * @param budget Scan-wide request budget; null gives the plugin a budget
     *        of its own sized by opts.max_requests
     * @throws std::runtime_error if the plugin cannot be used for this scan
     */
    virtual void setup(const ScanOptions& opts,
                       const HttpTransport& transport,
                       std::shared_ptr<CancelToken> cancel,
                       std::shared_ptr<RequestBudget> budget) = 0;

    /**
     * @brief Test one piece of crawl surface
     * @param target Query URL, form or page from the crawler
     * @return Findings that cleared the confidence threshold; a failing
     *         probe is logged and skipped, never thrown
     */
    virtual std::vector<Finding> scan(const CrawlResult& target) = 0;

    virtual void cleanup() = 0;

    virtual bool ready() const = 0;

    /// Requests sent since setup, kept after cleanup.
    virtual long requests_sent() const = 0;
};

// Base for plugins that inject payloads into parameters.
// Owns the request executor, expands targets into injection points and
// applies the per-strategy confidence thresholds.
class InjectionPlugin : public ScannerPlugin {
public:
    InjectionPlugin();
    ~InjectionPlugin() override;

    void setup(const ScanOptions& opts,
               const HttpTransport& transport,
               std::shared_ptr<CancelToken> cancel,
               std::shared_ptr<RequestBudget> budget) override;

    std::vector<Finding> scan(const CrawlResult& target) override;

    /**
     * @brief Scan a bare URL, probing its query parameters
     */
    std::vector<Finding> scan_url(const std::string& target_url);

    void cleanup() override;

    bool ready() const override { return executor_ != nullptr; }

    long requests_sent() const override { return requests_sent_.load(); }

protected:
    /**
     * @brief Test one parameter with every strategy the plugin owns
     */
    virtual std::vector<Finding> scan_point(const InjectionPoint& point) = 0;

    /// Called at the end of setup(), after the executor exists.
    virtual void on_setup() {}

    virtual bool include_path_segments() const { return false; }

    RequestExecutor& executor() { return *executor_; }
    const ScanOptions& options() const { return opts_; }
    bool cancelled() const;

    /**
     * @brief Send a probe for the injection point
     *
     * With waf_bypass on, a probe the target answers with 403 or 406 is sent
     * again with the alternate encodings before giving up.
     */
    SendResult send_probe(const InjectionPoint& point, const std::string& value);

    /**
     * @brief Confidence floor for a strategy: union and stored XSS use their
     *        own, stricter thresholds
     */
    double threshold_for(Strategy s) const;

    bool passes_threshold(Strategy s, double confidence) const {
        return confidence >= threshold_for(s);
    }

private:
    ScanOptions opts_;
    std::unique_ptr<RequestExecutor> executor_;
    std::atomic<long> requests_sent_;
};

/**
 * @brief Value sent for a payload: quote and operator fragments are
 *        appended to the original value, complete values replace it
 */
std::string compose_value(const std::string& original, const std::string& payload);

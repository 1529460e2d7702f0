#pragma once
#include "http_client.h"
#include "session_manager.h"
#include "cancel_token.h"
#include "request_budget.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Rate-limited, retrying request layer.
// Every request a scan makes goes through one of these. It spaces requests
// out, caps how many are in flight, retries transient failures with
// exponential backoff, retunes its request rate from observed latency, keeps
// the session cookies and re-logs in when the target redirects to its login
// page.

struct RetryPolicy {
    int max_attempts;        // total attempts including the first
    long base_delay_ms;
    long max_delay_ms;

    RetryPolicy()
        : max_attempts(3),
          base_delay_ms(1000),
          max_delay_ms(10000)
    {}

    /**
     * @brief Backoff before the next attempt
     * @param attempt Number of attempts already made (1-based)
     * @return base * 2^(attempt-1), capped at max_delay_ms
     */
    long delay_for(int attempt) const;
};

enum class SendStatus {
    OK,
    TIMEOUT,
    NETWORK_ERROR,
    CANCELLED
};

const char* send_status_name(SendStatus s);

// Outcome of one logical send. Anything other than OK is inconclusive: the
// probe could not be evaluated, which is not the same as "not vulnerable".
struct SendResult {
    SendStatus status = SendStatus::NETWORK_ERROR;
    HttpRequest request;        // what was actually sent (cookies and headers merged)
    HttpResponse response;
    std::string error;
    int attempts = 0;
    double elapsed_ms = 0.0;
    bool reauthenticated = false;

    bool ok() const { return status == SendStatus::OK; }
};

class RequestExecutor {
public:
    struct Options {
        long request_delay_ms;       // minimum spacing between requests
        int max_concurrent;          // in-flight cap
        long max_requests;           // 0 = unlimited; ignored when a shared budget is given
        bool adaptive;
        long cooldown_threshold;     // requests between cooldowns
        long cooldown_ms;
        double initial_rps;
        double min_rps;
        double max_rps;
        double fast_latency_ms;      // below this average the rate goes up
        double slow_latency_ms;      // above this average the rate goes down
        RetryPolicy retry;
        std::map<std::string, std::string> default_headers;

        Options()
            : request_delay_ms(1000),
              max_concurrent(5),
              max_requests(0),
              adaptive(true),
              cooldown_threshold(50),
              cooldown_ms(2000),
              initial_rps(10.0),
              min_rps(1.0),
              max_rps(20.0),
              fast_latency_ms(100.0),
              slow_latency_ms(1000.0)
        {}
    };

    using RequestObserver = std::function<void(const HttpRequest&)>;

    /**
     * @brief Create an executor bound to one transport
     * @param transport Transport used for every request
     * @param opts Rate-limit, concurrency and retry settings
     * @param cancel Scan-wide cancellation token (created if null)
     * @param budget Scan-wide request budget (one of max_requests is
     *        created if null)
     */
    RequestExecutor(const HttpTransport& transport,
                    const Options& opts = Options(),
                    std::shared_ptr<CancelToken> cancel = nullptr,
                    std::shared_ptr<RequestBudget> budget = nullptr);

    /**
     * @brief Send a request under rate limiting and retry
     * @param req Request to send; session cookies are added unless the
     *            request sets a cookie with the same name
     * @param timeout_override_ms Per-request timeout, 0 for transport default
     * @return Tagged result; only OK carries a usable response
     */
    SendResult send(const HttpRequest& req, long timeout_override_ms = 0);

    SessionManager& session() { return session_; }

    /**
     * @brief Called once per transport attempt, from the sending thread
     */
    void set_request_observer(RequestObserver observer);

    void cancel() { cancel_->cancel(); }
    bool cancelled() const { return cancel_->cancelled(); }
    std::shared_ptr<CancelToken> cancel_token() const { return cancel_; }
    std::shared_ptr<RequestBudget> budget() const { return budget_; }

    long requests_sent() const { return requests_sent_.load(); }
    double current_rps() const;
    const Options& options() const { return opts_; }

private:
    const HttpTransport& transport_;
    Options opts_;
    std::shared_ptr<CancelToken> cancel_;
    std::shared_ptr<RequestBudget> budget_;
    SessionManager session_;
    RequestObserver observer_;

    // Rate limiter state
    mutable std::mutex rate_mutex_;
    std::chrono::steady_clock::time_point next_slot_;
    std::chrono::steady_clock::time_point paused_until_;
    double rps_;
    long window_count_;
    double window_latency_ms_;

    // Concurrency cap
    std::mutex slot_mutex_;
    std::condition_variable slot_cv_;
    int in_flight_;

    std::atomic<long> requests_sent_;

    bool acquire_slot();
    void release_slot();

    /**
     * @brief Wait until the next request may start
     * @return false if cancelled while waiting
     */
    bool throttle();

    /**
     * @brief Feed one latency sample; every cooldown_threshold samples the
     *        executor pauses and retunes its rate
     */
    void record_latency(double latency_ms);

    /**
     * @brief One transport attempt with session state applied
     */
    bool attempt(HttpRequest& req, HttpResponse& resp, double& elapsed_ms);

    /**
     * @brief Paced, budgeted and retried send for the session's login
     *        requests; never re-authenticates
     */
    bool send_for_session(HttpRequest& req, HttpResponse& resp);
};

/**
 * @file request_executor.cpp
 * @brief Rate limiting, retry and session handling around HttpTransport
 */

#include "request_executor.h"
#include "logging/console.h"
#include <algorithm>

using Clock = std::chrono::steady_clock;

long RetryPolicy::delay_for(int attempt) const {
    long delay = base_delay_ms;
    for (int i = 1; i < attempt && delay < max_delay_ms; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_ms);
}

const char* send_status_name(SendStatus s) {
    switch (s) {
        case SendStatus::OK: return "ok";
        case SendStatus::TIMEOUT: return "timeout";
        case SendStatus::NETWORK_ERROR: return "network_error";
        case SendStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

RequestExecutor::RequestExecutor(const HttpTransport& transport,
                                 const Options& opts,
                                 std::shared_ptr<CancelToken> cancel,
                                 std::shared_ptr<RequestBudget> budget)
    : transport_(transport),
      opts_(opts),
      cancel_(cancel ? std::move(cancel) : std::make_shared<CancelToken>()),
      budget_(budget ? std::move(budget) : std::make_shared<RequestBudget>(opts.max_requests)),
      session_(transport),
      next_slot_(Clock::now()),
      paused_until_(Clock::now()),
      rps_(opts.initial_rps),
      window_count_(0),
      window_latency_ms_(0.0),
      in_flight_(0),
      requests_sent_(0)
{
    if (opts_.max_concurrent < 1) opts_.max_concurrent = 1;
    if (opts_.retry.max_attempts < 1) opts_.retry.max_attempts = 1;
    rps_ = std::clamp(rps_, opts_.min_rps, opts_.max_rps);
    session_.set_sender([this](HttpRequest& req, HttpResponse& resp) { return send_for_session(req, resp); });
}

void RequestExecutor::set_request_observer(RequestObserver observer) {
    observer_ = std::move(observer);
}

double RequestExecutor::current_rps() const {
    std::lock_guard<std::mutex> lock(rate_mutex_);
    return rps_;
}

bool RequestExecutor::acquire_slot() {
    std::unique_lock<std::mutex> lock(slot_mutex_);
    while (in_flight_ >= opts_.max_concurrent) {
        if (cancel_->cancelled()) return false;
        slot_cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (cancel_->cancelled()) return false;
    ++in_flight_;
    return true;
}

void RequestExecutor::release_slot() {
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        --in_flight_;
    }
    slot_cv_.notify_one();
}

bool RequestExecutor::throttle() {
    Clock::time_point start_at;
    {
        std::lock_guard<std::mutex> lock(rate_mutex_);
        double interval_ms = std::max(static_cast<double>(opts_.request_delay_ms),
                                      opts_.adaptive ? 1000.0 / rps_ : 0.0);
        auto interval = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double, std::milli>(interval_ms));

        // Reserve the next slot so concurrent callers queue up behind each other
        start_at = std::max({Clock::now(), next_slot_, paused_until_});
        next_slot_ = start_at + interval;
    }
    auto wait = start_at - Clock::now();
    if (wait > Clock::duration::zero()) {
        return cancel_->sleep_for(wait);
    }
    return !cancel_->cancelled();
}

void RequestExecutor::record_latency(double latency_ms) {
    if (!opts_.adaptive || opts_.cooldown_threshold <= 0) return;

    std::lock_guard<std::mutex> lock(rate_mutex_);
    ++window_count_;
    window_latency_ms_ += latency_ms;
    if (window_count_ < opts_.cooldown_threshold) return;

    double average = window_latency_ms_ / static_cast<double>(window_count_);
    double before = rps_;
    if (average < opts_.fast_latency_ms) {
        rps_ = std::min(opts_.max_rps, rps_ * 1.2);
    } else if (average > opts_.slow_latency_ms) {
        rps_ = std::max(opts_.min_rps, rps_ * 0.8);
    }
    window_count_ = 0;
    window_latency_ms_ = 0.0;

    // Everyone waits out the cooldown, not just the thread that hit it
    paused_until_ = std::max(paused_until_, Clock::now() + std::chrono::milliseconds(opts_.cooldown_ms));

    logging::debug("rate limiter cooldown: avg latency " + std::to_string(average) +
                   "ms, rps " + std::to_string(before) + " -> " + std::to_string(rps_));
}

bool RequestExecutor::attempt(HttpRequest& req, HttpResponse& resp, double& elapsed_ms) {
    // Session cookies first, explicit request cookies win
    std::map<std::string, std::string> cookies = session_.cookies();
    for (const auto& [name, value] : req.cookies) {
        cookies[name] = value;
    }
    req.cookies = std::move(cookies);
    for (const auto& [name, value] : opts_.default_headers) {
        req.headers.emplace(name, value);
    }

    if (observer_) observer_(req);
    requests_sent_.fetch_add(1);

    resp = HttpResponse();
    auto started = Clock::now();
    bool ok = transport_.perform(req, resp);
    double wall_ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();

    // Prefer the transport's own measurement when it has one
    elapsed_ms = resp.total_time > 0.0 ? resp.total_time * 1000.0 : wall_ms;
    record_latency(elapsed_ms);
    return ok;
}

SendResult RequestExecutor::send(const HttpRequest& original, long timeout_override_ms) {
    SendResult result;
    result.request = original;
    if (timeout_override_ms > 0) {
        result.request.timeout_ms = timeout_override_ms;
    }

    if (cancel_->cancelled()) {
        result.status = SendStatus::CANCELLED;
        result.error = "scan cancelled";
        return result;
    }
    if (budget_->exhausted()) {
        result.status = SendStatus::CANCELLED;
        result.error = "request budget exhausted";
        return result;
    }

    if (!acquire_slot()) {
        result.status = SendStatus::CANCELLED;
        result.error = "scan cancelled";
        return result;
    }
    struct SlotRelease {
        RequestExecutor* self;
        ~SlotRelease() { self->release_slot(); }
    } slot_release{this};

    for (int n = 1; n <= opts_.retry.max_attempts; ++n) {
        if (!throttle()) {
            result.status = SendStatus::CANCELLED;
            result.error = "scan cancelled";
            break;
        }
        if (!budget_->take()) {
            result.status = SendStatus::CANCELLED;
            result.error = "request budget exhausted";
            break;
        }

        HttpRequest req = result.request;
        HttpResponse resp;
        double elapsed_ms = 0.0;
        result.attempts = n;
        bool ok = attempt(req, resp, elapsed_ms);

        if (ok) {
            session_.update_from_response(resp);
            result.status = SendStatus::OK;
            result.request = std::move(req);
            result.response = std::move(resp);
            result.elapsed_ms = elapsed_ms;
            result.error.clear();
            break;
        }

        result.status = resp.timed_out ? SendStatus::TIMEOUT : SendStatus::NETWORK_ERROR;
        result.error = resp.error;
        result.elapsed_ms = elapsed_ms;
        logging::debug(std::string("request ") + send_status_name(result.status) + " (attempt " +
                       std::to_string(n) + "/" + std::to_string(opts_.retry.max_attempts) + "): " +
                       original.url + " " + resp.error);

        if (n < opts_.retry.max_attempts) {
            if (!cancel_->sleep_for(std::chrono::milliseconds(opts_.retry.delay_for(n)))) {
                result.status = SendStatus::CANCELLED;
                result.error = "scan cancelled";
                break;
            }
        }
    }

    // Bounced to the login page: log in again and replay the request once
    if (result.ok() && SessionManager::is_login_redirect(result.response) && session_.has_credentials()) {
        logging::info("session expired, re-authenticating before retrying " + original.url);
        if (session_.authenticate() && throttle() && budget_->take()) {
            HttpRequest req = original;
            if (timeout_override_ms > 0) req.timeout_ms = timeout_override_ms;
            HttpResponse resp;
            double elapsed_ms = 0.0;
            if (attempt(req, resp, elapsed_ms)) {
                session_.update_from_response(resp);
                result.request = std::move(req);
                result.response = std::move(resp);
                result.elapsed_ms = elapsed_ms;
                result.reauthenticated = true;
            }
        } else {
            logging::warn("re-authentication failed; keeping redirect response for " + original.url);
        }
    }

    return result;
}

bool RequestExecutor::send_for_session(HttpRequest& req, HttpResponse& resp) {
    for (int n = 1; n <= opts_.retry.max_attempts; ++n) {
        if (!throttle()) {
            resp.error = "scan cancelled";
            return false;
        }
        if (!budget_->take()) {
            resp.error = "request budget exhausted";
            return false;
        }

        HttpRequest sent = req;
        double elapsed_ms = 0.0;
        if (attempt(sent, resp, elapsed_ms)) {
            req = std::move(sent);
            return true;
        }
        if (n < opts_.retry.max_attempts &&
            !cancel_->sleep_for(std::chrono::milliseconds(opts_.retry.delay_for(n)))) {
            return false;
        }
    }
    return false;
}

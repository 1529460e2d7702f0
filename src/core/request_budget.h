#pragma once
#include <atomic>

// Scan-wide cap on requests sent.
// One budget is shared by every executor of a scan (crawler and plugins), so
// max_requests bounds the scan as a whole. Each transport attempt, retries
// and login requests included, takes one unit.

class RequestBudget {
public:
    /**
     * @param limit Maximum number of requests, 0 for unlimited
     */
    explicit RequestBudget(long limit = 0) : limit_(limit), used_(0) {}

    /**
     * @brief Reserve one request
     * @return false once the limit has been reached
     */
    bool take() {
        if (limit_ <= 0) {
            used_.fetch_add(1);
            return true;
        }
        long current = used_.load();
        while (current < limit_) {
            if (used_.compare_exchange_weak(current, current + 1)) {
                return true;
            }
        }
        return false;
    }

    bool exhausted() const { return limit_ > 0 && used_.load() >= limit_; }

    long used() const { return used_.load(); }
    long limit() const { return limit_; }

private:
    const long limit_;
    std::atomic<long> used_;
};

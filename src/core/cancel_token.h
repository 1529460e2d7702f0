#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared cancellation flag for one scan.
// Every blocking wait in the scan (rate-limit delays, retry backoff, the
// orchestrator's deadline) sleeps on this token so that cancel() wakes it.

class CancelToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     * @param d Duration to wait
     * @return true if the full duration elapsed, false if cancelled
     */
    template <typename Rep, typename Period>
    bool sleep_for(const std::chrono::duration<Rep, Period>& d) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, d, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};

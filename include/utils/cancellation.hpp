#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace binbot {

/**
 * Cooperative cancellation flag with an interruptible wait.
 * Poll loops call wait_for() between iterations so cancel() wakes them
 * immediately instead of after the full interval.
 */
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

    bool is_cancelled() const { return cancelled_.load(); }

    // Returns true if cancelled before the interval elapsed
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> interval) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, interval, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace binbot

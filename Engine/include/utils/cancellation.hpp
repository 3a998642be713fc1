#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace Instasave {

/**
 * @brief Run-level cancellation flag with an optional deadline.
 *
 * Sleeps taken through wait_for() wake early when the run is cancelled,
 * so backoff and page pacing never outlive a stop request.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    void set_deadline(Clock::time_point deadline) {
        std::lock_guard<std::mutex> lock(mutex_);
        deadline_ = deadline;
    }

    bool is_cancelled() const {
        if (cancelled_.load()) return true;
        std::lock_guard<std::mutex> lock(mutex_);
        return deadline_ && Clock::now() >= *deadline_;
    }

    /**
     * @brief Sleep for up to `duration`.
     * @return false if the sleep was cut short by cancellation or the deadline
     */
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto until = Clock::now() + std::chrono::duration_cast<Clock::duration>(duration);
        if (deadline_ && *deadline_ < until) {
            cv_.wait_until(lock, *deadline_, [this] { return cancelled_.load(); });
            return false;
        }
        return !cv_.wait_until(lock, until, [this] { return cancelled_.load(); });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace Instasave

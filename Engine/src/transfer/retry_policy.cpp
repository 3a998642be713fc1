/**
 * @file retry_policy.cpp
 * @brief Exponential backoff with jitter and a throttle floor
 */

#include <transfer/retry_policy.hpp>
#include <algorithm>
#include <random>

namespace Instasave {

const char* to_string(FailureCause cause) {
    switch (cause) {
        case FailureCause::Timeout:        return "timeout";
        case FailureCause::Network:        return "network error";
        case FailureCause::ServerError:    return "server error";
        case FailureCause::Throttled:      return "throttled (429)";
        case FailureCause::LengthMismatch: return "length mismatch";
        case FailureCause::ClientError:    return "client error";
        case FailureCause::Io:             return "local I/O error";
        case FailureCause::Cancelled:      return "cancelled";
    }
    return "unknown";
}

bool is_transient(FailureCause cause) {
    switch (cause) {
        case FailureCause::Timeout:
        case FailureCause::Network:
        case FailureCause::ServerError:
        case FailureCause::Throttled:
        case FailureCause::LengthMismatch:
            return true;
        case FailureCause::ClientError:
        case FailureCause::Io:
        case FailureCause::Cancelled:
            return false;
    }
    return false;
}

std::optional<std::chrono::milliseconds> RetryPolicy::delay_for(int attempt, FailureCause cause, double jitter) const {
    if (!is_transient(cause) || attempt >= settings_.max_attempts) {
        return std::nullopt;
    }

    using std::chrono::milliseconds;

    // base * 2^(attempt-1), capped before the shift can overflow
    int64_t base = settings_.base_backoff.count();
    int64_t cap = settings_.max_backoff.count();
    int64_t exp = base;
    for (int i = 1; i < attempt && exp < cap; ++i) exp *= 2;
    exp = std::min(exp, cap);

    jitter = std::clamp(jitter, 0.0, 1.0);
    int64_t delay = std::min(cap, exp + static_cast<int64_t>(jitter * static_cast<double>(exp) / 2.0));

    if (cause == FailureCause::Throttled || cause == FailureCause::ServerError) {
        delay = std::max(delay, settings_.throttle_floor.count());
    }
    return milliseconds(delay);
}

std::optional<std::chrono::milliseconds> RetryPolicy::next_delay(int attempt, FailureCause cause) const {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return delay_for(attempt, cause, dist(rng));
}

} // namespace Instasave

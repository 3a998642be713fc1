#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace Instasave {

/**
 * @brief High-resolution timer for run and transfer durations.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief Format epoch seconds with a strftime pattern in UTC.
 */
inline std::string format_utc(int64_t epoch_seconds, const char* pattern) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), pattern, &tm);
    return std::string(buf, n);
}

/**
 * @brief Calendar date bucket (YYYY-MM-DD, UTC) for a capture timestamp.
 */
inline std::string utc_date_bucket(int64_t epoch_seconds) {
    return format_utc(epoch_seconds, "%Y-%m-%d");
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::string utc_iso8601_now() {
    return format_utc(epoch_now(), "%Y-%m-%dT%H:%M:%SZ");
}

} // namespace Instasave

/**
 * @file retry_policy.hpp
 * @brief Backoff decisions for failed transfer attempts
 */

#pragma once

#include <config/pipeline_config.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace Instasave {

enum class FailureCause {
    Timeout,          // connect or stall timeout
    Network,          // reset, refused, DNS, short read
    ServerError,      // HTTP 5xx
    Throttled,        // HTTP 429
    LengthMismatch,   // body shorter/longer than declared
    ClientError,      // other HTTP 4xx, never retried
    Io,               // local filesystem failure, never retried
    Cancelled         // run stopped before the next attempt
};

const char* to_string(FailureCause cause);

/**
 * @brief True for causes that a later attempt can plausibly fix.
 */
bool is_transient(FailureCause cause);

/**
 * @brief Pure policy: (attempt, cause) -> sleep duration or give up.
 *
 * Attempts are numbered from 1. After attempt `max_attempts` fails the
 * policy always gives up, so a source that always fails is tried exactly
 * max_attempts times.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(RetrySettings settings) : settings_(settings) {}

    /**
     * @brief Deterministic core.
     * @param attempt The attempt that just failed (1-based)
     * @param jitter Uniform sample in [0, 1) scaling the random part of the delay
     * @return Sleep before the next attempt, or nullopt to give up
     */
    std::optional<std::chrono::milliseconds> delay_for(int attempt, FailureCause cause, double jitter) const;

    /**
     * @brief delay_for() with jitter drawn from a thread-local generator.
     */
    std::optional<std::chrono::milliseconds> next_delay(int attempt, FailureCause cause) const;

    int max_attempts() const { return settings_.max_attempts; }

private:
    RetrySettings settings_;
};

} // namespace Instasave

/**
 * @file RetryPolicy.hpp
 * @brief Bounded retry-with-backoff combinator.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>
#include <utility>

namespace scansorter::domain {

/**
 * @struct RetryPolicy
 * @brief How many times to probe and how long to wait between probes.
 */
struct RetryPolicy {
    int maxAttempts = 1;
    std::chrono::milliseconds backoff{0};
};

/**
 * @struct RetryResult
 * @brief Outcome of a bounded retry: the value (if any probe succeeded) and attempts made.
 */
template <typename T>
struct RetryResult {
    std::optional<T> value;
    int attempts = 0;

    bool succeeded() const { return value.has_value(); }
};

/**
 * @brief Calls @p probe until it yields a value or the attempt bound is reached.
 *
 * Sleeps @p policy.backoff between attempts, never after the last one.
 * @p onRetry receives the number of the attempt that just failed, before the sleep.
 */
template <typename T, typename Probe, typename OnRetry>
RetryResult<T> RetryWithBackoff(const RetryPolicy& policy, Probe&& probe, OnRetry&& onRetry) {
    RetryResult<T> result;
    const int maxAttempts = std::max(1, policy.maxAttempts);

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        result.attempts = attempt;
        std::optional<T> value = probe(attempt);
        if (value) {
            result.value = std::move(value);
            return result;
        }
        if (attempt < maxAttempts) {
            onRetry(attempt);
            if (policy.backoff.count() > 0) {
                std::this_thread::sleep_for(policy.backoff);
            }
        }
    }
    return result;
}

template <typename T, typename Probe>
RetryResult<T> RetryWithBackoff(const RetryPolicy& policy, Probe&& probe) {
    return RetryWithBackoff<T>(policy, std::forward<Probe>(probe), [](int) {});
}

} // namespace scansorter::domain

#pragma once

#include "dsync/core/cancellation.hpp"
#include "dsync/core/error.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <utility>

namespace dsync::sync {

/**
 * @brief Bounded retry with linear backoff
 *
 * After failed attempt n (1-based) the policy waits base_delay * n. Only
 * errors flagged transient are retried.
 */
struct RetryPolicy {
    using SleepFn = std::function<void(std::chrono::milliseconds)>;
    using RetryObserver = std::function<void(std::uint32_t failed_attempt,
                                             const Error& error,
                                             std::chrono::milliseconds delay)>;

    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds base_delay{5000};
    SleepFn sleep;             ///< Empty: sleep in short slices, waking early on cancellation
    RetryObserver on_retry;    ///< Called before each wait

    [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t failed_attempt) const noexcept {
        return base_delay * failed_attempt;
    }
};

namespace detail {

inline void cancellable_sleep(std::chrono::milliseconds delay, const CancellationToken& cancel) {
    constexpr std::chrono::milliseconds kSlice{50};
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (!cancel.is_cancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSlice, deadline - now));
    }
}

} // namespace detail

/**
 * @brief Run `operation` until it succeeds, fails permanently or runs out of attempts
 *
 * `operation` returns an Outcome<T>. Permanent errors are returned as-is
 * after one attempt; exhaustion returns RetryExhausted whose cause is the
 * last transient error; cancellation between attempts returns Cancelled.
 */
template<typename Operation>
auto with_retry(Operation&& operation, const RetryPolicy& policy, const CancellationToken& cancel = {})
    -> decltype(operation()) {
    using ResultType = decltype(operation());

    const std::uint32_t attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
    for (std::uint32_t attempt = 1;; ++attempt) {
        if (cancel.is_cancelled()) {
            return ResultType(ErrValue<Error>(Error(ErrorKind::Cancelled, "Cancelled before attempt " + std::to_string(attempt))));
        }

        ResultType result = operation();
        if (result.is_ok()) {
            return result;
        }

        const Error& error = result.error();
        if (!error.transient) {
            return result;
        }
        if (attempt >= attempts) {
            return ResultType(ErrValue<Error>(error.wrapped_by(
                ErrorKind::RetryExhausted,
                "Gave up after " + std::to_string(attempts) + " attempt" + (attempts == 1 ? "" : "s"))));
        }

        const auto delay = policy.delay_for(attempt);
        if (policy.on_retry) {
            policy.on_retry(attempt, error, delay);
        }
        if (policy.sleep) {
            policy.sleep(delay);
        } else {
            detail::cancellable_sleep(delay, cancel);
        }
    }
}

/// Convenience overload with default sleep and no observer
template<typename Operation>
auto with_retry(Operation&& operation, std::uint32_t max_attempts, std::chrono::milliseconds base_delay)
    -> decltype(operation()) {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    policy.base_delay = base_delay;
    return with_retry(std::forward<Operation>(operation), policy);
}

} // namespace dsync::sync

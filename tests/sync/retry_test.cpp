#include "dsync/sync/retry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using dsync::Error;
using dsync::ErrorKind;
using dsync::Outcome;
using dsync::sync::RetryPolicy;
using dsync::sync::with_retry;
using namespace std::chrono_literals;

namespace {

RetryPolicy recording_policy(std::uint32_t attempts, std::vector<std::chrono::milliseconds>& sleeps) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.base_delay = 100ms;
    policy.sleep = [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); };
    return policy;
}

} // namespace

TEST(RetryPolicyTest, DelayGrowsLinearly) {
    RetryPolicy policy;
    policy.base_delay = 5000ms;
    EXPECT_EQ(policy.delay_for(1), 5000ms);
    EXPECT_EQ(policy.delay_for(2), 10000ms);
    EXPECT_EQ(policy.delay_for(3), 15000ms);
}

TEST(RetryTest, SucceedsFirstTimeWithoutSleeping) {
    std::vector<std::chrono::milliseconds> sleeps;
    int calls = 0;

    auto result = with_retry([&]() -> Outcome<int> { ++calls; return dsync::succeed(7); },
                             recording_policy(3, sleeps));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST(RetryTest, TransientFailuresThenSuccess) {
    std::vector<std::chrono::milliseconds> sleeps;
    int calls = 0;

    auto result = with_retry([&]() -> Outcome<void> {
        if (++calls < 3) {
            return dsync::fail(ErrorKind::ConnectionError, "refused");
        }
        return dsync::succeed();
    }, recording_policy(3, sleeps));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps, (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
}

TEST(RetryTest, ExhaustionWrapsLastTransientError) {
    std::vector<std::chrono::milliseconds> sleeps;
    int calls = 0;

    auto result = with_retry([&]() -> Outcome<void> {
        ++calls;
        return dsync::fail(ErrorKind::UploadError, "reset #" + std::to_string(calls));
    }, recording_policy(3, sleeps));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(result.error().kind, ErrorKind::RetryExhausted);
    ASSERT_TRUE(result.error().cause);
    EXPECT_EQ(result.error().cause->kind, ErrorKind::UploadError);
    EXPECT_EQ(result.error().cause->message, "reset #3");
}

TEST(RetryTest, PermanentErrorStopsAfterOneAttempt) {
    std::vector<std::chrono::milliseconds> sleeps;
    int calls = 0;

    auto result = with_retry([&]() -> Outcome<void> {
        ++calls;
        return dsync::fail(ErrorKind::AuthError, "Authentication failed");
    }, recording_policy(5, sleeps));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(result.error().kind, ErrorKind::AuthError);
}

TEST(RetryTest, SingleAttemptPolicyStillReportsExhaustion) {
    std::vector<std::chrono::milliseconds> sleeps;

    auto result = with_retry([]() -> Outcome<void> {
        return dsync::fail(ErrorKind::ConnectionError, "timed out");
    }, recording_policy(1, sleeps));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::RetryExhausted);
    EXPECT_TRUE(sleeps.empty());
}

TEST(RetryTest, ObserverSeesEachScheduledRetry) {
    std::vector<std::chrono::milliseconds> sleeps;
    auto policy = recording_policy(3, sleeps);
    std::vector<std::uint32_t> observed;
    policy.on_retry = [&](std::uint32_t attempt, const Error& error, std::chrono::milliseconds delay) {
        observed.push_back(attempt);
        EXPECT_EQ(error.kind, ErrorKind::ConnectionError);
        EXPECT_EQ(delay, policy.base_delay * attempt);
    };

    auto result = with_retry([]() -> Outcome<void> {
        return dsync::fail(ErrorKind::ConnectionError, "refused");
    }, policy);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(observed, (std::vector<std::uint32_t>{1, 2}));
}

TEST(RetryTest, CancellationBeforeNextAttempt) {
    dsync::CancellationToken cancel;
    std::vector<std::chrono::milliseconds> sleeps;
    auto policy = recording_policy(5, sleeps);
    int calls = 0;

    auto result = with_retry([&]() -> Outcome<void> {
        ++calls;
        cancel.cancel();
        return dsync::fail(ErrorKind::ConnectionError, "refused");
    }, policy, cancel);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Cancelled);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, DefaultSleepWakesEarlyOnCancellation) {
    dsync::CancellationToken cancel;
    cancel.cancel();

    const auto start = std::chrono::steady_clock::now();
    dsync::sync::detail::cancellable_sleep(10s, cancel);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

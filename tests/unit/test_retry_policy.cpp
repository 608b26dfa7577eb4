#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/retry_policy.hpp"

namespace {

using uploader::core::config::RetryPolicy;
using uploader::core::errors::ErrorCategory;
using uploader::core::errors::get_error;
using uploader::core::errors::is_error;
using uploader::core::errors::is_retryable;
using uploader::core::errors::ok;
using uploader::core::errors::Status;
using uploader::core::errors::UploadError;
using uploader::runtime::retry;

RetryPolicy immediate(std::uint32_t attempts) {
    RetryPolicy policy;
    policy.attempts = attempts;
    policy.delay = std::chrono::milliseconds(0);
    return policy;
}

TEST(RetryPolicyTest, SucceedsOnFirstAttempt) {
    int calls = 0;
    auto outcome = retry(immediate(2), nullptr, [&]() -> Status {
        ++calls;
        return ok();
    });

    EXPECT_FALSE(is_error(outcome.status));
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, RetriesTransientFailureOnce) {
    int calls = 0;
    std::vector<std::uint32_t> retried_after;
    auto outcome = retry(
        immediate(2), nullptr,
        [&]() -> Status {
            ++calls;
            if (calls == 1) {
                return UploadError{ErrorCategory::Transport, "reset"};
            }
            return ok();
        },
        is_retryable,
        [&](std::uint32_t attempt, const UploadError&) { retried_after.push_back(attempt); });

    EXPECT_FALSE(is_error(outcome.status));
    EXPECT_EQ(outcome.attempts, 2u);
    EXPECT_EQ(retried_after, std::vector<std::uint32_t>{1});
}

TEST(RetryPolicyTest, GivesUpAfterAttemptBudgetWithLastError) {
    int calls = 0;
    int notifications = 0;
    auto outcome = retry(
        immediate(2), nullptr,
        [&]() -> Status {
            ++calls;
            return UploadError{ErrorCategory::Read, "attempt " + std::to_string(calls)};
        },
        nullptr, [&](std::uint32_t, const UploadError&) { ++notifications; });

    ASSERT_TRUE(is_error(outcome.status));
    EXPECT_EQ(get_error(outcome.status).message, "attempt 2");
    EXPECT_EQ(outcome.attempts, 2u);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(notifications, 1);
}

TEST(RetryPolicyTest, StopsImmediatelyWhenPredicateRejects) {
    int calls = 0;
    auto outcome = retry(
        immediate(2), nullptr,
        [&]() -> Status {
            ++calls;
            return UploadError{ErrorCategory::Security, "outside", "path_outside_working_dir"};
        },
        is_retryable);

    ASSERT_TRUE(is_error(outcome.status));
    EXPECT_EQ(get_error(outcome.status).category, ErrorCategory::Security);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, ZeroAttemptsStillRunsOnce) {
    int calls = 0;
    auto outcome = retry(immediate(0), nullptr, [&]() -> Status {
        ++calls;
        return ok();
    });

    EXPECT_FALSE(is_error(outcome.status));
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, CancelledBeforeStartRunsNothing) {
    auto cancel = std::make_shared<std::atomic_bool>(true);
    int calls = 0;
    auto outcome = retry(immediate(2), cancel, [&]() -> Status {
        ++calls;
        return ok();
    });

    ASSERT_TRUE(is_error(outcome.status));
    EXPECT_EQ(get_error(outcome.status).category, ErrorCategory::Cancelled);
    EXPECT_EQ(outcome.attempts, 0u);
    EXPECT_EQ(calls, 0);
}

TEST(RetryPolicyTest, CancellationDuringBackoffPreventsNextAttempt) {
    auto cancel = std::make_shared<std::atomic_bool>(false);
    RetryPolicy policy;
    policy.attempts = 2;
    policy.delay = std::chrono::milliseconds(5000);

    int calls = 0;
    const auto started = std::chrono::steady_clock::now();
    auto outcome = retry(policy, cancel, [&]() -> Status {
        ++calls;
        cancel->store(true);
        return UploadError{ErrorCategory::Transport, "reset"};
    });

    ASSERT_TRUE(is_error(outcome.status));
    EXPECT_EQ(get_error(outcome.status).category, ErrorCategory::Cancelled);
    EXPECT_EQ(calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}

} // namespace

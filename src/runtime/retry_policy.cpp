#include "runtime/retry_policy.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace uploader::runtime {

using core::errors::ErrorCategory;
using core::errors::UploadError;

namespace {

UploadError cancelled_error() {
    return UploadError{ErrorCategory::Cancelled, "operation cancelled", "cancelled"};
}

// Sleeps for delay in short slices. Returns false when cancelled meanwhile.
bool cancellable_sleep(const std::chrono::milliseconds delay,
                       const transport::CancelToken& cancel_token) {
    constexpr std::chrono::milliseconds kSlice{10};
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (transport::is_cancelled(cancel_token)) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(kSlice, remaining));
    }
    return !transport::is_cancelled(cancel_token);
}

}  // namespace

RetryOutcome retry(const core::config::RetryPolicy& policy,
                   const transport::CancelToken& cancel_token,
                   const std::function<core::errors::Status()>& fn,
                   const RetryIf& retry_if, const OnRetry& on_retry) {
    const std::uint32_t max_attempts = std::max<std::uint32_t>(policy.attempts, 1);

    RetryOutcome outcome{cancelled_error(), 0};
    for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (transport::is_cancelled(cancel_token)) {
            outcome.status = cancelled_error();
            return outcome;
        }

        ++outcome.attempts;
        outcome.status = fn();
        if (!core::errors::is_error(outcome.status)) {
            return outcome;
        }

        const auto& error = core::errors::get_error(outcome.status);
        if (retry_if && !retry_if(error)) {
            return outcome;
        }
        if (attempt == max_attempts) {
            return outcome;
        }
        if (on_retry) {
            on_retry(attempt, error);
        }
        if (policy.delay.count() > 0 && !cancellable_sleep(policy.delay, cancel_token)) {
            outcome.status = cancelled_error();
            return outcome;
        }
    }
    return outcome;
}

}  // namespace uploader::runtime

#pragma once

#include <cstdint>
#include <functional>
#include "core/config/upload_settings.hpp"
#include "core/errors/upload_errors.hpp"
#include "transport/artifact_service_client.hpp"

namespace uploader::runtime {

struct RetryOutcome {
    core::errors::Status status;
    std::uint32_t attempts = 0;
};

using RetryIf = std::function<bool(const core::errors::UploadError&)>;
using OnRetry = std::function<void(std::uint32_t attempt, const core::errors::UploadError&)>;

// Runs fn until it succeeds, retry_if rejects its error, cancellation is
// observed or policy.attempts is used up. Only the last error is kept.
// on_retry fires between attempts, never after the final one.
RetryOutcome retry(const core::config::RetryPolicy& policy,
                   const transport::CancelToken& cancel_token,
                   const std::function<core::errors::Status()>& fn,
                   const RetryIf& retry_if = nullptr, const OnRetry& on_retry = nullptr);

}  // namespace uploader::runtime

#pragma once

#include <atomic>
#include <memory>
#include "core/errors/upload_errors.hpp"
#include "protocol/annotation_contract.hpp"
#include "protocol/upload_contract.hpp"

namespace uploader::transport {

using CancelToken = std::shared_ptr<std::atomic_bool>;

inline bool is_cancelled(const CancelToken& cancel_token) {
    return cancel_token && cancel_token->load();
}

// Client half of one upload stream. Messages are delivered in send order.
class UploadStream {
public:
    virtual ~UploadStream() = default;

    virtual core::errors::Status send(const protocol::ArtifactEntry& entry,
                                      const CancelToken& cancel_token) = 0;

    // Half-closes the stream and waits for the server acknowledgement.
    virtual core::errors::Status close_and_recv() = 0;
};

class ArtifactServiceClient {
public:
    virtual ~ArtifactServiceClient() = default;

    virtual core::errors::Result<std::unique_ptr<UploadStream>> open_upload_stream(
        const CancelToken& cancel_token) = 0;

    virtual core::errors::Status report_annotations(
        const protocol::ReportAnnotationsRequest& request,
        const CancelToken& cancel_token) = 0;
};

}  // namespace uploader::transport

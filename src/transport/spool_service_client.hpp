#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "transport/artifact_service_client.hpp"

namespace uploader::transport {

// Local stand-in for the artifact service. Every message is appended as a
// JSONL event to <spool_root>/uploads.jsonl and chunk payloads are
// reassembled under <spool_root>/<name>/<artifact_path>.
//
// Streams keep a reference to the client, which must outlive them.
class SpoolServiceClient : public ArtifactServiceClient {
public:
    explicit SpoolServiceClient(std::filesystem::path spool_root);

    core::errors::Result<std::unique_ptr<UploadStream>> open_upload_stream(
        const CancelToken& cancel_token) override;

    core::errors::Status report_annotations(
        const protocol::ReportAnnotationsRequest& request,
        const CancelToken& cancel_token) override;

    core::errors::Result<std::filesystem::path> events_path() const;

    const std::filesystem::path& spool_root() const { return spool_root_; }

private:
    friend class SpoolUploadStream;

    core::errors::Status append_event(const std::string& event_json);

    std::filesystem::path spool_root_;
    std::mutex mutex_;
};

}  // namespace uploader::transport

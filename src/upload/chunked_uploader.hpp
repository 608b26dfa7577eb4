#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "annotations/annotation_collector.hpp"
#include "core/config/upload_settings.hpp"
#include "core/errors/upload_errors.hpp"
#include "policy/workspace_guard.hpp"
#include "protocol/annotation_contract.hpp"
#include "protocol/artifact_instruction.hpp"
#include "transport/artifact_service_client.hpp"
#include "upload/progress_sink.hpp"

namespace uploader::upload {

// State of one upload attempt. Never reused across attempts.
struct UploadSession {
    std::unique_ptr<transport::UploadStream> stream;
    std::vector<char> buffer;
    std::uint64_t bytes_uploaded = 0;
};

class ChunkedUploader {
public:
    ChunkedUploader(transport::ArtifactServiceClient& client, ProgressSink& progress,
                    const annotations::AnnotationCollector& collector,
                    protocol::TaskIdentification task_identification,
                    core::config::UploadSettings settings = {});

    // Streams every file of every processed path over one freshly opened
    // stream and returns the annotations parsed along the way. The stream is
    // closed exactly once whatever the outcome.
    core::errors::Result<std::vector<protocol::Annotation>> upload(
        const std::vector<protocol::ProcessedPath>& processed_paths,
        const std::string& name, const protocol::ArtifactsInstruction& instruction,
        const std::string& working_dir, const transport::CancelToken& cancel_token) const;

private:
    core::errors::Status upload_groups(
        UploadSession& session, const std::vector<protocol::ProcessedPath>& processed_paths,
        const std::string& name, const protocol::ArtifactsInstruction& instruction,
        const policy::WorkspaceGuard& guard, const transport::CancelToken& cancel_token,
        std::vector<protocol::Annotation>& annotations) const;

    core::errors::Status upload_file(UploadSession& session,
                                     const std::string& artifact_path,
                                     const policy::WorkspaceGuard& guard,
                                     const transport::CancelToken& cancel_token) const;

    void close_session(UploadSession& session) const;

    transport::ArtifactServiceClient& client_;
    ProgressSink& progress_;
    const annotations::AnnotationCollector& collector_;
    protocol::TaskIdentification task_identification_;
    core::config::UploadSettings settings_;
};

// SI-formatted byte count, e.g. "105 MB".
std::string human_bytes(std::uint64_t bytes);

}  // namespace uploader::upload

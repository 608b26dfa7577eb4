#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "annotations/annotation_collector.hpp"
#include "core/config/upload_settings.hpp"
#include "core/errors/upload_errors.hpp"
#include "protocol/artifact_instruction.hpp"
#include "transport/artifact_service_client.hpp"
#include "upload/progress_sink.hpp"

namespace uploader::runtime {

// Annotation parsing runs interleaved with uploading, per file.
enum class PipelineState {
    Idle,
    Resolving,
    Uploading,
    Reporting,
    Done,
    Failed
};

std::string to_string(PipelineState state);

struct ArtifactUploadOutcome {
    bool succeeded = false;
    PipelineState final_state = PipelineState::Idle;
    std::uint32_t upload_attempts = 0;
    std::size_t annotations_reported = 0;
    std::optional<core::errors::UploadError> error;
};

// Collects, uploads and annotates one artifact declaration. Holds no
// per-call state; concurrent calls need a thread-safe client and sink.
class ArtifactPipeline {
public:
    ArtifactPipeline(transport::ArtifactServiceClient& client,
                     upload::ProgressSink& progress,
                     protocol::TaskIdentification task_identification,
                     core::config::UploadSettings settings = {},
                     annotations::AnnotationCollector collector = annotations::AnnotationCollector());

    ArtifactUploadOutcome upload_artifacts(
        const std::string& name, const protocol::ArtifactsInstruction& instruction,
        const core::config::Environment& env,
        const transport::CancelToken& cancel_token = nullptr) const;

private:
    void report_annotations(const std::string& working_dir,
                            std::vector<protocol::Annotation> annotations,
                            const transport::CancelToken& cancel_token,
                            ArtifactUploadOutcome& outcome) const;

    void transition(PipelineState& current, PipelineState next) const;

    transport::ArtifactServiceClient& client_;
    upload::ProgressSink& progress_;
    protocol::TaskIdentification task_identification_;
    core::config::UploadSettings settings_;
    annotations::AnnotationCollector collector_;
};

}  // namespace uploader::runtime

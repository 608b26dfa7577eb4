#include "runtime/artifact_pipeline.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "resolve/path_resolver.hpp"
#include "runtime/retry_policy.hpp"
#include "upload/chunked_uploader.hpp"

namespace uploader::runtime {

using core::errors::UploadError;
using protocol::Annotation;

std::string to_string(const PipelineState state) {
    switch (state) {
        case PipelineState::Idle:
            return "idle";
        case PipelineState::Resolving:
            return "resolving";
        case PipelineState::Uploading:
            return "uploading";
        case PipelineState::Reporting:
            return "reporting";
        case PipelineState::Done:
            return "done";
        case PipelineState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

ArtifactPipeline::ArtifactPipeline(transport::ArtifactServiceClient& client,
                                   upload::ProgressSink& progress,
                                   protocol::TaskIdentification task_identification,
                                   core::config::UploadSettings settings,
                                   annotations::AnnotationCollector collector)
    : client_(client),
      progress_(progress),
      task_identification_(std::move(task_identification)),
      settings_(std::move(settings)),
      collector_(std::move(collector)) {}

void ArtifactPipeline::transition(PipelineState& current, const PipelineState next) const {
    UPLOADER_LOG_DEBUG("ArtifactPipeline: transition " + to_string(current) + " -> " +
                       to_string(next));
    current = next;
}

ArtifactUploadOutcome ArtifactPipeline::upload_artifacts(
    const std::string& name, const protocol::ArtifactsInstruction& instruction,
    const core::config::Environment& env, const transport::CancelToken& cancel_token) const {
    ArtifactUploadOutcome outcome;
    PipelineState state = PipelineState::Idle;

    if (instruction.paths.empty()) {
        progress_.write("\nSkipping artifacts upload because there are no path specified...");
        transition(state, PipelineState::Done);
        outcome.succeeded = true;
        outcome.final_state = state;
        return outcome;
    }

    auto working_dir_result = core::config::working_directory(env);
    if (core::errors::is_error(working_dir_result)) {
        const auto& err = core::errors::get_error(working_dir_result);
        progress_.write("\nFailed to upload artifacts: " + err.message);
        transition(state, PipelineState::Failed);
        outcome.final_state = state;
        outcome.error = err;
        return outcome;
    }
    const std::string working_dir = core::errors::get_value(working_dir_result);

    const resolve::PathResolver resolver;
    const upload::ChunkedUploader chunked_uploader(client_, progress_, collector_,
                                                   task_identification_, settings_);
    std::vector<Annotation> all_annotations;

    const auto attempt_upload = [&]() -> core::errors::Status {
        transition(state, PipelineState::Resolving);
        auto resolved = resolver.resolve(instruction.paths, working_dir, env);
        if (core::errors::is_error(resolved)) {
            return core::errors::get_error(resolved);
        }

        transition(state, PipelineState::Uploading);
        auto uploaded = chunked_uploader.upload(core::errors::get_value(resolved), name,
                                                instruction, working_dir, cancel_token);
        if (core::errors::is_error(uploaded)) {
            return core::errors::get_error(uploaded);
        }
        all_annotations = std::move(core::errors::get_value(uploaded));
        return core::errors::ok();
    };

    const auto on_retry = [this](std::uint32_t attempt, const UploadError& err) {
        progress_.write("\nFailed to upload artifacts: " + err.message);
        progress_.write("\nRe-trying to upload artifacts...");
        UPLOADER_LOG_WARN("ArtifactPipeline: attempt " + std::to_string(attempt) +
                          " failed [" + err.code + "], retrying");
    };

    const auto retried = retry(settings_.upload_policy, cancel_token, attempt_upload,
                               core::errors::is_retryable, on_retry);
    outcome.upload_attempts = retried.attempts;

    if (core::errors::is_error(retried.status)) {
        const auto& err = core::errors::get_error(retried.status);
        if (!core::errors::is_retryable(err)) {
            progress_.write("\nFailed to upload artifacts: " + err.message);
        } else {
            progress_.write("\nFailed to upload artifacts after multiple tries: " +
                            err.message);
        }
        UPLOADER_LOG_ERROR("ArtifactPipeline: upload of '" + name + "' failed [" +
                           err.code + "]: " + err.message);
        transition(state, PipelineState::Failed);
        outcome.final_state = state;
        outcome.error = err;
        return outcome;
    }

    if (!all_annotations.empty()) {
        transition(state, PipelineState::Reporting);
        report_annotations(working_dir, std::move(all_annotations), cancel_token, outcome);
    }

    transition(state, PipelineState::Done);
    outcome.succeeded = true;
    outcome.final_state = state;
    return outcome;
}

void ArtifactPipeline::report_annotations(const std::string& working_dir,
                                          std::vector<Annotation> annotations,
                                          const transport::CancelToken& cancel_token,
                                          ArtifactUploadOutcome& outcome) const {
    auto normalized = collector_.normalize(working_dir, std::move(annotations));
    if (normalized.warning.has_value()) {
        progress_.write("\nFailed to validate annotations: " +
                        normalized.warning.value().message);
    }
    if (normalized.annotations.empty()) {
        return;
    }

    const std::size_t count = normalized.annotations.size();
    const protocol::ReportAnnotationsRequest request{task_identification_,
                                                     std::move(normalized.annotations)};

    const auto on_retry = [this, count](std::uint32_t, const UploadError& err) {
        progress_.write("\nFailed to report " + std::to_string(count) +
                        " annotations: " + err.message);
        progress_.write("\nRetrying...");
    };

    const auto reported = retry(
        settings_.report_policy, cancel_token,
        [&]() { return client_.report_annotations(request, cancel_token); }, nullptr,
        on_retry);

    if (core::errors::is_error(reported.status)) {
        const auto& err = core::errors::get_error(reported.status);
        progress_.write("\nStill failed to report " + std::to_string(count) +
                        " annotations: " + err.message + ". Ignoring...");
        UPLOADER_LOG_WARN("ArtifactPipeline: dropping " + std::to_string(count) +
                          " annotations [" + err.code + "]");
        return;
    }

    progress_.write("\nReported " + std::to_string(count) + " annotations!");
    outcome.annotations_reported = count;
}

}  // namespace uploader::runtime

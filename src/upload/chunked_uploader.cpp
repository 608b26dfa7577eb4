#include "upload/chunked_uploader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace uploader::upload {

using core::errors::ErrorCategory;
using core::errors::UploadError;
using protocol::Annotation;
using protocol::ArtifactChunk;
using protocol::ArtifactsUpload;

namespace {

UploadError cancelled_error() {
    return UploadError{ErrorCategory::Cancelled, "artifact upload cancelled",
                       "cancelled"};
}

}  // namespace

std::string human_bytes(const std::uint64_t bytes) {
    static const char* const kUnits[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
    if (bytes < 10) {
        return std::to_string(bytes) + " B";
    }

    const double exponent =
        std::floor(std::log(static_cast<double>(bytes)) / std::log(1000.0));
    const int unit = static_cast<int>(exponent);
    const double scaled =
        std::floor(static_cast<double>(bytes) / std::pow(1000.0, exponent) * 10 + 0.5) / 10;

    std::ostringstream out;
    out << std::fixed << std::setprecision(scaled < 10 ? 1 : 0) << scaled << " "
        << kUnits[unit];
    return out.str();
}

ChunkedUploader::ChunkedUploader(transport::ArtifactServiceClient& client,
                                 ProgressSink& progress,
                                 const annotations::AnnotationCollector& collector,
                                 protocol::TaskIdentification task_identification,
                                 core::config::UploadSettings settings)
    : client_(client),
      progress_(progress),
      collector_(collector),
      task_identification_(std::move(task_identification)),
      settings_(std::move(settings)) {}

core::errors::Result<std::vector<Annotation>> ChunkedUploader::upload(
    const std::vector<protocol::ProcessedPath>& processed_paths, const std::string& name,
    const protocol::ArtifactsInstruction& instruction, const std::string& working_dir,
    const transport::CancelToken& cancel_token) const {
    if (transport::is_cancelled(cancel_token)) {
        return cancelled_error();
    }

    auto opened = client_.open_upload_stream(cancel_token);
    if (core::errors::is_error(opened)) {
        return core::errors::wrap(core::errors::get_error(opened),
                                  "failed to initialize artifacts upload client");
    }

    UploadSession session;
    session.stream = std::move(core::errors::get_value(opened));
    session.buffer.resize(settings_.chunk_size > 0 ? settings_.chunk_size : 1);
    UPLOADER_LOG_DEBUG("ChunkedUploader: opened stream for '" + name + "'");

    const policy::WorkspaceGuard guard(working_dir);
    std::vector<Annotation> annotations;
    auto uploaded = upload_groups(session, processed_paths, name, instruction, guard,
                                  cancel_token, annotations);
    close_session(session);

    if (core::errors::is_error(uploaded)) {
        return core::errors::get_error(uploaded);
    }
    return annotations;
}

core::errors::Status ChunkedUploader::upload_groups(
    UploadSession& session, const std::vector<protocol::ProcessedPath>& processed_paths,
    const std::string& name, const protocol::ArtifactsInstruction& instruction,
    const policy::WorkspaceGuard& guard, const transport::CancelToken& cancel_token,
    std::vector<Annotation>& annotations) const {
    for (std::size_t index = 0; index < processed_paths.size(); ++index) {
        const auto& processed_path = processed_paths[index];
        if (index > 0) {
            progress_.write("\n");
        }
        progress_.write("Uploading " + std::to_string(processed_path.paths.size()) +
                        " artifacts for " + processed_path.pattern);

        if (transport::is_cancelled(cancel_token)) {
            return cancelled_error();
        }
        const ArtifactsUpload header{task_identification_, name, instruction.type,
                                     instruction.format};
        auto sent = session.stream->send(header, cancel_token);
        if (core::errors::is_error(sent)) {
            return core::errors::wrap(core::errors::get_error(sent),
                                      "failed to initialize artifacts upload");
        }

        for (const auto& artifact_path : processed_path.paths) {
            std::error_code ec;
            const auto status = std::filesystem::status(artifact_path, ec);
            if (!ec && std::filesystem::is_directory(status)) {
                progress_.write("\nSkipping uploading of '" + artifact_path +
                                "' because it's a folder");
                continue;
            }
            if (!ec && std::filesystem::is_regular_file(status)) {
                const auto size = std::filesystem::file_size(artifact_path, ec);
                if (!ec && size > settings_.hefty_artifact_bytes) {
                    progress_.write("\nUploading a quite hefty artifact '" + artifact_path +
                                    "' of size " + human_bytes(size));
                }
            }

            auto file_uploaded = upload_file(session, artifact_path, guard, cancel_token);
            if (core::errors::is_error(file_uploaded)) {
                return file_uploaded;
            }
            progress_.write("\nUploaded " + artifact_path);

            if (!instruction.format.empty()) {
                progress_.write("\nTrying to parse annotations for " + instruction.format +
                                " format");
            }
            auto parsed = collector_.parse(artifact_path, instruction.format);
            if (core::errors::is_error(parsed)) {
                return core::errors::wrap(core::errors::get_error(parsed),
                                          "failed to create annotations from " +
                                              artifact_path);
            }
            auto& file_annotations = core::errors::get_value(parsed);
            annotations.insert(annotations.end(),
                               std::make_move_iterator(file_annotations.begin()),
                               std::make_move_iterator(file_annotations.end()));
        }
    }
    return core::errors::ok();
}

core::errors::Status ChunkedUploader::upload_file(
    UploadSession& session, const std::string& artifact_path,
    const policy::WorkspaceGuard& guard, const transport::CancelToken& cancel_token) const {
    std::ifstream in(artifact_path, std::ios::binary);
    if (!in.is_open()) {
        return UploadError{ErrorCategory::Read,
                           "failed to read artifact file " + artifact_path,
                           "artifact_open_failed"};
    }

    auto relative = guard.relative_artifact_path(artifact_path);
    if (core::errors::is_error(relative)) {
        return core::errors::get_error(relative);
    }
    const std::string& relative_path = core::errors::get_value(relative);

    session.bytes_uploaded = 0;
    while (true) {
        in.read(session.buffer.data(), static_cast<std::streamsize>(session.buffer.size()));
        const std::streamsize read_bytes = in.gcount();

        if (read_bytes > 0) {
            if (transport::is_cancelled(cancel_token)) {
                return cancelled_error();
            }
            const ArtifactChunk chunk{
                relative_path,
                std::string_view(session.buffer.data(), static_cast<std::size_t>(read_bytes))};
            auto sent = session.stream->send(chunk, cancel_token);
            if (core::errors::is_error(sent)) {
                return core::errors::wrap(core::errors::get_error(sent),
                                          "failed to upload artifact file " + artifact_path);
            }
            session.bytes_uploaded += static_cast<std::uint64_t>(read_bytes);
        }

        if (in.bad()) {
            return UploadError{ErrorCategory::Read,
                               "failed to read artifact file " + artifact_path,
                               "artifact_read_failed"};
        }
        if (in.eof() || read_bytes == 0) {
            break;
        }
    }

    UPLOADER_LOG_DEBUG("ChunkedUploader: sent " + std::to_string(session.bytes_uploaded) +
                       " bytes of " + relative_path);
    return core::errors::ok();
}

void ChunkedUploader::close_session(UploadSession& session) const {
    if (!session.stream) {
        return;
    }
    auto closed = session.stream->close_and_recv();
    if (core::errors::is_error(closed)) {
        progress_.write("\nError from upload stream: " +
                        core::errors::get_error(closed).message);
        UPLOADER_LOG_WARN("ChunkedUploader: close failed [" +
                          core::errors::get_error(closed).code + "]: " +
                          core::errors::get_error(closed).message);
    }
    session.stream.reset();
}

}  // namespace uploader::upload

#include "transport/spool_service_client.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <set>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace uploader::transport {

using core::errors::ErrorCategory;
using core::errors::UploadError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json make_event(const std::string& name, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = name;
    event["payload"] = std::move(payload);
    return event;
}

bool is_within_root(const std::filesystem::path& root,
                    const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

UploadError cancelled_error() {
    return UploadError{ErrorCategory::Cancelled, "upload stream cancelled",
                       "cancelled"};
}

}  // namespace

class SpoolUploadStream : public UploadStream {
public:
    explicit SpoolUploadStream(SpoolServiceClient& client) : client_(client) {}

    core::errors::Status send(const protocol::ArtifactEntry& entry,
                              const CancelToken& cancel_token) override {
        if (is_cancelled(cancel_token)) {
            return cancelled_error();
        }
        if (closed_) {
            return UploadError{ErrorCategory::Transport,
                               "send on closed upload stream", "stream_closed"};
        }
        if (const auto* upload = std::get_if<protocol::ArtifactsUpload>(&entry)) {
            return start_group(*upload);
        }
        return write_chunk(std::get<protocol::ArtifactChunk>(entry));
    }

    core::errors::Status close_and_recv() override {
        if (closed_) {
            return UploadError{ErrorCategory::Transport,
                               "upload stream already closed", "stream_closed"};
        }
        closed_ = true;

        json payload;
        payload["groups"] = groups_;
        payload["chunks"] = chunks_;
        payload["bytes"] = bytes_;
        return client_.append_event(make_event("stream_closed", payload).dump());
    }

private:
    core::errors::Status start_group(const protocol::ArtifactsUpload& upload) {
        const std::string bucket = upload.name.empty() ? "default" : upload.name;
        if (bucket.find('/') != std::string::npos || bucket == "." || bucket == "..") {
            return UploadError{ErrorCategory::Transport,
                               "invalid artifacts name: " + upload.name,
                               "invalid_artifacts_name"};
        }
        bucket_dir_ = client_.spool_root() / bucket;
        ++groups_;
        return client_.append_event(
            make_event("artifacts_upload", protocol::to_json(upload)).dump());
    }

    core::errors::Status write_chunk(const protocol::ArtifactChunk& chunk) {
        if (bucket_dir_.empty()) {
            return UploadError{ErrorCategory::Transport,
                               "chunk received before artifacts header",
                               "missing_artifacts_header"};
        }

        const auto target = (bucket_dir_ / chunk.artifact_path).lexically_normal();
        if (chunk.artifact_path.empty() || !is_within_root(bucket_dir_, target) ||
            target == bucket_dir_) {
            return UploadError{ErrorCategory::Transport,
                               "artifact path escapes spool: " + chunk.artifact_path,
                               "invalid_artifact_path"};
        }

        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return UploadError{ErrorCategory::Transport,
                               "Unable to create spool directory: " +
                                   target.parent_path().string(),
                               "spool_dir_create_failed"};
        }

        // The first chunk of a file in this stream replaces any earlier copy.
        const bool first_chunk = written_.insert(target.string()).second;
        const auto mode = std::ios::binary | (first_chunk ? std::ios::trunc : std::ios::app);
        std::ofstream out(target, mode);
        if (!out.is_open()) {
            return UploadError{ErrorCategory::Transport,
                               "Unable to open spool file: " + target.string(),
                               "spool_open_failed"};
        }
        out.write(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
        if (!out.good()) {
            return UploadError{ErrorCategory::Transport,
                               "Unable to write spool file: " + target.string(),
                               "spool_write_failed"};
        }

        ++chunks_;
        bytes_ += chunk.data.size();
        return client_.append_event(
            make_event("artifact_chunk", protocol::to_json(chunk)).dump());
    }

    SpoolServiceClient& client_;
    std::filesystem::path bucket_dir_;
    std::set<std::string> written_;
    std::size_t groups_ = 0;
    std::size_t chunks_ = 0;
    std::size_t bytes_ = 0;
    bool closed_ = false;
};

SpoolServiceClient::SpoolServiceClient(std::filesystem::path spool_root)
    : spool_root_(spool_root.lexically_normal()) {}

core::errors::Result<std::filesystem::path> SpoolServiceClient::events_path() const {
    if (spool_root_.empty()) {
        return UploadError{ErrorCategory::Input, "Spool directory cannot be empty.",
                           "invalid_spool_dir"};
    }

    std::error_code ec;
    std::filesystem::create_directories(spool_root_, ec);
    if (ec) {
        return UploadError{ErrorCategory::Transport,
                           "Unable to create spool directory: " + spool_root_.string(),
                           "spool_dir_create_failed"};
    }
    if (!std::filesystem::is_directory(spool_root_, ec) || ec) {
        return UploadError{ErrorCategory::Transport,
                           "Spool path is not a directory: " + spool_root_.string(),
                           "spool_dir_create_failed"};
    }
    return spool_root_ / "uploads.jsonl";
}

core::errors::Status SpoolServiceClient::append_event(const std::string& event_json) {
    auto path_result = events_path();
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return UploadError{ErrorCategory::Transport,
                           "Unable to open spool events file: " + path.string(),
                           "spool_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return UploadError{ErrorCategory::Transport,
                           "Unable to write spool event: " + path.string(),
                           "spool_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Result<std::unique_ptr<UploadStream>> SpoolServiceClient::open_upload_stream(
    const CancelToken& cancel_token) {
    if (is_cancelled(cancel_token)) {
        return cancelled_error();
    }

    auto opened = append_event(make_event("stream_opened", json::object()).dump());
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }
    UPLOADER_LOG_DEBUG("SpoolServiceClient: opened upload stream in " +
                       spool_root_.string());
    return std::unique_ptr<UploadStream>(std::make_unique<SpoolUploadStream>(*this));
}

core::errors::Status SpoolServiceClient::report_annotations(
    const protocol::ReportAnnotationsRequest& request,
    const CancelToken& cancel_token) {
    if (is_cancelled(cancel_token)) {
        return cancelled_error();
    }
    return append_event(
        make_event("report_annotations", protocol::to_json(request)).dump());
}

}  // namespace uploader::transport

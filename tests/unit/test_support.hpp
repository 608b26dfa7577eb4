#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "core/config/task_token.hpp"
#include "core/errors/upload_errors.hpp"
#include "transport/artifact_service_client.hpp"

namespace uploader::test_support {

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& prefix) {
        root_ = std::filesystem::current_path() /
                (".tmp_" + prefix + "_" + core::config::generate_task_token());
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    std::string str() const { return root_.string(); }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

private:
    std::filesystem::path root_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// One message as it arrived on a fake stream. Chunk bytes are copied since
// the uploader reuses its buffer.
struct RecordedEntry {
    bool is_header = false;
    protocol::ArtifactsUpload header;
    std::string artifact_path;
    std::string data;
};

// Scripted in-memory artifact service. Failures are injected per call and
// consumed in order; an empty script means success. Calls may come from
// several threads.
class FakeArtifactServiceClient : public transport::ArtifactServiceClient {
public:
    using SendHook = std::function<std::optional<core::errors::UploadError>(
        const RecordedEntry& entry, std::size_t stream_index)>;

    core::errors::Result<std::unique_ptr<transport::UploadStream>> open_upload_stream(
        const transport::CancelToken& cancel_token) override;

    core::errors::Status report_annotations(
        const protocol::ReportAnnotationsRequest& request,
        const transport::CancelToken& cancel_token) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++report_calls;
        if (transport::is_cancelled(cancel_token)) {
            return core::errors::UploadError{core::errors::ErrorCategory::Cancelled,
                                             "cancelled", "cancelled"};
        }
        if (!report_failures.empty()) {
            auto failure = report_failures.front();
            report_failures.pop_front();
            return failure;
        }
        reports.push_back(request);
        return core::errors::ok();
    }

    std::size_t opened_streams = 0;
    std::size_t closed_streams = 0;
    std::size_t report_calls = 0;
    std::vector<std::vector<RecordedEntry>> streams;
    std::vector<protocol::ReportAnnotationsRequest> reports;

    std::deque<core::errors::UploadError> open_failures;
    std::deque<core::errors::UploadError> report_failures;
    std::optional<core::errors::UploadError> close_failure;
    SendHook on_send;
    std::mutex mutex;
};

class FakeUploadStream : public transport::UploadStream {
public:
    FakeUploadStream(FakeArtifactServiceClient& client, std::size_t index)
        : client_(client), index_(index) {}

    core::errors::Status send(const protocol::ArtifactEntry& entry,
                              const transport::CancelToken& cancel_token) override {
        if (transport::is_cancelled(cancel_token)) {
            return core::errors::UploadError{core::errors::ErrorCategory::Cancelled,
                                             "cancelled", "cancelled"};
        }
        RecordedEntry recorded;
        if (const auto* header = std::get_if<protocol::ArtifactsUpload>(&entry)) {
            recorded.is_header = true;
            recorded.header = *header;
        } else {
            const auto& chunk = std::get<protocol::ArtifactChunk>(entry);
            recorded.artifact_path = chunk.artifact_path;
            recorded.data = std::string(chunk.data);
        }
        std::lock_guard<std::mutex> lock(client_.mutex);
        if (client_.on_send) {
            auto failure = client_.on_send(recorded, index_);
            if (failure.has_value()) {
                return failure.value();
            }
        }
        client_.streams[index_].push_back(std::move(recorded));
        return core::errors::ok();
    }

    core::errors::Status close_and_recv() override {
        std::lock_guard<std::mutex> lock(client_.mutex);
        ++client_.closed_streams;
        if (client_.close_failure.has_value()) {
            return client_.close_failure.value();
        }
        return core::errors::ok();
    }

private:
    FakeArtifactServiceClient& client_;
    std::size_t index_;
};

inline core::errors::Result<std::unique_ptr<transport::UploadStream>>
FakeArtifactServiceClient::open_upload_stream(const transport::CancelToken& cancel_token) {
    if (transport::is_cancelled(cancel_token)) {
        return core::errors::UploadError{core::errors::ErrorCategory::Cancelled, "cancelled",
                                         "cancelled"};
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (!open_failures.empty()) {
        auto failure = open_failures.front();
        open_failures.pop_front();
        return failure;
    }
    ++opened_streams;
    streams.emplace_back();
    return std::unique_ptr<transport::UploadStream>(
        std::make_unique<FakeUploadStream>(*this, streams.size() - 1));
}

inline core::errors::UploadError transport_error(const std::string& message) {
    return core::errors::UploadError{core::errors::ErrorCategory::Transport, message,
                                     "transport_failed"};
}

}  // namespace uploader::test_support

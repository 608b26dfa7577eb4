#pragma once

#include <mutex>
#include <ostream>
#include <string>

namespace uploader::upload {

// Append-only, operator-facing task log. Never consulted for control flow.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void write(const std::string& fragment) = 0;
};

class StreamProgressSink : public ProgressSink {
public:
    explicit StreamProgressSink(std::ostream& out) : out_(out) {}

    void write(const std::string& fragment) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << fragment;
        out_.flush();
    }

private:
    std::mutex mutex_;
    std::ostream& out_;
};

class BufferedProgressSink : public ProgressSink {
public:
    void write(const std::string& fragment) override {
        std::lock_guard<std::mutex> lock(mutex_);
        text_ += fragment;
    }

    std::string text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return text_;
    }

private:
    mutable std::mutex mutex_;
    std::string text_;
};

}  // namespace uploader::upload

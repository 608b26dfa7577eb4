#include "annotations/annotation_collector.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace uploader::annotations {

using core::errors::ErrorCategory;
using core::errors::UploadError;
using protocol::Annotation;
using protocol::FileLocation;

namespace {

bool escapes_root(const std::filesystem::path& relative) {
    return relative.empty() || *relative.begin() == "..";
}

// Rewrites location.path relative to working_dir. Returns the reason when
// the location cannot be reported.
std::optional<std::string> normalize_location(const std::filesystem::path& working_dir,
                                              FileLocation& location) {
    if (location.path.empty()) {
        return std::string("annotation location has no path");
    }

    std::filesystem::path path(location.path);
    std::filesystem::path relative;
    if (path.is_absolute()) {
        relative = path.lexically_normal().lexically_relative(working_dir);
    } else {
        relative = path.lexically_normal();
    }
    if (escapes_root(relative) || relative == ".") {
        return "annotation path " + location.path + " is outside of " +
               working_dir.string();
    }

    if (location.start_line < 0 || location.end_line < 0 || location.start_column < 0 ||
        location.end_column < 0) {
        return "annotation for " + location.path + " has a negative position";
    }
    if (location.end_line == 0) {
        location.end_line = location.start_line;
    }
    if (location.end_line < location.start_line) {
        return "annotation for " + location.path + " ends before it starts";
    }

    location.path = relative.generic_string();
    return std::nullopt;
}

}  // namespace

AnnotationCollector::AnnotationCollector(ParserRegistry registry)
    : registry_(std::move(registry)) {}

core::errors::Result<std::vector<Annotation>> AnnotationCollector::parse(
    const std::filesystem::path& path, const std::string& format) const {
    if (format.empty()) {
        return std::vector<Annotation>{};
    }

    const AnnotationParser* parser = registry_.find(format);
    if (parser == nullptr) {
        UPLOADER_LOG_WARN("AnnotationCollector: no parser for format '" + format +
                          "', skipping " + path.string());
        return std::vector<Annotation>{};
    }
    return parser->parse(path);
}

NormalizedAnnotations AnnotationCollector::normalize(
    const std::string& working_dir, std::vector<Annotation> annotations) const {
    std::string trimmed = working_dir;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    const std::filesystem::path root = std::filesystem::path(trimmed).lexically_normal();

    NormalizedAnnotations normalized;
    normalized.annotations.reserve(annotations.size());
    std::size_t dropped = 0;
    std::string first_reason;

    for (auto& annotation : annotations) {
        if (annotation.location.has_value()) {
            auto reason = normalize_location(root, annotation.location.value());
            if (reason.has_value()) {
                if (dropped == 0) {
                    first_reason = reason.value();
                }
                ++dropped;
                continue;
            }
        }
        normalized.annotations.push_back(std::move(annotation));
    }

    if (dropped > 0) {
        normalized.warning = UploadError{ErrorCategory::Parse,
                                         std::to_string(dropped) +
                                             " annotations failed validation (" +
                                             first_reason + ")",
                                         "invalid_annotations"};
    }
    return normalized;
}

}  // namespace uploader::annotations

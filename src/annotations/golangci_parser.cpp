#include "annotations/golangci_parser.hpp"

#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace uploader::annotations {

using core::errors::ErrorCategory;
using core::errors::UploadError;
using nlohmann::json;
using protocol::Annotation;
using protocol::AnnotationLevel;

namespace {

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::int64_t integer_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<std::int64_t>();
}

AnnotationLevel level_from_severity(const std::string& severity) {
    if (severity == "error") {
        return AnnotationLevel::Failure;
    }
    if (severity == "info") {
        return AnnotationLevel::Notice;
    }
    return AnnotationLevel::Warning;
}

}  // namespace

core::errors::Result<std::vector<Annotation>> GolangciParser::parse(
    const std::filesystem::path& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        return UploadError{ErrorCategory::Parse,
                           "Failed to open golangci report: " + path.string(),
                           "golangci_open_failed"};
    }

    const json report = json::parse(in, nullptr, false);
    if (report.is_discarded() || !report.is_object()) {
        return UploadError{ErrorCategory::Parse,
                           "Malformed golangci report: " + path.string(),
                           "golangci_malformed"};
    }

    std::vector<Annotation> annotations;
    const auto issues = report.find("Issues");
    if (issues == report.end() || issues->is_null()) {
        return annotations;
    }
    if (!issues->is_array()) {
        return UploadError{ErrorCategory::Parse,
                           "golangci report 'Issues' is not an array: " + path.string(),
                           "golangci_malformed"};
    }

    for (const auto& issue : *issues) {
        if (!issue.is_object()) {
            continue;
        }

        Annotation annotation;
        annotation.type = protocol::AnnotationType::LintResult;
        annotation.level = level_from_severity(string_field(issue, "Severity"));
        annotation.message = string_field(issue, "Text");
        annotation.fully_qualified_name = string_field(issue, "FromLinter");

        const auto source_lines = issue.find("SourceLines");
        if (source_lines != issue.end() && source_lines->is_array()) {
            for (const auto& line : *source_lines) {
                if (!line.is_string()) {
                    continue;
                }
                if (!annotation.raw_details.empty()) {
                    annotation.raw_details += "\n";
                }
                annotation.raw_details += line.get<std::string>();
            }
        }

        const auto pos = issue.find("Pos");
        if (pos != issue.end() && pos->is_object()) {
            protocol::FileLocation location;
            location.path = string_field(*pos, "Filename");
            location.start_line = integer_field(*pos, "Line");
            location.end_line = location.start_line;
            location.start_column = integer_field(*pos, "Column");
            location.end_column = location.start_column;
            if (!location.path.empty()) {
                annotation.location = location;
            }
        }
        annotations.push_back(std::move(annotation));
    }

    return annotations;
}

}  // namespace uploader::annotations

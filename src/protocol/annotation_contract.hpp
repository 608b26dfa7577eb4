#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/artifact_instruction.hpp"

namespace uploader::protocol {

enum class AnnotationType {
    Generic,
    TestResult,
    LintResult
};

enum class AnnotationLevel {
    Notice,
    Warning,
    Failure
};

struct FileLocation {
    std::string path;
    std::int64_t start_line = 0;
    std::int64_t end_line = 0;
    std::int64_t start_column = 0;
    std::int64_t end_column = 0;
};

struct Annotation {
    AnnotationType type = AnnotationType::Generic;
    AnnotationLevel level = AnnotationLevel::Notice;
    std::string message;
    std::string raw_details;
    std::string fully_qualified_name;
    std::optional<FileLocation> location;
};

struct ReportAnnotationsRequest {
    TaskIdentification task_identification;
    std::vector<Annotation> annotations;
};

inline std::string to_string(const AnnotationType type) {
    switch (type) {
        case AnnotationType::Generic:
            return "generic";
        case AnnotationType::TestResult:
            return "test_result";
        case AnnotationType::LintResult:
            return "lint_result";
        default:
            return "unknown";
    }
}

inline std::string to_string(const AnnotationLevel level) {
    switch (level) {
        case AnnotationLevel::Notice:
            return "notice";
        case AnnotationLevel::Warning:
            return "warning";
        case AnnotationLevel::Failure:
            return "failure";
        default:
            return "unknown";
    }
}

}  // namespace uploader::protocol

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "annotations/annotation_parser.hpp"
#include "core/errors/upload_errors.hpp"
#include "protocol/annotation_contract.hpp"

namespace uploader::annotations {

struct NormalizedAnnotations {
    std::vector<protocol::Annotation> annotations;
    // Set when some annotations were dropped. Never fatal.
    std::optional<core::errors::UploadError> warning;
};

class AnnotationCollector {
public:
    explicit AnnotationCollector(
        ParserRegistry registry = ParserRegistry::with_default_parsers());

    // Empty or unknown format yields no annotations and no error.
    core::errors::Result<std::vector<protocol::Annotation>> parse(
        const std::filesystem::path& path, const std::string& format) const;

    NormalizedAnnotations normalize(const std::string& working_dir,
                                    std::vector<protocol::Annotation> annotations) const;

private:
    ParserRegistry registry_;
};

}  // namespace uploader::annotations

#pragma once

#include "annotations/annotation_parser.hpp"

namespace uploader::annotations {

// `golangci-lint run --out-format json` output.
class GolangciParser : public AnnotationParser {
public:
    std::string format() const override { return "golangci"; }

    core::errors::Result<std::vector<protocol::Annotation>> parse(
        const std::filesystem::path& path) const override;
};

}  // namespace uploader::annotations

#pragma once

#include "annotations/annotation_parser.hpp"

namespace uploader::annotations {

// JUnit XML reports. Each <failure> or <error> under a <testcase> becomes one
// failing test_result annotation.
class JUnitParser : public AnnotationParser {
public:
    std::string format() const override { return "junit"; }

    core::errors::Result<std::vector<protocol::Annotation>> parse(
        const std::filesystem::path& path) const override;
};

}  // namespace uploader::annotations

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/upload_errors.hpp"
#include "protocol/annotation_contract.hpp"

namespace uploader::annotations {

// Extracts build annotations from one artifact file of a given format.
class AnnotationParser {
public:
    virtual ~AnnotationParser() = default;

    virtual std::string format() const = 0;

    virtual core::errors::Result<std::vector<protocol::Annotation>> parse(
        const std::filesystem::path& path) const = 0;
};

class ParserRegistry {
public:
    // Registry holding the junit and golangci parsers.
    static ParserRegistry with_default_parsers();

    // Replaces any parser already registered for the same format.
    void register_parser(std::unique_ptr<AnnotationParser> parser);

    const AnnotationParser* find(const std::string& format) const;

private:
    std::map<std::string, std::unique_ptr<AnnotationParser>> parsers_;
};

}  // namespace uploader::annotations

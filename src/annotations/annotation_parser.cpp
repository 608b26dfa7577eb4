#include "annotations/annotation_parser.hpp"

#include <utility>
#include "annotations/golangci_parser.hpp"
#include "annotations/junit_parser.hpp"

namespace uploader::annotations {

ParserRegistry ParserRegistry::with_default_parsers() {
    ParserRegistry registry;
    registry.register_parser(std::make_unique<JUnitParser>());
    registry.register_parser(std::make_unique<GolangciParser>());
    return registry;
}

void ParserRegistry::register_parser(std::unique_ptr<AnnotationParser> parser) {
    if (!parser) {
        return;
    }
    const std::string format = parser->format();
    parsers_[format] = std::move(parser);
}

const AnnotationParser* ParserRegistry::find(const std::string& format) const {
    const auto it = parsers_.find(format);
    if (it == parsers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

}  // namespace uploader::annotations

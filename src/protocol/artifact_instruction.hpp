#pragma once
#include <string>
#include <vector>

namespace uploader::protocol {

    // Opaque correlation token handed in by the task runner. Attached to
    // every outbound message, never inspected.
    struct TaskIdentification {
        std::string task_id;
        std::string secret;
    };

    // Which artifact files to collect for one `artifacts` declaration.
    struct ArtifactsInstruction {
        std::vector<std::string> paths;  // glob patterns, may contain $VARS
        std::string type;                // forwarded verbatim, e.g. "text/xml"
        std::string format;              // annotation parser, empty = none
    };

    // One resolved glob: the expanded pattern and its matches in listing order.
    struct ProcessedPath {
        std::string pattern;
        std::vector<std::string> paths;
    };

} // namespace uploader::protocol

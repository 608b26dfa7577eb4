#pragma once
#include <string>
#include <string_view>
#include <variant>
#include "protocol/artifact_instruction.hpp"

namespace uploader::protocol {

    // Opens a group on the upload stream; subsequent chunks land in the
    // bucket named here until the next header.
    struct ArtifactsUpload {
        TaskIdentification task_identification;
        std::string name;
        std::string type;
        std::string format;
    };

    // One slice of a file. `data` views the session buffer and is only valid
    // for the duration of the send() call that receives it.
    struct ArtifactChunk {
        std::string artifact_path;  // slash-separated, working-dir relative
        std::string_view data;
    };

    // Exactly one of the two variants travels per stream message.
    using ArtifactEntry = std::variant<
        ArtifactsUpload,
        ArtifactChunk
    >;

} // namespace uploader::protocol

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/upload_errors.hpp"
#include "protocol/artifact_instruction.hpp"

namespace uploader::app::cli {

    struct CliOptions {
        std::string name;
        protocol::ArtifactsInstruction instruction;
        std::optional<std::filesystem::path> working_directory;
        std::optional<std::string> task_id;
        std::filesystem::path spool_directory;
        bool verbose = false;
    };

    uploader::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}

#pragma once

#include <string>
#include <vector>
#include "core/config/upload_settings.hpp"
#include "core/errors/upload_errors.hpp"
#include "protocol/artifact_instruction.hpp"

namespace uploader::resolve {

class PathResolver {
public:
    // Expands, globs and containment-checks every pattern. Any failure,
    // including a single match outside working_dir, fails the whole set.
    core::errors::Result<std::vector<protocol::ProcessedPath>> resolve(
        const std::vector<std::string>& patterns, const std::string& working_dir,
        const core::config::Environment& env) const;
};

}  // namespace uploader::resolve

#pragma once

#include <filesystem>
#include <string>
#include "core/errors/upload_errors.hpp"

namespace uploader::policy {

class WorkspaceGuard {
public:
    explicit WorkspaceGuard(std::string working_dir);

    // Returns the path when it path-matches "<working_dir>/**", otherwise the
    // path_outside_working_dir security error.
    core::errors::Result<std::string> validate_artifact_path(
        const std::string& artifact_path) const;

    // Slash-separated path of artifact_path relative to the working dir.
    core::errors::Result<std::string> relative_artifact_path(
        const std::string& artifact_path) const;

    const std::string& working_dir() const { return working_dir_; }

private:
    static std::string strip_trailing_slashes(std::string value);
    static std::string normalize_working_dir(std::string value);

    std::string working_dir_;
    std::string containment_pattern_;
};

}  // namespace uploader::policy

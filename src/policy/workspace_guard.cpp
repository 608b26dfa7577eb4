#include "policy/workspace_guard.hpp"

#include <utility>
#include "resolve/glob_matcher.hpp"

namespace uploader::policy {

using core::errors::ErrorCategory;
using core::errors::UploadError;

WorkspaceGuard::WorkspaceGuard(std::string working_dir)
    : working_dir_(normalize_working_dir(std::move(working_dir))),
      containment_pattern_(working_dir_ == "/" ? "/**"
                                               : resolve::escape(working_dir_) + "/**") {}

std::string WorkspaceGuard::strip_trailing_slashes(std::string value) {
    while (value.size() > 1 && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

// Matches are lexically normal, so the working dir must be too.
std::string WorkspaceGuard::normalize_working_dir(std::string value) {
    value = strip_trailing_slashes(std::move(value));
    if (value.empty()) {
        return value;
    }
    return strip_trailing_slashes(std::filesystem::path(value).lexically_normal().generic_string());
}

core::errors::Result<std::string> WorkspaceGuard::validate_artifact_path(
    const std::string& artifact_path) const {
    if (working_dir_.empty()) {
        return UploadError{ErrorCategory::Input,
                           "Working directory is empty.",
                           "missing_working_dir"};
    }

    auto matched = resolve::path_match(containment_pattern_, artifact_path);
    if (core::errors::is_error(matched)) {
        return core::errors::wrap(core::errors::get_error(matched),
                                  "failed to match the path " + artifact_path);
    }

    if (!core::errors::get_value(matched)) {
        return UploadError{ErrorCategory::Security,
                           "path is outside of CIRRUS_WORKING_DIR: path " +
                               artifact_path + " should be relative to " +
                               working_dir_,
                           core::errors::kPathOutsideWorkingDirCode,
                           "Artifact patterns must stay inside the working directory."};
    }

    return artifact_path;
}

core::errors::Result<std::string> WorkspaceGuard::relative_artifact_path(
    const std::string& artifact_path) const {
    const std::filesystem::path relative =
        std::filesystem::path(artifact_path).lexically_relative(working_dir_);
    if (relative.empty()) {
        return UploadError{ErrorCategory::Internal,
                           "failed to get artifact relative path for " + artifact_path,
                           "relative_path_failed"};
    }
    return relative.generic_string();
}

}  // namespace uploader::policy

#include "resolve/path_resolver.hpp"

#include <filesystem>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/workspace_guard.hpp"
#include "resolve/glob_matcher.hpp"
#include "resolve/text_expander.hpp"

namespace uploader::resolve {

using protocol::ProcessedPath;

core::errors::Result<std::vector<ProcessedPath>> PathResolver::resolve(
    const std::vector<std::string>& patterns, const std::string& working_dir,
    const core::config::Environment& env) const {
    const policy::WorkspaceGuard guard(working_dir);
    std::vector<ProcessedPath> processed;
    processed.reserve(patterns.size());

    for (const auto& raw_pattern : patterns) {
        std::filesystem::path pattern_path(expand_text(raw_pattern, env));
        if (!pattern_path.is_absolute()) {
            pattern_path = std::filesystem::path(working_dir) / pattern_path;
        }
        const std::string pattern = pattern_path.lexically_normal().string();

        auto listed = glob(pattern);
        if (core::errors::is_error(listed)) {
            return core::errors::wrap(core::errors::get_error(listed),
                                      "Failed to list artifacts");
        }

        for (const auto& artifact_path : core::errors::get_value(listed)) {
            auto contained = guard.validate_artifact_path(artifact_path);
            if (core::errors::is_error(contained)) {
                return core::errors::get_error(contained);
            }
        }

        UPLOADER_LOG_DEBUG("PathResolver: " + pattern + " matched " +
                           std::to_string(core::errors::get_value(listed).size()) +
                           " paths");
        processed.push_back(ProcessedPath{pattern, std::move(core::errors::get_value(listed))});
    }

    return processed;
}

}  // namespace uploader::resolve

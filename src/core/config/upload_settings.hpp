#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unistd.h>
#include "core/errors/upload_errors.hpp"

namespace uploader::core::config {

    using Environment = std::map<std::string, std::string>;

    inline constexpr const char* kWorkingDirVariable = "CIRRUS_WORKING_DIR";

    struct RetryPolicy {
        std::uint32_t attempts = 2;
        std::chrono::milliseconds delay{100};
    };

    struct UploadSettings {
        std::size_t chunk_size = 1024 * 1024;
        std::uintmax_t hefty_artifact_bytes = 100ULL * 1024 * 1024;
        RetryPolicy upload_policy;
        RetryPolicy report_policy;
    };

    // Snapshot of the process environment, later entries win on duplicates.
    inline Environment capture_environment() {
        Environment env;
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            const std::string pair(*entry);
            const auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                continue;
            }
            env[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
        return env;
    }

    inline errors::Result<std::string> working_directory(const Environment& env) {
        const auto it = env.find(kWorkingDirVariable);
        if (it == env.end() || it->second.empty()) {
            return errors::UploadError{errors::ErrorCategory::Input,
                                       std::string(kWorkingDirVariable) + " is not set.",
                                       "missing_working_dir",
                                       "Export CIRRUS_WORKING_DIR or pass --working-dir."};
        }
        return it->second;
    }

} // namespace uploader::core::config

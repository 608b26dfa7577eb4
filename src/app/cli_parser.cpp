#include "cli_parser.hpp"
#include <system_error>
#include <utility>

namespace uploader::app::cli {

    using namespace uploader::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> name;
        std::vector<std::string> paths;
        std::optional<std::string> type;
        std::optional<std::string> format;
        std::optional<std::string> working_dir;
        std::optional<std::string> task_id;
        std::optional<std::string> spool_dir;
        bool verbose = false;
    };

    namespace {

        UploadError missing_value(const std::string& flag) {
            return UploadError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        std::filesystem::path default_spool_directory() {
            std::error_code ec;
            auto tmp = std::filesystem::temp_directory_path(ec);
            if (ec) {
                tmp = std::filesystem::current_path(ec);
            }
            return tmp / "artifact_uploader_spool";
        }

    } // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return UploadError{ErrorCategory::Input, "No command provided.", "missing_command",
                               "Usage: artifact_uploader upload --name <name> --path <glob>"};
        }

        std::string command = argv[1];
        if (command != "upload") {
            return UploadError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                               "Currently only the 'upload' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and 'upload' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            const bool has_value = i + 1 < args.size();
            if (flag == "--name") {
                if (!has_value) return missing_value(flag);
                raw.name = args[++i];
            } else if (flag == "--path") {
                if (!has_value) return missing_value(flag);
                raw.paths.push_back(args[++i]);
            } else if (flag == "--type") {
                if (!has_value) return missing_value(flag);
                raw.type = args[++i];
            } else if (flag == "--format") {
                if (!has_value) return missing_value(flag);
                raw.format = args[++i];
            } else if (flag == "--working-dir") {
                if (!has_value) return missing_value(flag);
                raw.working_dir = args[++i];
            } else if (flag == "--task-id") {
                if (!has_value) return missing_value(flag);
                raw.task_id = args[++i];
            } else if (flag == "--spool-dir") {
                if (!has_value) return missing_value(flag);
                raw.spool_dir = args[++i];
            } else if (flag == "--verbose") {
                raw.verbose = true;
            } else {
                return UploadError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
        }

        // 3. Validator Phase
        if (!raw.name.has_value() || raw.name->empty()) {
            return UploadError{ErrorCategory::Input, "Must provide --name", "missing_required_flag",
                               "Name the artifact bucket, e.g. --name junit"};
        }

        CliOptions opts;
        opts.name = raw.name.value();
        opts.instruction.paths = std::move(raw.paths);
        opts.instruction.type = raw.type.value_or("");
        opts.instruction.format = raw.format.value_or("");
        opts.verbose = raw.verbose;

        if (raw.task_id) {
            if (raw.task_id->empty()) {
                return UploadError{ErrorCategory::Input, "--task-id must not be empty", "invalid_value"};
            }
            opts.task_id = raw.task_id.value();
        }

        opts.spool_directory = raw.spool_dir ? std::filesystem::path(raw.spool_dir.value())
                                             : default_spool_directory();

        // Path validation
        if (raw.working_dir) {
            std::filesystem::path p(raw.working_dir.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return UploadError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return UploadError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            opts.working_directory = std::move(canonical_path);
        }

        return opts;
    }

} // namespace uploader::app::cli

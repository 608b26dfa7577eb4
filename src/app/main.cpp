#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include "app/cli_parser.hpp"
#include "core/config/task_token.hpp"
#include "core/config/upload_settings.hpp"
#include "core/errors/upload_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/artifact_pipeline.hpp"
#include "transport/spool_service_client.hpp"
#include "upload/progress_sink.hpp"

int main(int argc, char* argv[]) {
    // 1. Register a bootstrap token with the global logger until the task id is known
    uploader::core::logging::Logger::get().set_task_id(
        uploader::core::config::generate_task_token());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = uploader::app::cli::parse_and_validate(argc, argv);
    if (uploader::core::errors::is_error(parsed)) {
        const auto& err = uploader::core::errors::get_error(parsed);
        UPLOADER_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            UPLOADER_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& opts = uploader::core::errors::get_value(parsed);
    if (opts.verbose) {
        uploader::core::logging::Logger::get().set_min_level(
            uploader::core::logging::LogLevel::DEBUG);
    }

    const std::string task_id =
        opts.task_id.value_or(uploader::core::config::generate_task_token());
    uploader::core::logging::Logger::get().set_task_id(task_id);

    // 3. Resolve CIRRUS_WORKING_DIR: flag, then environment, then current directory
    auto env = uploader::core::config::capture_environment();
    if (opts.working_directory) {
        env[uploader::core::config::kWorkingDirVariable] = opts.working_directory->string();
    } else if (env[uploader::core::config::kWorkingDirVariable].empty()) {
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            UPLOADER_LOG_ERROR("Failed to determine current directory: " + ec.message());
            return 2;
        }
        env[uploader::core::config::kWorkingDirVariable] = cwd.string();
    }
    UPLOADER_LOG_INFO("Working directory: " + env[uploader::core::config::kWorkingDirVariable]);
    UPLOADER_LOG_INFO("Spool directory: " + opts.spool_directory.string());

    // 4. Run the pipeline against the local spool
    uploader::transport::SpoolServiceClient client(opts.spool_directory);
    uploader::upload::StreamProgressSink progress(std::cout);
    const uploader::runtime::ArtifactPipeline pipeline(
        client, progress, uploader::protocol::TaskIdentification{task_id, ""});

    const auto outcome = pipeline.upload_artifacts(opts.name, opts.instruction, env);
    std::cout << std::endl;

    if (!outcome.succeeded) {
        const std::string code = outcome.error ? outcome.error->code : "unknown_error";
        UPLOADER_LOG_ERROR("Artifact upload failed [" + code + "] after " +
                           std::to_string(outcome.upload_attempts) + " attempt(s)");
        return 1;
    }

    UPLOADER_LOG_INFO("Final state: " + uploader::runtime::to_string(outcome.final_state) +
                      ", annotations reported: " +
                      std::to_string(outcome.annotations_reported));
    return 0;
}

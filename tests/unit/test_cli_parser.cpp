#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/upload_errors.hpp"

namespace {

using uploader::app::cli::CliOptions;
using uploader::app::cli::parse_and_validate;
using uploader::core::errors::ErrorCategory;
using uploader::core::errors::get_error;
using uploader::core::errors::get_value;
using uploader::core::errors::is_error;

uploader::core::errors::Result<CliOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("artifact_uploader");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"download"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenNameMissing) {
    auto result = parse_tokens({"upload", "--path", "build/*.xml"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"upload", "--name", "junit", "--path"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"upload", "--name", "junit", "--parallel"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenWorkingDirInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens(
        {"upload", "--name", "junit", "--working-dir", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesFullUploadRequest) {
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"upload", "--name", "junit", "--path", "build/*.xml",
                                "--path", "$OUT/**/*.xml", "--type", "text/xml",
                                "--format", "junit", "--working-dir", cwd.string(),
                                "--task-id", "42", "--spool-dir", "/tmp/spool",
                                "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& opts = get_value(result);
    EXPECT_EQ(opts.name, "junit");
    const std::vector<std::string> paths{"build/*.xml", "$OUT/**/*.xml"};
    EXPECT_EQ(opts.instruction.paths, paths);
    EXPECT_EQ(opts.instruction.type, "text/xml");
    EXPECT_EQ(opts.instruction.format, "junit");
    ASSERT_TRUE(opts.working_directory.has_value());
    EXPECT_EQ(opts.working_directory.value(), std::filesystem::canonical(cwd));
    ASSERT_TRUE(opts.task_id.has_value());
    EXPECT_EQ(opts.task_id.value(), "42");
    EXPECT_EQ(opts.spool_directory, std::filesystem::path("/tmp/spool"));
    EXPECT_TRUE(opts.verbose);
}

TEST(CliParserTest, AppliesDefaults) {
    auto result = parse_tokens({"upload", "--name", "logs"});
    ASSERT_FALSE(is_error(result));

    const auto& opts = get_value(result);
    EXPECT_TRUE(opts.instruction.paths.empty());
    EXPECT_TRUE(opts.instruction.format.empty());
    EXPECT_FALSE(opts.working_directory.has_value());
    EXPECT_FALSE(opts.task_id.has_value());
    EXPECT_EQ(opts.spool_directory.filename().string(), "artifact_uploader_spool");
    EXPECT_FALSE(opts.verbose);
}

}  // namespace

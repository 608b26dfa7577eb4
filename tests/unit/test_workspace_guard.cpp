#include <string>
#include <gtest/gtest.h>
#include "core/errors/upload_errors.hpp"
#include "policy/workspace_guard.hpp"

namespace {

using uploader::core::errors::ErrorCategory;
using uploader::core::errors::get_error;
using uploader::core::errors::get_value;
using uploader::core::errors::is_error;
using uploader::core::errors::is_path_outside_working_dir;
using uploader::policy::WorkspaceGuard;

TEST(WorkspaceGuardTest, AllowsPathInsideWorkingDir) {
    WorkspaceGuard guard("/repo");

    auto result = guard.validate_artifact_path("/repo/build/a.xml");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "/repo/build/a.xml");
}

TEST(WorkspaceGuardTest, RejectsPathOutsideWorkingDir) {
    WorkspaceGuard guard("/repo");

    auto result = guard.validate_artifact_path("/etc/passwd");
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_TRUE(is_path_outside_working_dir(err));
    EXPECT_EQ(err.message,
              "path is outside of CIRRUS_WORKING_DIR: path /etc/passwd should be relative to /repo");
}

TEST(WorkspaceGuardTest, RejectsSiblingWithSharedPrefix) {
    WorkspaceGuard guard("/repo");

    auto result = guard.validate_artifact_path("/repository/secret.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_TRUE(is_path_outside_working_dir(get_error(result)));
}

TEST(WorkspaceGuardTest, TrailingSlashOnWorkingDirIsIgnored) {
    WorkspaceGuard guard("/repo///");

    EXPECT_EQ(guard.working_dir(), "/repo");
    EXPECT_FALSE(is_error(guard.validate_artifact_path("/repo/out.log")));
}

TEST(WorkspaceGuardTest, WorkingDirWithGlobMetacharactersIsTakenLiterally) {
    WorkspaceGuard guard("/ci/build-[42]");

    EXPECT_FALSE(is_error(guard.validate_artifact_path("/ci/build-[42]/out.log")));
    auto result = guard.validate_artifact_path("/ci/build-4/out.log");
    ASSERT_TRUE(is_error(result));
    EXPECT_TRUE(is_path_outside_working_dir(get_error(result)));
}

TEST(WorkspaceGuardTest, NonCleanWorkingDirIsNormalized) {
    WorkspaceGuard dotdot("/repo/build/..");
    EXPECT_EQ(dotdot.working_dir(), "/repo");
    EXPECT_FALSE(is_error(dotdot.validate_artifact_path("/repo/build/a.xml")));

    WorkspaceGuard doubled("//repo/./out//");
    EXPECT_EQ(doubled.working_dir(), "/repo/out");
    EXPECT_FALSE(is_error(doubled.validate_artifact_path("/repo/out/run.log")));

    auto relative = dotdot.relative_artifact_path("/repo/build/a.xml");
    ASSERT_FALSE(is_error(relative));
    EXPECT_EQ(get_value(relative), "build/a.xml");
}

TEST(WorkspaceGuardTest, NormalizedWorkingDirStillRejectsEscapes) {
    WorkspaceGuard guard("/repo/build/..");

    auto result = guard.validate_artifact_path("/etc/passwd");
    ASSERT_TRUE(is_error(result));
    EXPECT_TRUE(is_path_outside_working_dir(get_error(result)));
}

TEST(WorkspaceGuardTest, EmptyWorkingDirIsAnInputError) {
    WorkspaceGuard guard("");

    auto result = guard.validate_artifact_path("/repo/a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_working_dir");
}

TEST(WorkspaceGuardTest, ComputesSlashSeparatedRelativePath) {
    WorkspaceGuard guard("/repo/");

    auto result = guard.relative_artifact_path("/repo/build/reports/a.xml");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "build/reports/a.xml");
}

} // namespace

#include <string>
#include <gtest/gtest.h>
#include "annotations/junit_parser.hpp"
#include "test_support.hpp"

namespace {

using uploader::annotations::JUnitParser;
using uploader::core::errors::ErrorCategory;
using uploader::core::errors::get_error;
using uploader::core::errors::get_value;
using uploader::core::errors::is_error;
using uploader::protocol::AnnotationLevel;
using uploader::protocol::AnnotationType;
using uploader::test_support::TempWorkspace;

TEST(JUnitParserTest, ConvertsFailuresAndErrorsToAnnotations) {
    TempWorkspace workspace("junit_parser");
    const auto report = workspace.write("report.xml", R"(<?xml version="1.0"?>
<testsuites>
  <testsuite name="pkg" file="src/pkg_test.py">
    <testcase classname="pkg.Suite" name="test_ok"/>
    <testcase classname="pkg.Suite" name="test_add" line="12">
      <failure message="expected 3, got 4">Traceback
  assert add(1, 2) == 3</failure>
    </testcase>
    <testcase classname="pkg.Suite" name="test_io" file="src/io_test.py" line="40">
      <error>IOError: disk full
more context</error>
    </testcase>
  </testsuite>
</testsuites>
)");

    JUnitParser parser;
    auto result = parser.parse(report);
    ASSERT_FALSE(is_error(result));
    const auto& annotations = get_value(result);
    ASSERT_EQ(annotations.size(), 2u);

    EXPECT_EQ(annotations[0].type, AnnotationType::TestResult);
    EXPECT_EQ(annotations[0].level, AnnotationLevel::Failure);
    EXPECT_EQ(annotations[0].message, "expected 3, got 4");
    EXPECT_EQ(annotations[0].fully_qualified_name, "pkg.Suite.test_add");
    EXPECT_EQ(annotations[0].raw_details, "Traceback\n  assert add(1, 2) == 3");
    ASSERT_TRUE(annotations[0].location.has_value());
    EXPECT_EQ(annotations[0].location->path, "src/pkg_test.py");
    EXPECT_EQ(annotations[0].location->start_line, 12);

    EXPECT_EQ(annotations[1].message, "IOError: disk full");
    ASSERT_TRUE(annotations[1].location.has_value());
    EXPECT_EQ(annotations[1].location->path, "src/io_test.py");
    EXPECT_EQ(annotations[1].location->start_line, 40);
}

TEST(JUnitParserTest, PassingSuiteYieldsNoAnnotations) {
    TempWorkspace workspace("junit_parser");
    const auto report = workspace.write(
        "ok.xml", "<testsuite name=\"s\"><testcase name=\"a\"/><testcase name=\"b\"/></testsuite>");

    JUnitParser parser;
    auto result = parser.parse(report);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).empty());
}

TEST(JUnitParserTest, FailureWithoutTextUsesFallbackMessageAndNoLocation) {
    TempWorkspace workspace("junit_parser");
    const auto report = workspace.write(
        "bare.xml", "<testsuite><testcase name=\"t\"><failure/></testcase></testsuite>");

    JUnitParser parser;
    auto result = parser.parse(report);
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).size(), 1u);
    EXPECT_EQ(get_value(result)[0].message, "Test failed");
    EXPECT_EQ(get_value(result)[0].fully_qualified_name, "t");
    EXPECT_FALSE(get_value(result)[0].location.has_value());
}

TEST(JUnitParserTest, MalformedXmlIsAParseError) {
    TempWorkspace workspace("junit_parser");
    const auto report = workspace.write("broken.xml", "<testsuite>\n<testcase></testsuite>");

    JUnitParser parser;
    auto result = parser.parse(report);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Parse);
    EXPECT_EQ(get_error(result).code, "junit_malformed");
}

TEST(JUnitParserTest, MissingFileIsAParseError) {
    TempWorkspace workspace("junit_parser");

    JUnitParser parser;
    auto result = parser.parse(workspace.root() / "absent.xml");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "junit_open_failed");
}

} // namespace

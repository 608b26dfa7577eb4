#include "annotations/junit_parser.hpp"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <expat.h>

namespace uploader::annotations {

using core::errors::ErrorCategory;
using core::errors::UploadError;
using protocol::Annotation;

namespace {

struct ParserDeleter {
    void operator()(XML_ParserStruct* parser) const { XML_ParserFree(parser); }
};

using ExpatParser = std::unique_ptr<XML_ParserStruct, ParserDeleter>;

struct TestCase {
    std::string name;
    std::string classname;
    std::string file;
    std::string line;
};

struct JUnitState {
    std::vector<Annotation> annotations;
    std::vector<std::string> suite_files;
    bool in_case = false;
    TestCase current;
    bool in_failure = false;
    std::string failure_message;
    std::string failure_body;
};

std::string attribute(const XML_Char** attrs, const char* key) {
    for (int i = 0; attrs[i] != nullptr && attrs[i + 1] != nullptr; i += 2) {
        if (std::strcmp(attrs[i], key) == 0) {
            return attrs[i + 1];
        }
    }
    return "";
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string first_line(const std::string& text) {
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        const std::string line = trim(text.substr(start, end - start));
        if (!line.empty()) {
            return line;
        }
        start = end + 1;
    }
    return "";
}

std::int64_t parse_line(const std::string& text) {
    std::int64_t line = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, line);
    if (ec != std::errc() || ptr != end) {
        return 0;
    }
    return line;
}

void XMLCALL on_start(void* user_data, const XML_Char* name, const XML_Char** attrs) {
    auto* state = static_cast<JUnitState*>(user_data);
    const std::string element(name);

    if (element == "testsuite") {
        std::string file = attribute(attrs, "file");
        if (file.empty() && !state->suite_files.empty()) {
            file = state->suite_files.back();
        }
        state->suite_files.push_back(file);
    } else if (element == "testcase") {
        state->in_case = true;
        state->current = TestCase{attribute(attrs, "name"), attribute(attrs, "classname"),
                                  attribute(attrs, "file"), attribute(attrs, "line")};
        if (state->current.file.empty() && !state->suite_files.empty()) {
            state->current.file = state->suite_files.back();
        }
    } else if (state->in_case && (element == "failure" || element == "error")) {
        state->in_failure = true;
        state->failure_message = attribute(attrs, "message");
        state->failure_body.clear();
    }
}

void XMLCALL on_end(void* user_data, const XML_Char* name) {
    auto* state = static_cast<JUnitState*>(user_data);
    const std::string element(name);

    if (element == "testsuite") {
        if (!state->suite_files.empty()) {
            state->suite_files.pop_back();
        }
    } else if (element == "testcase") {
        state->in_case = false;
    } else if (state->in_failure && (element == "failure" || element == "error")) {
        state->in_failure = false;

        Annotation annotation;
        annotation.type = protocol::AnnotationType::TestResult;
        annotation.level = protocol::AnnotationLevel::Failure;
        annotation.raw_details = trim(state->failure_body);
        annotation.message = trim(state->failure_message);
        if (annotation.message.empty()) {
            annotation.message = first_line(annotation.raw_details);
        }
        if (annotation.message.empty()) {
            annotation.message = "Test failed";
        }

        const auto& test_case = state->current;
        annotation.fully_qualified_name = test_case.classname.empty()
                                              ? test_case.name
                                              : test_case.classname + "." + test_case.name;
        if (!test_case.file.empty()) {
            protocol::FileLocation location;
            location.path = test_case.file;
            location.start_line = parse_line(test_case.line);
            location.end_line = location.start_line;
            annotation.location = location;
        }
        state->annotations.push_back(std::move(annotation));
    }
}

void XMLCALL on_text(void* user_data, const XML_Char* text, int length) {
    auto* state = static_cast<JUnitState*>(user_data);
    if (state->in_failure && length > 0) {
        state->failure_body.append(text, static_cast<std::size_t>(length));
    }
}

}  // namespace

core::errors::Result<std::vector<Annotation>> JUnitParser::parse(
    const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return UploadError{ErrorCategory::Parse,
                           "Failed to open JUnit report: " + path.string(),
                           "junit_open_failed"};
    }

    ExpatParser parser(XML_ParserCreate(nullptr));
    if (!parser) {
        return UploadError{ErrorCategory::Internal, "Failed to allocate XML parser.",
                           "xml_parser_alloc_failed"};
    }

    JUnitState state;
    XML_SetUserData(parser.get(), &state);
    XML_SetElementHandler(parser.get(), on_start, on_end);
    XML_SetCharacterDataHandler(parser.get(), on_text);

    constexpr std::size_t kReadSize = 64 * 1024;
    std::vector<char> buffer(kReadSize);
    while (true) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize read_bytes = in.gcount();
        if (in.bad()) {
            return UploadError{ErrorCategory::Parse,
                               "I/O error while reading JUnit report: " + path.string(),
                               "junit_read_failed"};
        }
        const bool done = in.eof() || read_bytes == 0;
        if (XML_Parse(parser.get(), buffer.data(), static_cast<int>(read_bytes),
                      done ? XML_TRUE : XML_FALSE) == XML_STATUS_ERROR) {
            return UploadError{
                ErrorCategory::Parse,
                "Malformed JUnit report " + path.string() + " at line " +
                    std::to_string(XML_GetCurrentLineNumber(parser.get())) + ": " +
                    XML_ErrorString(XML_GetErrorCode(parser.get())),
                "junit_malformed"};
        }
        if (done) {
            break;
        }
    }

    return state.annotations;
}

}  // namespace uploader::annotations

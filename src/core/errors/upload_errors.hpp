#pragma once
#include <string>
#include <variant>

namespace uploader::core::errors {

    // Typed error categories. Everything except Security, Cancelled and Input
    // is considered transient by the retry policies.
    enum class ErrorCategory {
        Input,       // E.g., missing CIRRUS_WORKING_DIR or a bad CLI flag
        Security,    // E.g., a glob matched a file outside the working dir
        Resolution,  // E.g., malformed glob or unreadable directory
        Transport,   // E.g., upload stream failed to open, send or close
        Read,        // E.g., artifact file vanished mid-read
        Parse,       // E.g., JUnit report is not well-formed XML
        Report,      // E.g., annotation report RPC rejected
        Cancelled,   // Caller's cancel token fired
        Internal
    };

    // The standardized error payload
    struct UploadError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    inline constexpr const char* kPathOutsideWorkingDirCode = "path_outside_working_dir";

    // A Result holds either a successful value of type T, OR an UploadError.
    template <typename T>
    using Result = std::variant<T, UploadError>;

    // Result for operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<UploadError>(result);
    }

    template <typename T>
    const UploadError& get_error(const Result<T>& result) {
        return std::get<UploadError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline bool is_path_outside_working_dir(const UploadError& error) {
        return error.category == ErrorCategory::Security &&
               error.code == kPathOutsideWorkingDirCode;
    }

    inline bool is_retryable(const UploadError& error) {
        switch (error.category) {
            case ErrorCategory::Security:
            case ErrorCategory::Cancelled:
            case ErrorCategory::Input:
                return false;
            default:
                return true;
        }
    }

    // Prefixes context onto the message, keeping category and code intact.
    inline UploadError wrap(UploadError error, const std::string& context) {
        error.message = context + ": " + error.message;
        return error;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Security:   return "security";
            case ErrorCategory::Resolution: return "resolution";
            case ErrorCategory::Transport:  return "transport";
            case ErrorCategory::Read:       return "read";
            case ErrorCategory::Parse:      return "parse";
            case ErrorCategory::Report:     return "report";
            case ErrorCategory::Cancelled:  return "cancelled";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace uploader::core::errors

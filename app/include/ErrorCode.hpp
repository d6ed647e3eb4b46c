#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

// Numbered error codes, grouped by area
enum class Code {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,

    // File system (1200-1299)
    FILE_NOT_FOUND = 1200,
    FILE_ACCESS_DENIED = 1201,
    FILE_OPEN_FAILED = 1202,
    FILE_READ_FAILED = 1203,
    FILE_WRITE_FAILED = 1204,
    FILE_DELETE_FAILED = 1205,
    FILE_COPY_FAILED = 1206,
    FILE_NAME_CONFLICT = 1207,
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_INVALID = 1211,

    // Validation (1600-1699)
    VALIDATION_INVALID_INPUT = 1600,
    VALIDATION_MISSING_ARGUMENT = 1601,
    VALIDATION_VALUE_OUT_OF_RANGE = 1602,

    // System (1700-1799)
    SYSTEM_CRYPTO_FAILURE = 1701,

    // Actions (1800-1899)
    ACTION_NOT_CONFIRMED = 1801
};

// Full description of an error: message, how to fix it, and where it happened
struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message with the context appended, suitable for the console
    std::string get_user_message() const {
        std::string result = message;
        if (!context.empty()) {
            result += " (" + context + ")";
        }
        return result;
    }

    // Everything including the numeric code
    std::string get_full_details() const {
        std::string result = "Error " + std::to_string(static_cast<int>(code)) + ": " + message;
        if (!context.empty()) {
            result += "\nDetails: " + context;
        }
        if (!resolution.empty()) {
            result += "\nResolution: " + resolution;
        }
        return result;
    }
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP

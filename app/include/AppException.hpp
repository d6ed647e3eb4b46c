#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace ErrorCodes {

// Application exception with error code support
class AppException : public std::runtime_error {
public:
    // Constructor with error code and optional context
    explicit AppException(Code code, const std::string& context = "")
        : std::runtime_error(ErrorCatalog::get_error_info(code, context).get_user_message()),
          error_code_(code),
          error_info_(ErrorCatalog::get_error_info(code, context)) {}

    // Constructor with error code and custom message (overrides catalog)
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : std::runtime_error(custom_message),
          error_code_(code),
          error_info_(code, custom_message, ErrorCatalog::get_error_info(code).resolution, context) {}

    Code get_error_code() const noexcept { return error_code_; }

    const ErrorInfo& get_error_info() const noexcept { return error_info_; }

    std::string get_user_message() const { return error_info_.get_user_message(); }

    std::string get_full_details() const { return error_info_.get_full_details(); }

    int get_error_code_int() const noexcept { return static_cast<int>(error_code_); }

private:
    Code error_code_;
    ErrorInfo error_info_;
};

// Stat, open or read failure on one specific path
class AccessError : public AppException {
public:
    AccessError(Code code, std::string path, std::error_code cause = {})
        : AppException(code, describe(path, cause)),
          path_(std::move(path)),
          cause_(cause) {}

    const std::string& path() const noexcept { return path_; }

    // Empty when the failure did not come from the OS
    const std::error_code& cause() const noexcept { return cause_; }

    // Pick the catalog code that matches an OS error
    static Code code_for(const std::error_code& ec, Code fallback = Code::FILE_READ_FAILED) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Code::FILE_NOT_FOUND;
        }
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
            return Code::FILE_ACCESS_DENIED;
        }
        return fallback;
    }

private:
    static std::string describe(const std::string& path, const std::error_code& cause) {
        if (!cause) {
            return path;
        }
        return path + ": " + cause.message();
    }

    std::string path_;
    std::error_code cause_;
};

// A root path handed to the engine is missing or not a directory
class NotFoundError : public AppException {
public:
    NotFoundError(Code code, std::string path)
        : AppException(code, path),
          path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

} // namespace ErrorCodes

// Convenience macro for throwing with automatic context
#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

// Convenience macro for throwing with custom message
#define THROW_APP_ERROR_MSG(code, message, context) \
    throw ErrorCodes::AppException(code, message, context)

#endif // APPEXCEPTION_HPP

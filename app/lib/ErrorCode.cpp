#include "ErrorCode.hpp"

namespace ErrorCodes {

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::SUCCESS:
            return {code, "Operation completed successfully.", "", context};

        case Code::FILE_NOT_FOUND:
            return {code, "The file no longer exists.",
                    "The file may have been moved or deleted while the scan was running. Re-run the scan.",
                    context};
        case Code::FILE_ACCESS_DENIED:
            return {code, "Permission denied while accessing the file.",
                    "Check the file permissions or run with an account that can read it.",
                    context};
        case Code::FILE_OPEN_FAILED:
            return {code, "The file could not be opened.",
                    "Make sure the file is not locked by another program.",
                    context};
        case Code::FILE_READ_FAILED:
            return {code, "Reading the file failed.",
                    "Check the storage device for I/O errors and try again.",
                    context};
        case Code::FILE_WRITE_FAILED:
            return {code, "Writing the file failed.",
                    "Check free disk space and write permissions for the destination.",
                    context};
        case Code::FILE_DELETE_FAILED:
            return {code, "The file could not be deleted.",
                    "Check that the containing directory is writable.",
                    context};
        case Code::FILE_COPY_FAILED:
            return {code, "The file could not be copied.",
                    "Check free disk space and write permissions for the destination.",
                    context};
        case Code::FILE_NAME_CONFLICT:
            return {code, "Another file with the same name was already copied in this run.",
                    "Rename one of the files or copy them separately.",
                    context};
        case Code::DIRECTORY_NOT_FOUND:
            return {code, "The directory does not exist.",
                    "Check the path for typos.",
                    context};
        case Code::DIRECTORY_INVALID:
            return {code, "The path is not a directory.",
                    "Pass a directory, not a file.",
                    context};

        case Code::VALIDATION_INVALID_INPUT:
            return {code, "Invalid command line.",
                    "Run 'dupfinder --help' for usage.",
                    context};
        case Code::VALIDATION_MISSING_ARGUMENT:
            return {code, "A required argument is missing.",
                    "Run 'dupfinder --help' for usage.",
                    context};
        case Code::VALIDATION_VALUE_OUT_OF_RANGE:
            return {code, "A value is out of range.",
                    "Run 'dupfinder --help' for the accepted values.",
                    context};

        case Code::SYSTEM_CRYPTO_FAILURE:
            return {code, "The digest library reported an error.",
                    "Make sure the OpenSSL installation provides MD5.",
                    context};

        case Code::ACTION_NOT_CONFIRMED:
            return {code, "The operation was not confirmed.",
                    "Confirm the prompt or pass --yes.",
                    context};

        case Code::UNKNOWN_ERROR:
        default:
            return {code, "An unknown error occurred.",
                    "Check the log output for details.",
                    context};
    }
}

} // namespace ErrorCodes

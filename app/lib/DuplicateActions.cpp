#include "DuplicateActions.hpp"
#include "AppException.hpp"
#include "FileScanner.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

bool is_within(const fs::path& inner, const fs::path& outer)
{
    return std::mismatch(outer.begin(), outer.end(), inner.begin(), inner.end()).first == outer.end();
}

fs::path canonical_root(const std::string& root)
{
    FileScanner::validate_root(root);
    std::error_code ec;
    fs::path resolved = fs::canonical(Utils::utf8_to_path(root), ec);
    if (ec) {
        throw ErrorCodes::NotFoundError(ErrorCodes::Code::DIRECTORY_NOT_FOUND, root);
    }
    return resolved;
}

} // namespace

DuplicateActions::DuplicateActions()
    : logger(Logger::get_logger("core_logger"))
{
}


DeletionReport DuplicateActions::delete_files(const FileDescriptorList& files,
                                              const ConfirmationCallback& confirm) const
{
    DeletionReport report;
    if (files.empty()) {
        report.confirmed = true;
        return report;
    }
    if (!confirm || !confirm(files)) {
        if (logger) {
            logger->info("Deletion of {} file(s) was not confirmed; nothing removed", files.size());
        }
        return report;
    }
    report.confirmed = true;

    for (const auto& file : files) {
        std::error_code ec;
        const bool removed = fs::remove(Utils::utf8_to_path(file->path()), ec);
        if (ec || !removed) {
            const std::string cause = ec ? ec.message()
                : ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::FILE_NOT_FOUND).message;
            if (logger) {
                logger->error("Failed to delete '{}': {}", file->path(), cause);
            }
            report.failures.push_back(ActionFailure{file->path(), cause, ErrorCodes::Code::FILE_DELETE_FAILED});
            continue;
        }
        if (logger) {
            logger->info("Deleted '{}'", file->path());
        }
        report.freed_bytes += file->size();
        report.deleted.push_back(file);
    }
    return report;
}


void DuplicateActions::ensure_disjoint_roots(const std::string& dir_a, const std::string& dir_b)
{
    const fs::path root_a = canonical_root(dir_a);
    const fs::path root_b = canonical_root(dir_b);
    if (is_within(root_b, root_a) || is_within(root_a, root_b)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_INVALID_INPUT,
                            "'" + dir_a + "' and '" + dir_b + "' overlap; their files would match themselves",
                            "delete-duplicates");
    }
}


CopyReport DuplicateActions::copy_unique(const FileDescriptorList& files,
                                         const std::string& destination_dir) const
{
    FileScanner::validate_root(destination_dir);

    CopyReport report;
    const fs::path base = Utils::utf8_to_path(destination_dir);
    // First source to claim each destination name in this batch
    std::unordered_map<std::string, std::string> claimed_names;
    for (const auto& file : files) {
        const std::string destination = Utils::path_to_utf8(base / Utils::utf8_to_path(file->name()));

        const auto [claim, first_claim] = claimed_names.emplace(file->name(), file->path());
        if (!first_claim) {
            const std::string cause = "same name as '" + claim->second + "'";
            if (logger) {
                logger->warn("Not copying '{}' to '{}': {}", file->path(), destination, cause);
            }
            report.failures.push_back(ActionFailure{file->path(), cause, ErrorCodes::Code::FILE_NAME_CONFLICT});
            continue;
        }

        std::error_code ec;
        if (fs::exists(Utils::utf8_to_path(destination), ec)) {
            const auto existing_time = fs::last_write_time(Utils::utf8_to_path(destination), ec);
            if (ec) {
                report.failures.push_back(ActionFailure{destination, ec.message(), ErrorCodes::Code::FILE_COPY_FAILED});
                continue;
            }
            // Only a strictly newer source replaces an existing file
            if (existing_time >= file->modification_time()) {
                if (logger) {
                    logger->info("Skipping '{}': '{}' is as recent or newer", file->path(), destination);
                }
                report.skipped.push_back(file->path());
                continue;
            }
        } else if (ec) {
            report.failures.push_back(ActionFailure{destination, ec.message(), ErrorCodes::Code::FILE_COPY_FAILED});
            continue;
        }

        copy_one(*file, destination, report);
    }
    return report;
}


void DuplicateActions::copy_one(const FileDescriptor& file,
                                const std::string& destination_path,
                                CopyReport& report) const
{
    const fs::path source = Utils::utf8_to_path(file.path());
    const fs::path destination = Utils::utf8_to_path(destination_path);

    std::error_code ec;
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        fs::last_write_time(destination, file.modification_time(), ec);
    }
    if (ec) {
        if (logger) {
            logger->error("Failed to copy '{}' to '{}': {}", file.path(), destination_path, ec.message());
        }
        report.failures.push_back(ActionFailure{file.path(), ec.message(), ErrorCodes::Code::FILE_COPY_FAILED});
        return;
    }

    if (logger) {
        logger->info("Copied '{}' to '{}'", file.path(), destination_path);
    }
    report.copied.push_back(file.path());
}

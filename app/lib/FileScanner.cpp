#include "FileScanner.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

using ErrorCodes::AccessError;
using ErrorCodes::Code;
using ErrorCodes::NotFoundError;

namespace {

TestHooks::ScanEntryProbe& scan_entry_probe_slot() {
    static TestHooks::ScanEntryProbe probe;
    return probe;
}

} // namespace

namespace TestHooks {

void set_scan_entry_probe(ScanEntryProbe probe) {
    scan_entry_probe_slot() = std::move(probe);
}

void reset_scan_entry_probe() {
    scan_entry_probe_slot() = ScanEntryProbe{};
}

} // namespace TestHooks

struct FileScanner::ScanContext {
    ScanOptions options;
    ScanResult result;
    std::shared_ptr<spdlog::logger> logger;
};


void FileScanner::validate_root(const std::string& root_path)
{
    if (Utils::is_valid_directory(root_path)) {
        return;
    }
    std::error_code ec;
    const bool exists = fs::exists(Utils::utf8_to_path(root_path), ec);
    throw NotFoundError(exists && !ec ? Code::DIRECTORY_INVALID : Code::DIRECTORY_NOT_FOUND, root_path);
}


ScanResult FileScanner::scan(const std::string& root_path, const ScanOptions& options) const
{
    auto logger = Logger::get_logger("core_logger");
    validate_root(root_path);

    if (logger) {
        logger->debug("Scanning '{}' (hidden: {}, skip junk: {})",
                      root_path, options.include_hidden, options.skip_junk);
    }

    ScanContext context;
    context.options = options;
    context.logger = logger;

    scan_directory(Utils::utf8_to_path(root_path), context);

    if (logger) {
        logger->info("Scan complete for '{}': {} file(s), {} skipped",
                     root_path, context.result.files.size(), context.result.errors.size());
    }
    return std::move(context.result);
}


void FileScanner::scan_directory(const fs::path& directory, ScanContext& context) const
{
    for (const auto& entry : list_sorted(directory, context)) {
        const fs::path& entry_path = entry.path();
        const std::string file_name = Utils::path_to_utf8(entry_path.filename());
        if (should_skip_entry(entry_path, file_name, context)) {
            continue;
        }

        std::error_code ec;
        // Directory symlinks are not descended, matching the default of the
        // standard recursive iterator
        if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
            scan_directory(entry_path, context);
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            if (ec) {
                record_error(context, entry_path, ec.message());
            }
            continue;
        }

        if (auto descriptor = build_descriptor(entry, context)) {
            context.result.files.push_back(std::move(*descriptor));
        }
    }
}


std::vector<fs::directory_entry> FileScanner::list_sorted(const fs::path& directory,
                                                          ScanContext& context) const
{
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        record_error(context, directory, ec.message());
        return entries;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        record_error(context, directory, ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& lhs, const fs::directory_entry& rhs) {
                  return lhs.path().filename() < rhs.path().filename();
              });
    return entries;
}


std::optional<FileDescriptorPtr> FileScanner::build_descriptor(const fs::directory_entry& entry,
                                                               ScanContext& context) const
{
    if (auto& probe = scan_entry_probe_slot()) {
        probe(entry.path());
    }

    try {
        return FileDescriptor::create(entry.path());
    } catch (const AccessError& ex) {
        const std::string cause = ex.cause() ? ex.cause().message() : ex.get_error_info().message;
        record_error(context, entry.path(), cause);
        return std::nullopt;
    }
}


bool FileScanner::should_skip_entry(const fs::path& entry_path,
                                    const std::string& file_name,
                                    const ScanContext& context) const
{
    if (context.options.skip_junk && is_junk_file(file_name)) {
        if (context.logger) {
            context.logger->trace("Skipping junk entry '{}'", Utils::path_to_utf8(entry_path));
        }
        return true;
    }

    if (!context.options.include_hidden && is_file_hidden(entry_path)) {
        if (context.logger) {
            context.logger->trace("Skipping hidden entry '{}'", Utils::path_to_utf8(entry_path));
        }
        return true;
    }

    return false;
}


void FileScanner::record_error(ScanContext& context, const fs::path& path, const std::string& cause)
{
    const std::string path_str = Utils::path_to_utf8(path);
    if (context.logger) {
        context.logger->warn("Skipping '{}': {}", path_str, cause);
    }
    context.result.errors.push_back(ScanError{path_str, cause});
}


bool FileScanner::is_file_hidden(const fs::path& path) const
{
    return Utils::path_to_utf8(path.filename()).starts_with(".");
}


bool FileScanner::is_junk_file(const std::string& name) const
{
    static const std::unordered_set<std::string> junk = {
        ".DS_Store", "Thumbs.db", "desktop.ini"
    };
    return junk.contains(name);
}

#include "DirectoryComparator.hpp"
#include "AppException.hpp"
#include "FileScanner.hpp"
#include "FingerprintBatch.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

DirectoryComparator::DirectoryComparator(FileScanner& scanner, ComparatorOptions options)
    : scanner(scanner),
      options(std::move(options)),
      logger(Logger::get_logger("core_logger"))
{
    this->options.worker_threads = std::max<std::size_t>(1, this->options.worker_threads);
}


ComparisonResult DirectoryComparator::compare(const std::string& path_a,
                                              const std::string& path_b) const
{
    FileScanner::validate_root(path_a);
    FileScanner::validate_root(path_b);

    ScanResult scan_a = scanner.scan(path_a, options.scan_options);
    ScanResult scan_b = scanner.scan(path_b, options.scan_options);

    ComparisonResult result = compare_files(scan_a.files, scan_b.files);
    result.scan_errors = std::move(scan_a.errors);
    result.scan_errors.insert(result.scan_errors.end(),
                              std::make_move_iterator(scan_b.errors.begin()),
                              std::make_move_iterator(scan_b.errors.end()));

    if (logger) {
        logger->info("Compared '{}' with '{}' ({}): {} duplicate(s), {} unique",
                     path_a, path_b, to_string(options.strategy),
                     result.duplicates.size(), result.unique.size());
    }
    return result;
}


ComparisonResult DirectoryComparator::compare_files(const FileDescriptorList& files_a,
                                                    const FileDescriptorList& files_b) const
{
    const FileDescriptorList candidates_a = hash_candidates(files_a, files_b);
    const FileDescriptorList candidates_b = hash_candidates(files_b, files_a);

    std::vector<FileDescriptor*> to_hash;
    to_hash.reserve(candidates_a.size() + candidates_b.size());
    for (const auto& file : candidates_a) {
        to_hash.push_back(file.get());
    }
    for (const auto& file : candidates_b) {
        to_hash.push_back(file.get());
    }

    try {
        compute_fingerprints(to_hash, FingerprintKind::Content, options.worker_threads);
    } catch (const ErrorCodes::AccessError& ex) {
        if (logger) {
            logger->error("Comparison aborted, '{}' could not be fingerprinted: {}", ex.path(), ex.what());
        }
        throw;
    }

    std::unordered_set<ContentKey, ContentKeyHash> members_of_a;
    members_of_a.reserve(candidates_a.size());
    for (const auto& file : candidates_a) {
        members_of_a.insert(content_key(*file));
    }

    const std::unordered_set<FileDescriptor*> hashed_b = [&candidates_b]() {
        std::unordered_set<FileDescriptor*> set;
        for (const auto& file : candidates_b) {
            set.insert(file.get());
        }
        return set;
    }();

    ComparisonResult result;
    for (const auto& file : files_b) {
        const bool duplicate = hashed_b.contains(file.get())
            && members_of_a.contains(content_key(*file));
        if (duplicate) {
            result.duplicates.push_back(file);
        } else {
            result.unique.push_back(file);
        }
    }
    return result;
}


FileDescriptorList DirectoryComparator::hash_candidates(const FileDescriptorList& files,
                                                        const FileDescriptorList& other) const
{
    if (options.strategy == CompareStrategy::FullHash) {
        return files;
    }

    std::unordered_set<std::uintmax_t> other_sizes;
    other_sizes.reserve(other.size());
    for (const auto& file : other) {
        other_sizes.insert(file->size());
    }

    FileDescriptorList candidates;
    std::copy_if(files.begin(), files.end(), std::back_inserter(candidates),
                 [&other_sizes](const FileDescriptorPtr& file) {
                     return other_sizes.contains(file->size());
                 });
    return candidates;
}

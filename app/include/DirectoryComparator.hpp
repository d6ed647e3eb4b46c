#ifndef DIRECTORY_COMPARATOR_HPP
#define DIRECTORY_COMPARATOR_HPP

#include "Types.hpp"

#include <cstddef>
#include <memory>
#include <string>

class FileScanner;
namespace spdlog { class logger; }

struct ComparatorOptions {
    CompareStrategy strategy{CompareStrategy::FullHash};
    std::size_t worker_threads{1};
    ScanOptions scan_options;
};

/**
 * @brief Splits the files of tree B into those whose content also exists in
 *        tree A and those that do not.
 *
 * Membership uses the (size, content fingerprint) key. With
 * CompareStrategy::FullHash every file of both trees is hashed. With
 * CompareStrategy::SizePrefilter only files whose size occurs in the other
 * tree are hashed; the partition is the same.
 */
class DirectoryComparator {
public:
    explicit DirectoryComparator(FileScanner& scanner, ComparatorOptions options = {});

    /**
     * @brief Validates both roots, scans them and partitions B.
     *
     * Throws ErrorCodes::NotFoundError before scanning when either root is
     * not a directory, and ErrorCodes::AccessError when a file cannot be
     * fingerprinted.
     */
    ComparisonResult compare(const std::string& path_a, const std::string& path_b) const;

    ComparisonResult compare_files(const FileDescriptorList& files_a,
                                   const FileDescriptorList& files_b) const;

private:
    FileDescriptorList hash_candidates(const FileDescriptorList& files,
                                       const FileDescriptorList& other) const;

    FileScanner& scanner;
    ComparatorOptions options;
    std::shared_ptr<spdlog::logger> logger;
};

#endif

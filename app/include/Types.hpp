#ifndef TYPES_HPP
#define TYPES_HPP

#include "FileDescriptor.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct ScanOptions {
    bool include_hidden{true};
    bool skip_junk{false};
};

// A file or directory the scanner had to leave out, and why
struct ScanError {
    std::string path;
    std::string cause;
};

struct ScanResult {
    FileDescriptorList files;
    std::vector<ScanError> errors;
};

/**
 * @brief Two or more files with equal size and equal content fingerprint.
 *
 * Members keep the order in which they were handed to the classifier.
 */
struct DuplicateGroup {
    std::string fingerprint;
    std::uintmax_t size{0};
    FileDescriptorList files;

    // Bytes that would be freed by keeping only one member
    std::uintmax_t wasted_bytes() const {
        return files.empty() ? 0 : size * (files.size() - 1);
    }
};

// Keyed by content fingerprint
using DuplicateGroups = std::map<std::string, DuplicateGroup>;

enum class CompareStrategy {
    FullHash,
    SizePrefilter
};

inline std::string to_string(CompareStrategy strategy) {
    switch (strategy) {
        case CompareStrategy::FullHash: return "full-hash";
        case CompareStrategy::SizePrefilter: return "size-prefilter";
        default: return "unknown";
    }
}

struct ComparisonResult {
    FileDescriptorList duplicates;
    FileDescriptorList unique;
    std::vector<ScanError> scan_errors;
};

#endif

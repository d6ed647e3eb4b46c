#ifndef DUPLICATE_CLASSIFIER_HPP
#define DUPLICATE_CLASSIFIER_HPP

#include "Types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace spdlog { class logger; }

struct ClassifierOptions {
    std::size_t worker_threads{1};
};

// Candidate counts after each stage of the last classify() call
struct ClassificationStats {
    std::size_t input_files{0};
    std::size_t after_size{0};
    std::size_t after_leading_bytes{0};
    std::size_t after_content{0};
    std::size_t content_hashes{0};
    std::size_t groups{0};
};

/**
 * @brief Partitions a file population into groups of identical content.
 *
 * Three stages, each looking only at the survivors of the previous one:
 * exact size, then the leading-bytes fingerprint, then the full content
 * fingerprint. Buckets with a single member are dropped after every stage,
 * so full-file hashing only runs on files that already match in size and
 * leading bytes.
 *
 * A read failure during stage 2 or 3 aborts the call with
 * ErrorCodes::AccessError; no partial result is returned.
 */
class DuplicateClassifier {
public:
    explicit DuplicateClassifier(ClassifierOptions options = {});

    DuplicateGroups classify(const FileDescriptorList& files);

    const ClassificationStats& last_stats() const { return stats; }

private:
    using IndexList = std::vector<std::size_t>;

    std::vector<IndexList> partition_by_size(const FileDescriptorList& files) const;
    std::vector<IndexList> partition_by_leading_bytes(const FileDescriptorList& files,
                                                      const std::vector<IndexList>& groups) const;
    DuplicateGroups partition_by_content(const FileDescriptorList& files,
                                         const std::vector<IndexList>& groups) const;

    static std::vector<FileDescriptor*> flatten(const FileDescriptorList& files,
                                                const std::vector<IndexList>& groups);
    static std::size_t count_members(const std::vector<IndexList>& groups);

    ClassifierOptions options;
    ClassificationStats stats;
    std::shared_ptr<spdlog::logger> logger;
};

#endif

#include "DuplicateClassifier.hpp"
#include "AppException.hpp"
#include "FingerprintBatch.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <map>
#include <string>

DuplicateClassifier::DuplicateClassifier(ClassifierOptions options)
    : options(options),
      logger(Logger::get_logger("core_logger"))
{
    this->options.worker_threads = std::max<std::size_t>(1, this->options.worker_threads);
}


DuplicateGroups DuplicateClassifier::classify(const FileDescriptorList& files)
{
    stats = ClassificationStats{};
    stats.input_files = files.size();

    const auto size_groups = partition_by_size(files);
    stats.after_size = count_members(size_groups);

    try {
        const auto leading_groups = partition_by_leading_bytes(files, size_groups);
        stats.after_leading_bytes = count_members(leading_groups);
        stats.content_hashes = stats.after_leading_bytes;

        DuplicateGroups groups = partition_by_content(files, leading_groups);
        stats.groups = groups.size();
        for (const auto& [fingerprint, group] : groups) {
            stats.after_content += group.files.size();
        }

        if (logger) {
            logger->debug("Classifier stages: {} input, {} after size, {} after leading bytes, {} after content",
                          stats.input_files, stats.after_size, stats.after_leading_bytes, stats.after_content);
            logger->info("Found {} duplicate group(s) among {} file(s)", stats.groups, stats.input_files);
        }
        return groups;
    } catch (const ErrorCodes::AccessError& ex) {
        if (logger) {
            logger->error("Classification aborted, '{}' could not be fingerprinted: {}", ex.path(), ex.what());
        }
        throw;
    }
}


std::vector<DuplicateClassifier::IndexList>
DuplicateClassifier::partition_by_size(const FileDescriptorList& files) const
{
    std::map<std::uintmax_t, IndexList> by_size;
    for (std::size_t i = 0; i < files.size(); ++i) {
        by_size[files[i]->size()].push_back(i);
    }

    std::vector<IndexList> survivors;
    for (auto& [size, members] : by_size) {
        if (members.size() > 1) {
            survivors.push_back(std::move(members));
        }
    }
    return survivors;
}


std::vector<DuplicateClassifier::IndexList>
DuplicateClassifier::partition_by_leading_bytes(const FileDescriptorList& files,
                                                const std::vector<IndexList>& groups) const
{
    compute_fingerprints(flatten(files, groups), FingerprintKind::LeadingBytes, options.worker_threads);

    std::vector<IndexList> survivors;
    for (const auto& group : groups) {
        std::map<std::string, IndexList> by_prefix;
        for (std::size_t index : group) {
            by_prefix[files[index]->leading_bytes()].push_back(index);
        }
        for (auto& [prefix, members] : by_prefix) {
            if (members.size() > 1) {
                survivors.push_back(std::move(members));
            }
        }
    }
    return survivors;
}


DuplicateGroups DuplicateClassifier::partition_by_content(const FileDescriptorList& files,
                                                          const std::vector<IndexList>& groups) const
{
    compute_fingerprints(flatten(files, groups), FingerprintKind::Content, options.worker_threads);

    DuplicateGroups result;
    for (const auto& group : groups) {
        std::map<std::string, IndexList> by_fingerprint;
        for (std::size_t index : group) {
            by_fingerprint[files[index]->content_fingerprint()].push_back(index);
        }
        for (const auto& [fingerprint, members] : by_fingerprint) {
            if (members.size() < 2) {
                continue;
            }
            DuplicateGroup duplicate_group;
            duplicate_group.fingerprint = fingerprint;
            duplicate_group.size = files[members.front()]->size();
            duplicate_group.files.reserve(members.size());
            for (std::size_t index : members) {
                duplicate_group.files.push_back(files[index]);
            }
            if (!result.emplace(fingerprint, std::move(duplicate_group)).second && logger) {
                logger->warn("Fingerprint {} seen for files of different sizes; keeping the first group",
                             fingerprint);
            }
        }
    }
    return result;
}


std::vector<FileDescriptor*> DuplicateClassifier::flatten(const FileDescriptorList& files,
                                                          const std::vector<IndexList>& groups)
{
    std::vector<FileDescriptor*> flat;
    flat.reserve(count_members(groups));
    for (const auto& group : groups) {
        for (std::size_t index : group) {
            flat.push_back(files[index].get());
        }
    }
    return flat;
}


std::size_t DuplicateClassifier::count_members(const std::vector<IndexList>& groups)
{
    std::size_t total = 0;
    for (const auto& group : groups) {
        total += group.size();
    }
    return total;
}

#ifndef FINGERPRINT_BATCH_HPP
#define FINGERPRINT_BATCH_HPP

#include "FileDescriptor.hpp"

#include <cstddef>
#include <vector>

enum class FingerprintKind {
    LeadingBytes,
    Content
};

/**
 * @brief Fills one fingerprint on every listed descriptor, on up to
 *        worker_threads threads.
 *
 * The error thrown is always the one of the lowest-indexed failing file.
 * With more than one worker the remaining files are still fingerprinted
 * and the error is rethrown only after every worker has finished.
 */
void compute_fingerprints(const std::vector<FileDescriptor*>& files,
                          FingerprintKind kind,
                          std::size_t worker_threads);

#endif

#include "FingerprintBatch.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>

namespace {

void compute_one(const FileDescriptor& file, FingerprintKind kind)
{
    if (kind == FingerprintKind::LeadingBytes) {
        file.leading_bytes();
    } else {
        file.content_fingerprint();
    }
}

} // namespace


void compute_fingerprints(const std::vector<FileDescriptor*>& files,
                          FingerprintKind kind,
                          std::size_t worker_threads)
{
    if (files.empty()) {
        return;
    }

    const std::size_t workers = std::clamp<std::size_t>(worker_threads, 1, files.size());
    if (workers == 1) {
        for (const FileDescriptor* file : files) {
            compute_one(*file, kind);
        }
        return;
    }

    std::atomic<std::size_t> next_index{0};
    std::mutex failure_mutex;
    std::size_t failed_index = files.size();
    std::exception_ptr failure;

    auto worker = [&]() {
        for (std::size_t i = next_index.fetch_add(1); i < files.size(); i = next_index.fetch_add(1)) {
            try {
                compute_one(*files[i], kind);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (i < failed_index) {
                    failed_index = i;
                    failure = std::current_exception();
                }
            }
        }
    };

    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        tasks.push_back(std::async(std::launch::async, worker));
    }
    for (auto& task : tasks) {
        task.get();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

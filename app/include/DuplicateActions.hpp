#ifndef DUPLICATE_ACTIONS_HPP
#define DUPLICATE_ACTIONS_HPP

#include "ErrorCode.hpp"
#include "FileDescriptor.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct ActionFailure {
    std::string path;
    std::string cause;
    ErrorCodes::Code code{ErrorCodes::Code::UNKNOWN_ERROR};
};

struct DeletionReport {
    bool confirmed{false};
    FileDescriptorList deleted;
    std::vector<ActionFailure> failures;
    std::uintmax_t freed_bytes{0};
};

struct CopyReport {
    std::vector<std::string> copied;
    std::vector<std::string> skipped;
    std::vector<ActionFailure> failures;
};

/**
 * @brief Deletion and copy operations driven by a comparison result.
 *
 * Nothing here prompts the user. Destructive operations take a confirmation
 * callback from the caller. Per-file failures are collected in the report and
 * do not stop the batch.
 */
class DuplicateActions {
public:
    using ConfirmationCallback = std::function<bool(const FileDescriptorList&)>;

    DuplicateActions();

    /**
     * @brief Deletes every listed file after confirm(files) returned true.
     *
     * An empty callback counts as "not confirmed".
     */
    DeletionReport delete_files(const FileDescriptorList& files,
                                const ConfirmationCallback& confirm) const;

    /**
     * @brief Throws ErrorCodes::AppException (VALIDATION_INVALID_INPUT) when
     *        one directory is the other or lies inside it.
     *
     * In that case files of dir_b are matched by themselves, and deleting
     * them would remove the only copy. Missing roots throw
     * ErrorCodes::NotFoundError.
     */
    static void ensure_disjoint_roots(const std::string& dir_a, const std::string& dir_b);

    /**
     * @brief Copies each file to destination_dir/<name>.
     *
     * A file is skipped when the destination already holds a same-named file
     * whose modification time is equal to or later than the source's. Copies
     * keep the source modification time. When several files share a name,
     * only the first one is considered; the others are reported as
     * FILE_NAME_CONFLICT failures. Throws ErrorCodes::NotFoundError when
     * destination_dir is not a directory.
     */
    CopyReport copy_unique(const FileDescriptorList& files,
                           const std::string& destination_dir) const;

private:
    void copy_one(const FileDescriptor& file,
                  const std::string& destination_path,
                  CopyReport& report) const;

    std::shared_ptr<spdlog::logger> logger;
};

#endif

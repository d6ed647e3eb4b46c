#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

namespace fs = std::filesystem;

class FileScanner {
public:
    FileScanner() = default;

    /**
     * @brief Recursively collects the regular files below root_path.
     *
     * Throws ErrorCodes::NotFoundError when root_path is missing or not a
     * directory. Files and subdirectories that cannot be read are reported in
     * ScanResult::errors and skipped; they never abort the walk.
     */
    ScanResult scan(const std::string& root_path, const ScanOptions& options = {}) const;

    static void validate_root(const std::string& root_path);

private:
    struct ScanContext;
    void scan_directory(const fs::path& directory, ScanContext& context) const;
    std::vector<fs::directory_entry> list_sorted(const fs::path& directory,
                                                 ScanContext& context) const;
    std::optional<FileDescriptorPtr> build_descriptor(const fs::directory_entry& entry,
                                                      ScanContext& context) const;
    bool should_skip_entry(const fs::path& entry_path,
                           const std::string& file_name,
                           const ScanContext& context) const;
    static void record_error(ScanContext& context, const fs::path& path, const std::string& cause);
    bool is_file_hidden(const fs::path& path) const;
    bool is_junk_file(const std::string& name) const;
};

#endif

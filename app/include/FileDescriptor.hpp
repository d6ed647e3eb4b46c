#ifndef FILE_DESCRIPTOR_HPP
#define FILE_DESCRIPTOR_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class FileDescriptor;
using FileDescriptorPtr = std::shared_ptr<FileDescriptor>;
using FileDescriptorList = std::vector<FileDescriptorPtr>;

/**
 * @brief Metadata of one regular file captured at scan time, plus two lazily
 *        computed content fingerprints.
 *
 * Size and modification time are read once by create(). The leading-bytes
 * and content fingerprints are filled on first access, at most once per
 * instance, and are never changed afterwards. A failed computation leaves
 * the field unset and throws ErrorCodes::AccessError.
 */
class FileDescriptor {
public:
    static constexpr std::size_t kLeadingBytesCount = 5;
    static constexpr std::size_t kReadChunkSize = 4096;

    /**
     * @brief Stats the path. Throws ErrorCodes::AccessError when it cannot.
     */
    static FileDescriptorPtr create(const std::filesystem::path& path);

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    const std::string& path() const noexcept { return path_; }
    const std::string& name() const noexcept { return name_; }
    std::uintmax_t size() const noexcept { return size_; }
    std::filesystem::file_time_type modification_time() const noexcept { return modification_time_; }

    /**
     * @brief Hex encoding of the first kLeadingBytesCount bytes (fewer for
     *        shorter files, empty for empty files).
     */
    std::string leading_bytes() const;

    /**
     * @brief Lowercase hex MD5 of the whole file, streamed in kReadChunkSize chunks.
     */
    std::string content_fingerprint() const;

    bool has_leading_bytes() const;
    bool has_content_fingerprint() const;

private:
    FileDescriptor(std::string path, std::string name, std::uintmax_t size,
                   std::filesystem::file_time_type modification_time);

    std::string read_leading_bytes() const;
    std::string compute_content_fingerprint() const;

    std::string path_;
    std::string name_;
    std::uintmax_t size_;
    std::filesystem::file_time_type modification_time_;

    mutable std::mutex leading_mutex_;
    mutable std::optional<std::string> leading_bytes_;
    mutable std::mutex content_mutex_;
    mutable std::optional<std::string> content_fingerprint_;
};

/**
 * @brief Key used for hash-based collections: only size and content fingerprint.
 */
struct ContentKey {
    std::uintmax_t size{0};
    std::string fingerprint;

    bool operator==(const ContentKey& other) const
    {
        return size == other.size && fingerprint == other.fingerprint;
    }
};

struct ContentKeyHash {
    std::size_t operator()(const ContentKey& key) const noexcept;
};

// Computes the content fingerprint if it is not cached yet
ContentKey content_key(const FileDescriptor& file);

// Equal size and equal content fingerprint; paths and names never take part
bool content_equal(const FileDescriptor& a, const FileDescriptor& b);

#endif

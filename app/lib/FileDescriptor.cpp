#include "FileDescriptor.hpp"
#include "AppException.hpp"
#include "ContentHasher.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <array>
#include <cerrno>
#include <fstream>
#include <functional>
#include <system_error>

using ErrorCodes::AccessError;
using ErrorCodes::Code;

namespace fs = std::filesystem;

namespace {

std::ifstream open_for_reading(const std::string& path)
{
    errno = 0;
    std::ifstream in(Utils::utf8_to_path(path), std::ios::binary);
    if (in.is_open()) {
        return in;
    }

    const int open_errno = errno;
    std::error_code ec;
    const fs::file_status status = fs::status(Utils::utf8_to_path(path), ec);
    if (!ec && fs::is_directory(status)) {
        ec = std::make_error_code(std::errc::is_a_directory);
    } else if (!ec && open_errno != 0) {
        ec = std::error_code(open_errno, std::generic_category());
    }
    throw AccessError(AccessError::code_for(ec, Code::FILE_OPEN_FAILED), path, ec);
}

}


FileDescriptorPtr FileDescriptor::create(const fs::path& path)
{
    std::error_code ec;
    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw AccessError(AccessError::code_for(ec), Utils::path_to_utf8(path), ec);
    }
    const fs::file_time_type mtime = fs::last_write_time(path, ec);
    if (ec) {
        throw AccessError(AccessError::code_for(ec), Utils::path_to_utf8(path), ec);
    }

    return FileDescriptorPtr(new FileDescriptor(Utils::path_to_utf8(path),
                                                Utils::path_to_utf8(path.filename()),
                                                size,
                                                mtime));
}


FileDescriptor::FileDescriptor(std::string path, std::string name, std::uintmax_t size,
                               fs::file_time_type modification_time)
    : path_(std::move(path)),
      name_(std::move(name)),
      size_(size),
      modification_time_(modification_time)
{
}


std::string FileDescriptor::leading_bytes() const
{
    std::lock_guard<std::mutex> lock(leading_mutex_);
    if (!leading_bytes_) {
        leading_bytes_ = read_leading_bytes();
    }
    return *leading_bytes_;
}


std::string FileDescriptor::content_fingerprint() const
{
    std::lock_guard<std::mutex> lock(content_mutex_);
    if (!content_fingerprint_) {
        content_fingerprint_ = compute_content_fingerprint();
    }
    return *content_fingerprint_;
}


bool FileDescriptor::has_leading_bytes() const
{
    std::lock_guard<std::mutex> lock(leading_mutex_);
    return leading_bytes_.has_value();
}


bool FileDescriptor::has_content_fingerprint() const
{
    std::lock_guard<std::mutex> lock(content_mutex_);
    return content_fingerprint_.has_value();
}


std::string FileDescriptor::read_leading_bytes() const
{
    std::ifstream in = open_for_reading(path_);
    std::array<unsigned char, kLeadingBytesCount> buffer{};
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (in.bad()) {
        throw AccessError(Code::FILE_READ_FAILED, path_);
    }
    // A short read is a shorter fingerprint, not an error
    const auto count = static_cast<std::size_t>(in.gcount());
    return Utils::to_hex(buffer.data(), count);
}


std::string FileDescriptor::compute_content_fingerprint() const
{
    std::ifstream in = open_for_reading(path_);
    ContentHasher hasher;
    std::array<char, kReadChunkSize> buffer{};
    std::uintmax_t total = 0;

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (in.bad()) {
            throw AccessError(Code::FILE_READ_FAILED, path_);
        }
        const auto count = static_cast<std::size_t>(in.gcount());
        hasher.update(buffer.data(), count);
        total += count;
    }

    if (total != size_) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("'{}' changed size since it was scanned ({} -> {} bytes)", path_, size_, total);
        }
    }
    return hasher.finalize_hex();
}


std::size_t ContentKeyHash::operator()(const ContentKey& key) const noexcept
{
    const std::size_t h1 = std::hash<std::uintmax_t>{}(key.size);
    const std::size_t h2 = std::hash<std::string>{}(key.fingerprint);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}


ContentKey content_key(const FileDescriptor& file)
{
    return ContentKey{file.size(), file.content_fingerprint()};
}


bool content_equal(const FileDescriptor& a, const FileDescriptor& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    return a.content_fingerprint() == b.content_fingerprint();
}

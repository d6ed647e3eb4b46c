#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

class Utils {
public:
    static std::filesystem::path utf8_to_path(const std::string& value);
    static std::string path_to_utf8(const std::filesystem::path& path);

    static bool is_valid_directory(const std::string& path);

    /**
     * @brief Formats a byte count with binary units, e.g. "512 B", "1.5 KiB".
     */
    static std::string format_size(std::uintmax_t bytes);

    static std::string to_hex(const unsigned char* bytes, std::size_t count);

    static std::string format_file_time(std::filesystem::file_time_type time);
};

#endif

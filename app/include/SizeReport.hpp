#ifndef SIZE_REPORT_HPP
#define SIZE_REPORT_HPP

#include "FileDescriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct CategoryTotal {
    std::string category;
    std::size_t file_count{0};
    std::uintmax_t total_bytes{0};
};

struct SizeBreakdown {
    std::vector<CategoryTotal> categories;
    std::size_t total_files{0};
    std::uintmax_t total_bytes{0};
};

class SizeReport {
public:
    // Categories with files only, largest total first
    static SizeBreakdown build(const FileDescriptorList& files);

    // Images, Videos, Audio, Documents, Archives, Code or Other, by extension
    static std::string category_for(const std::string& path);
};

#endif

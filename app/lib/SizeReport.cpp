#include "SizeReport.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <map>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string>& extension_categories()
{
    static const std::unordered_map<std::string, std::string> categories = [] {
        std::unordered_map<std::string, std::string> map;
        const auto add = [&map](const char* category, std::initializer_list<const char*> extensions) {
            for (const char* ext : extensions) {
                map.emplace(ext, category);
            }
        };
        add("Images", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tif", ".tiff", ".webp",
                       ".heic", ".svg", ".raw", ".cr2", ".nef", ".ico"});
        add("Videos", {".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm", ".m4v",
                       ".mpg", ".mpeg", ".3gp"});
        add("Audio", {".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a", ".wma", ".opus", ".aiff"});
        add("Documents", {".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".odt",
                          ".ods", ".odp", ".txt", ".rtf", ".md", ".csv", ".epub"});
        add("Archives", {".zip", ".rar", ".7z", ".tar", ".gz", ".bz2", ".xz", ".zst", ".tgz",
                         ".iso", ".dmg"});
        add("Code", {".c", ".cc", ".cpp", ".h", ".hpp", ".py", ".js", ".ts", ".java", ".go",
                     ".rs", ".rb", ".php", ".sh", ".html", ".css", ".json", ".xml", ".yml",
                     ".yaml", ".toml", ".ini", ".cmake"});
        return map;
    }();
    return categories;
}

} // namespace


std::string SizeReport::category_for(const std::string& path)
{
    std::string ext = Utils::path_to_utf8(Utils::utf8_to_path(path).extension());
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    const auto& categories = extension_categories();
    const auto it = categories.find(ext);
    return it != categories.end() ? it->second : "Other";
}


SizeBreakdown SizeReport::build(const FileDescriptorList& files)
{
    std::map<std::string, CategoryTotal> totals;
    SizeBreakdown breakdown;
    for (const auto& file : files) {
        const std::string category = category_for(file->path());
        auto& total = totals[category];
        total.category = category;
        total.file_count += 1;
        total.total_bytes += file->size();
        breakdown.total_files += 1;
        breakdown.total_bytes += file->size();
    }

    breakdown.categories.reserve(totals.size());
    for (auto& [name, total] : totals) {
        breakdown.categories.push_back(std::move(total));
    }
    std::sort(breakdown.categories.begin(), breakdown.categories.end(),
              [](const CategoryTotal& lhs, const CategoryTotal& rhs) {
                  if (lhs.total_bytes != rhs.total_bytes) {
                      return lhs.total_bytes > rhs.total_bytes;
                  }
                  return lhs.category < rhs.category;
              });
    return breakdown;
}

#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <filesystem>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    bool get_include_hidden() const;
    void set_include_hidden(bool value);

    bool get_skip_junk_files() const;
    void set_skip_junk_files(bool value);

    std::size_t get_worker_threads() const;
    void set_worker_threads(long value);

    CompareStrategy get_compare_strategy() const;
    void set_compare_strategy(CompareStrategy value);

    std::string get_log_level() const;
    void set_log_level(const std::string& value);

    bool get_log_to_file() const;
    void set_log_to_file(bool value);

    ScanOptions get_scan_options() const;

    std::string define_config_path();
    std::string get_config_path() const;
    std::string get_config_dir() const;

    static std::optional<CompareStrategy> parse_compare_strategy(const std::string& value);

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    bool include_hidden{true};
    bool skip_junk_files{false};
    std::size_t worker_threads{1};
    CompareStrategy compare_strategy{CompareStrategy::FullHash};
    std::string log_level{"info"};
    bool log_to_file{false};
};

#endif

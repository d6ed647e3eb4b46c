#include "Settings.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::err) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

constexpr const char* kAppName = "dupfinder";
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = Utils::utf8_to_path(config_path).parent_path();
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv("DUPFINDER_CONFIG_DIR"); override_root && *override_root) {
        std::filesystem::path base = override_root;
        return Utils::path_to_utf8(base / kAppName / "config.ini");
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        std::filesystem::path base = xdg;
        return Utils::path_to_utf8(base / kAppName / "config.ini");
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/" + kAppName + "/config.ini";
    }
    return "config.ini";
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::string Settings::get_config_dir() const
{
    return Utils::path_to_utf8(config_dir);
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    include_hidden = config.getBool("Scan", "IncludeHidden", true);
    skip_junk_files = config.getBool("Scan", "SkipJunkFiles", false);

    if (auto threads = config.getInt("Engine", "WorkerThreads")) {
        set_worker_threads(*threads);
    }
    const std::string strategy_value = config.getValue("Engine", "CompareStrategy", "full-hash");
    if (auto strategy = parse_compare_strategy(strategy_value)) {
        compare_strategy = *strategy;
    } else {
        settings_log(spdlog::level::warn, "Unknown CompareStrategy '{}', using full-hash", strategy_value);
        compare_strategy = CompareStrategy::FullHash;
    }

    log_level = config.getValue("Logging", "Level", "info");
    log_to_file = config.getBool("Logging", "LogToFile", false);

    settings_log(spdlog::level::info,
                 "Loaded settings from '{}' (workers: {}, strategy: {}, hidden: {}, skip junk: {})",
                 config_path, worker_threads, to_string(compare_strategy), include_hidden, skip_junk_files);
    return true;
}


bool Settings::save()
{
    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
        return false;
    }

    config.setValue("Scan", "IncludeHidden", include_hidden ? "true" : "false");
    config.setValue("Scan", "SkipJunkFiles", skip_junk_files ? "true" : "false");
    config.setValue("Engine", "WorkerThreads", std::to_string(worker_threads));
    config.setValue("Engine", "CompareStrategy", to_string(compare_strategy));
    config.setValue("Logging", "Level", log_level);
    config.setValue("Logging", "LogToFile", log_to_file ? "true" : "false");

    return config.save(config_path);
}


std::optional<CompareStrategy> Settings::parse_compare_strategy(const std::string& value)
{
    if (value == "full-hash") {
        return CompareStrategy::FullHash;
    }
    if (value == "size-prefilter") {
        return CompareStrategy::SizePrefilter;
    }
    return std::nullopt;
}


bool Settings::get_include_hidden() const { return include_hidden; }
void Settings::set_include_hidden(bool value) { include_hidden = value; }

bool Settings::get_skip_junk_files() const { return skip_junk_files; }
void Settings::set_skip_junk_files(bool value) { skip_junk_files = value; }

std::size_t Settings::get_worker_threads() const { return worker_threads; }

void Settings::set_worker_threads(long value)
{
    if (value < 1) {
        settings_log(spdlog::level::warn, "WorkerThreads {} is below 1, using 1", value);
        value = 1;
    }
    worker_threads = static_cast<std::size_t>(value);
}

CompareStrategy Settings::get_compare_strategy() const { return compare_strategy; }
void Settings::set_compare_strategy(CompareStrategy value) { compare_strategy = value; }

std::string Settings::get_log_level() const { return log_level; }
void Settings::set_log_level(const std::string& value) { log_level = value; }

bool Settings::get_log_to_file() const { return log_to_file; }
void Settings::set_log_to_file(bool value) { log_to_file = value; }

ScanOptions Settings::get_scan_options() const
{
    ScanOptions options;
    options.include_hidden = include_hidden;
    options.skip_junk = skip_junk_files;
    return options;
}

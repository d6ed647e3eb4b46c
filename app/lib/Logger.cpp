#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr const char* kLoggerNames[] = {"core_logger", "cli_logger"};
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}

void Logger::setup_loggers(const LoggingOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (options.log_to_file) {
        const std::string log_dir = options.log_dir.empty() ? get_default_log_dir() : options.log_dir;
        std::filesystem::create_directories(Utils::utf8_to_path(log_dir));
        const std::filesystem::path log_file = Utils::utf8_to_path(log_dir) / "dupfinder.log";
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            Utils::path_to_utf8(log_file), kMaxLogFileSize, kMaxLogFiles));
    }

    const auto level = parse_level(options.level);
    for (const char* name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_level(const std::string& level_name)
{
    const auto level = parse_level(level_name);
    for (const char* name : kLoggerNames) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}


std::string Logger::get_default_log_dir()
{
    if (const char* state_home = std::getenv("XDG_STATE_HOME"); state_home && *state_home) {
        return std::string(state_home) + "/dupfinder/logs";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.local/state/dupfinder/logs";
    }
    return "logs";
}


spdlog::level::level_enum Logger::parse_level(const std::string& level_name)
{
    const auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && level_name != "off") {
        return spdlog::level::info;
    }
    return level;
}

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

struct LoggingOptions {
    std::string level{"info"};
    bool log_to_file{false};
    std::string log_dir;
};

class Logger {
public:
    /**
     * @brief Creates and registers core_logger and cli_logger.
     *
     * Every logger writes to stderr; when file logging is enabled a rotating
     * file sink in options.log_dir is attached as well. Calling this again
     * replaces the previously registered loggers.
     */
    static void setup_loggers(const LoggingOptions& options = {});

    /**
     * @brief Returns the registered logger or nullptr when loggers were not set up.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static void set_level(const std::string& level_name);

    static std::string get_default_log_dir();

private:
    static spdlog::level::level_enum parse_level(const std::string& level_name);
};

#endif

#include "AppException.hpp"
#include "CommandLine.hpp"
#include "DupFinderApp.hpp"
#include "Logger.hpp"
#include "Settings.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace {

constexpr int kUsageExitCode = 2;

bool initialize_loggers(const LoggingOptions& options)
{
    try {
        Logger::setup_loggers(options);
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

LoggingOptions logging_options_for(const Settings& settings, const CommandLineOptions& options)
{
    LoggingOptions logging;
    logging.level = settings.get_log_level();
    logging.log_to_file = options.log_to_file || settings.get_log_to_file();
    return logging;
}

} // namespace


int main(int argc, char **argv)
{
    CommandLineOptions options;
    try {
        options = CommandLine::parse(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        std::fprintf(stderr, "%s\n\n%s", ex.what(), CommandLine::usage().c_str());
        return kUsageExitCode;
    }

    Settings settings;
    const bool settings_loaded = settings.load();

    if (!initialize_loggers(logging_options_for(settings, options))) {
        return EXIT_FAILURE;
    }
    if (options.log_level) {
        Logger::set_level(*options.log_level);
    }
    auto logger = Logger::get_logger("cli_logger");
    if (logger && !settings_loaded) {
        logger->debug("No configuration at '{}', using defaults", settings.get_config_path());
    }

    try {
        DupFinderApp app(settings, std::cout, std::cin);
        return app.run(options);
    } catch (const ErrorCodes::AppException& ex) {
        if (logger) {
            logger->critical("{}", ex.get_full_details());
        } else {
            std::fprintf(stderr, "%s\n", ex.get_full_details().c_str());
        }
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (logger) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}

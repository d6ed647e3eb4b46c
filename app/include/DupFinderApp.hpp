#ifndef DUPFINDER_APP_HPP
#define DUPFINDER_APP_HPP

#include "CommandLine.hpp"
#include "DuplicateActions.hpp"
#include "FileScanner.hpp"

#include <istream>
#include <memory>
#include <ostream>

class Settings;
namespace spdlog { class logger; }

/**
 * @brief Runs one parsed command against the engine and prints the result.
 *
 * Confirmation for destructive commands is read from `in` unless the
 * command line carried --yes.
 */
class DupFinderApp {
public:
    DupFinderApp(Settings& settings, std::ostream& out, std::istream& in);

    int run(const CommandLineOptions& options);

private:
    int run_scan(const CommandLineOptions& options);
    int run_sizes(const CommandLineOptions& options);
    int run_compare(const CommandLineOptions& options);
    int run_delete_duplicates(const CommandLineOptions& options);
    int run_copy_unique(const CommandLineOptions& options);

    void apply_overrides(const CommandLineOptions& options);
    ComparisonResult compare(const CommandLineOptions& options);
    DuplicateActions::ConfirmationCallback make_confirmation(const CommandLineOptions& options,
                                                             const std::string& directory);

    Settings& settings;
    std::ostream& out;
    std::istream& in;
    FileScanner scanner;
    std::shared_ptr<spdlog::logger> logger;
};

#endif

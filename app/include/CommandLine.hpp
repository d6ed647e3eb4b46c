#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

enum class Command {
    Scan,
    Sizes,
    Compare,
    DeleteDuplicates,
    CopyUnique,
    Help,
    Version
};

struct CommandLineOptions {
    Command command{Command::Help};
    std::vector<std::string> paths;
    bool assume_yes{false};
    std::string json_output;
    std::optional<long> worker_threads;
    std::optional<CompareStrategy> strategy;
    bool no_hidden{false};
    bool skip_junk{false};
    std::optional<std::string> log_level;
    bool log_to_file{false};
};

class CommandLine {
public:
    /**
     * @brief Parses the arguments after the program name.
     *
     * Throws ErrorCodes::AppException (VALIDATION_*) on unknown commands,
     * unknown options, missing option values and wrong path counts.
     */
    static CommandLineOptions parse(const std::vector<std::string>& args);
    static CommandLineOptions parse(int argc, char** argv);

    static std::string usage();

private:
    static std::size_t expected_path_count(Command command);
};

#endif

#include "CommandLine.hpp"
#include "AppException.hpp"
#include "Settings.hpp"

#include <stdexcept>
#include <unordered_map>

using ErrorCodes::Code;

namespace {

const std::unordered_map<std::string, Command>& command_names()
{
    static const std::unordered_map<std::string, Command> names = {
        {"scan", Command::Scan},
        {"sizes", Command::Sizes},
        {"compare", Command::Compare},
        {"delete-duplicates", Command::DeleteDuplicates},
        {"copy-unique", Command::CopyUnique},
        {"help", Command::Help},
    };
    return names;
}

long parse_thread_count(const std::string& value)
{
    try {
        std::size_t consumed = 0;
        const long parsed = std::stol(value, &consumed);
        if (consumed == value.size() && parsed >= 1) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    THROW_APP_ERROR_MSG(Code::VALIDATION_VALUE_OUT_OF_RANGE,
                        "--threads expects a positive integer", "--threads " + value);
}

} // namespace


std::string CommandLine::usage()
{
    return
        "Usage: dupfinder <command> [options] <paths>\n"
        "\n"
        "Commands:\n"
        "  scan <dir>                        report duplicate files below <dir>\n"
        "  sizes <dir>                       size-by-category breakdown of <dir>\n"
        "  compare <dirA> <dirB>             split files of <dirB> into duplicates of <dirA> and unique\n"
        "  delete-duplicates <dirA> <dirB>   delete files of <dirB> that also exist in <dirA>\n"
        "  copy-unique <dirA> <dirB>         copy files unique to <dirB> into <dirA>\n"
        "\n"
        "Options:\n"
        "  --yes                     do not ask before deleting\n"
        "  --json <file>             also write the result as JSON\n"
        "  --threads <n>             fingerprint with n worker threads\n"
        "  --strategy <name>         compare strategy: full-hash or size-prefilter\n"
        "  --no-hidden               ignore dot-files and dot-directories\n"
        "  --skip-junk               ignore .DS_Store, Thumbs.db and desktop.ini\n"
        "  --log-level <level>       trace, debug, info, warn, err, critical or off\n"
        "  --log-file                also log to a rotating file\n"
        "  --help                    show this help\n"
        "  --version                 show the version\n";
}


CommandLineOptions CommandLine::parse(int argc, char** argv)
{
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}


CommandLineOptions CommandLine::parse(const std::vector<std::string>& args)
{
    CommandLineOptions options;
    bool have_command = false;

    const auto require_value = [&args](std::size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            THROW_APP_ERROR_MSG(Code::VALIDATION_MISSING_ARGUMENT,
                                args[i] + " expects a value", args[i]);
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.command = Command::Help;
            return options;
        }
        if (arg == "--version") {
            options.command = Command::Version;
            return options;
        }
        if (arg == "--yes" || arg == "-y") {
            options.assume_yes = true;
        } else if (arg == "--json") {
            options.json_output = require_value(i);
        } else if (arg == "--threads") {
            options.worker_threads = parse_thread_count(require_value(i));
        } else if (arg == "--strategy") {
            const std::string& value = require_value(i);
            options.strategy = Settings::parse_compare_strategy(value);
            if (!options.strategy) {
                THROW_APP_ERROR_MSG(Code::VALIDATION_VALUE_OUT_OF_RANGE,
                                    "Unknown strategy '" + value + "'", "--strategy " + value);
            }
        } else if (arg == "--no-hidden") {
            options.no_hidden = true;
        } else if (arg == "--skip-junk") {
            options.skip_junk = true;
        } else if (arg == "--log-level") {
            options.log_level = require_value(i);
        } else if (arg == "--log-file") {
            options.log_to_file = true;
        } else if (arg.starts_with("--")) {
            THROW_APP_ERROR_MSG(Code::VALIDATION_INVALID_INPUT, "Unknown option '" + arg + "'", arg);
        } else if (!have_command) {
            const auto it = command_names().find(arg);
            if (it == command_names().end()) {
                THROW_APP_ERROR_MSG(Code::VALIDATION_INVALID_INPUT, "Unknown command '" + arg + "'", arg);
            }
            options.command = it->second;
            have_command = true;
        } else {
            options.paths.push_back(arg);
        }
    }

    if (!have_command || options.command == Command::Help) {
        options.command = Command::Help;
        return options;
    }

    const std::size_t expected = expected_path_count(options.command);
    if (options.paths.size() != expected) {
        THROW_APP_ERROR_MSG(Code::VALIDATION_MISSING_ARGUMENT,
                            "Expected " + std::to_string(expected) + " path(s), got "
                                + std::to_string(options.paths.size()),
                            "command line");
    }
    return options;
}


std::size_t CommandLine::expected_path_count(Command command)
{
    switch (command) {
        case Command::Scan:
        case Command::Sizes:
            return 1;
        case Command::Compare:
        case Command::DeleteDuplicates:
        case Command::CopyUnique:
            return 2;
        default:
            return 0;
    }
}

#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "CommandLine.hpp"

#include <string>
#include <vector>

using ErrorCodes::Code;

namespace {

Code parse_error_code(const std::vector<std::string>& args) {
    try {
        CommandLine::parse(args);
    } catch (const ErrorCodes::AppException& ex) {
        return ex.get_error_code();
    }
    return Code::SUCCESS;
}

} // namespace

TEST_CASE("no arguments means help") {
    CHECK(CommandLine::parse(std::vector<std::string>{}).command == Command::Help);
    CHECK(CommandLine::parse({"help"}).command == Command::Help);
    CHECK(CommandLine::parse({"scan", "--help"}).command == Command::Help);
    CHECK(CommandLine::parse({"-h"}).command == Command::Help);
    CHECK(CommandLine::parse({"--version"}).command == Command::Version);
}

TEST_CASE("scan takes one directory") {
    const auto options = CommandLine::parse({"scan", "/data"});
    CHECK(options.command == Command::Scan);
    CHECK(options.paths == std::vector<std::string>{"/data"});
    CHECK_FALSE(options.assume_yes);
    CHECK(options.json_output.empty());
    CHECK_FALSE(options.worker_threads.has_value());
    CHECK_FALSE(options.strategy.has_value());
}

TEST_CASE("options may appear anywhere") {
    const auto options = CommandLine::parse({"--threads", "4", "compare", "/a", "--strategy",
                                             "size-prefilter", "/b", "--json", "out.json",
                                             "--no-hidden", "--skip-junk", "--log-level", "debug",
                                             "--log-file", "-y"});
    CHECK(options.command == Command::Compare);
    CHECK(options.paths == std::vector<std::string>{"/a", "/b"});
    CHECK(options.worker_threads == 4L);
    CHECK(options.strategy == CompareStrategy::SizePrefilter);
    CHECK(options.json_output == "out.json");
    CHECK(options.no_hidden);
    CHECK(options.skip_junk);
    CHECK(options.log_level == std::string("debug"));
    CHECK(options.log_to_file);
    CHECK(options.assume_yes);
}

TEST_CASE("every command is recognised") {
    CHECK(CommandLine::parse({"sizes", "/d"}).command == Command::Sizes);
    CHECK(CommandLine::parse({"delete-duplicates", "/a", "/b"}).command == Command::DeleteDuplicates);
    CHECK(CommandLine::parse({"copy-unique", "/a", "/b"}).command == Command::CopyUnique);
}

TEST_CASE("invalid command lines are rejected with a validation code") {
    CHECK(parse_error_code({"frobnicate", "/d"}) == Code::VALIDATION_INVALID_INPUT);
    CHECK(parse_error_code({"scan", "/d", "--bogus"}) == Code::VALIDATION_INVALID_INPUT);
    CHECK(parse_error_code({"scan"}) == Code::VALIDATION_MISSING_ARGUMENT);
    CHECK(parse_error_code({"scan", "/a", "/b"}) == Code::VALIDATION_MISSING_ARGUMENT);
    CHECK(parse_error_code({"compare", "/a"}) == Code::VALIDATION_MISSING_ARGUMENT);
    CHECK(parse_error_code({"scan", "/d", "--json"}) == Code::VALIDATION_MISSING_ARGUMENT);
    CHECK(parse_error_code({"scan", "/d", "--threads", "0"}) == Code::VALIDATION_VALUE_OUT_OF_RANGE);
    CHECK(parse_error_code({"scan", "/d", "--threads", "two"}) == Code::VALIDATION_VALUE_OUT_OF_RANGE);
    CHECK(parse_error_code({"compare", "/a", "/b", "--strategy", "fast"}) == Code::VALIDATION_VALUE_OUT_OF_RANGE);
}

TEST_CASE("usage lists every command") {
    const std::string usage = CommandLine::usage();
    for (const char* command : {"scan", "sizes", "compare", "delete-duplicates", "copy-unique"}) {
        CHECK(usage.find(command) != std::string::npos);
    }
}

#include "DupFinderApp.hpp"
#include "ConsoleReporter.hpp"
#include "DirectoryComparator.hpp"
#include "DuplicateClassifier.hpp"
#include "JsonReportWriter.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "SizeReport.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fmt/format.h>
#include <string>

DupFinderApp::DupFinderApp(Settings& settings, std::ostream& out, std::istream& in)
    : settings(settings),
      out(out),
      in(in),
      logger(Logger::get_logger("cli_logger"))
{
}


int DupFinderApp::run(const CommandLineOptions& options)
{
    apply_overrides(options);

    switch (options.command) {
        case Command::Scan: return run_scan(options);
        case Command::Sizes: return run_sizes(options);
        case Command::Compare: return run_compare(options);
        case Command::DeleteDuplicates: return run_delete_duplicates(options);
        case Command::CopyUnique: return run_copy_unique(options);
        case Command::Version:
            out << "dupfinder " << DUPFINDER_VERSION << "\n";
            return EXIT_SUCCESS;
        case Command::Help:
        default:
            out << CommandLine::usage();
            return EXIT_SUCCESS;
    }
}


void DupFinderApp::apply_overrides(const CommandLineOptions& options)
{
    if (options.worker_threads) {
        settings.set_worker_threads(*options.worker_threads);
    }
    if (options.strategy) {
        settings.set_compare_strategy(*options.strategy);
    }
    if (options.no_hidden) {
        settings.set_include_hidden(false);
    }
    if (options.skip_junk) {
        settings.set_skip_junk_files(true);
    }
}


int DupFinderApp::run_scan(const CommandLineOptions& options)
{
    const std::string& root = options.paths.at(0);
    ScanResult scan = scanner.scan(root, settings.get_scan_options());

    ConsoleReporter reporter(out);
    reporter.print_scan_errors(scan.errors);

    DuplicateClassifier classifier(ClassifierOptions{settings.get_worker_threads()});
    const DuplicateGroups groups = classifier.classify(scan.files);
    if (logger) {
        const auto& stats = classifier.last_stats();
        logger->debug("'{}': {} file(s), {} hashed in full", root, stats.input_files, stats.content_hashes);
    }

    reporter.print_duplicates(groups);
    if (!options.json_output.empty()) {
        JsonReportWriter::write_file(options.json_output,
                                     JsonReportWriter::duplicates_to_json(groups, scan.errors));
    }
    return EXIT_SUCCESS;
}


int DupFinderApp::run_sizes(const CommandLineOptions& options)
{
    ScanResult scan = scanner.scan(options.paths.at(0), settings.get_scan_options());

    ConsoleReporter reporter(out);
    reporter.print_scan_errors(scan.errors);

    const SizeBreakdown breakdown = SizeReport::build(scan.files);
    reporter.print_size_breakdown(breakdown);
    if (!options.json_output.empty()) {
        JsonReportWriter::write_file(options.json_output, JsonReportWriter::size_breakdown_to_json(breakdown));
    }
    return EXIT_SUCCESS;
}


ComparisonResult DupFinderApp::compare(const CommandLineOptions& options)
{
    ComparatorOptions comparator_options;
    comparator_options.strategy = settings.get_compare_strategy();
    comparator_options.worker_threads = settings.get_worker_threads();
    comparator_options.scan_options = settings.get_scan_options();

    DirectoryComparator comparator(scanner, comparator_options);
    ComparisonResult result = comparator.compare(options.paths.at(0), options.paths.at(1));

    ConsoleReporter reporter(out);
    reporter.print_scan_errors(result.scan_errors);
    return result;
}


int DupFinderApp::run_compare(const CommandLineOptions& options)
{
    const ComparisonResult result = compare(options);
    ConsoleReporter(out).print_comparison(result);
    if (!options.json_output.empty()) {
        JsonReportWriter::write_file(options.json_output, JsonReportWriter::comparison_to_json(result));
    }
    return EXIT_SUCCESS;
}


int DupFinderApp::run_delete_duplicates(const CommandLineOptions& options)
{
    DuplicateActions::ensure_disjoint_roots(options.paths.at(0), options.paths.at(1));
    const ComparisonResult result = compare(options);
    ConsoleReporter reporter(out);
    if (result.duplicates.empty()) {
        out << "No duplicates to delete.\n";
        return EXIT_SUCCESS;
    }

    DuplicateActions actions;
    const DeletionReport report = actions.delete_files(result.duplicates,
                                                       make_confirmation(options, options.paths.at(1)));
    reporter.print_deletion(report);
    return report.failures.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}


int DupFinderApp::run_copy_unique(const CommandLineOptions& options)
{
    const ComparisonResult result = compare(options);
    DuplicateActions actions;
    const CopyReport report = actions.copy_unique(result.unique, options.paths.at(0));
    ConsoleReporter(out).print_copy(report);
    return report.failures.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}


DuplicateActions::ConfirmationCallback
DupFinderApp::make_confirmation(const CommandLineOptions& options, const std::string& directory)
{
    if (options.assume_yes) {
        return [](const FileDescriptorList&) { return true; };
    }
    return [this, directory](const FileDescriptorList& files) {
        std::uintmax_t bytes = 0;
        for (const auto& file : files) {
            out << "  " << file->path() << "\n";
            bytes += file->size();
        }
        out << fmt::format("Delete these {} file(s) ({}) from '{}'? [y/N] ",
                           files.size(), Utils::format_size(bytes), directory);
        out.flush();

        std::string answer;
        if (!std::getline(in, answer)) {
            return false;
        }
        std::transform(answer.begin(), answer.end(), answer.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return answer == "y" || answer == "yes";
    };
}

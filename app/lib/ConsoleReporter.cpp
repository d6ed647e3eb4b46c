#include "ConsoleReporter.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

ConsoleReporter::ConsoleReporter(std::ostream& out)
    : out(out)
{
}


void ConsoleReporter::print_scan_errors(const std::vector<ScanError>& errors)
{
    for (const auto& error : errors) {
        out << fmt::format("skipped: {} ({})\n", error.path, error.cause);
    }
}


void ConsoleReporter::print_duplicates(const DuplicateGroups& groups)
{
    if (groups.empty()) {
        out << "No duplicate files found.\n";
        return;
    }

    std::uintmax_t wasted = 0;
    std::size_t files = 0;
    for (const auto& [fingerprint, group] : groups) {
        out << fmt::format("{} ({}, {} files)\n", fingerprint, Utils::format_size(group.size),
                           group.files.size());
        for (const auto& file : group.files) {
            out << fmt::format("  {}  [{}]\n", file->path(),
                               Utils::format_file_time(file->modification_time()));
        }
        wasted += group.wasted_bytes();
        files += group.files.size();
    }
    out << fmt::format("{} group(s), {} file(s), {} reclaimable\n",
                       groups.size(), files, Utils::format_size(wasted));
}


void ConsoleReporter::print_comparison(const ComparisonResult& result)
{
    out << fmt::format("Duplicates ({}):\n", result.duplicates.size());
    for (const auto& file : result.duplicates) {
        out << fmt::format("  {}\n", file->path());
    }
    out << fmt::format("Unique ({}):\n", result.unique.size());
    for (const auto& file : result.unique) {
        out << fmt::format("  {}\n", file->path());
    }
}


void ConsoleReporter::print_size_breakdown(const SizeBreakdown& breakdown)
{
    for (const auto& category : breakdown.categories) {
        const double share = breakdown.total_bytes == 0
            ? 0.0
            : 100.0 * static_cast<double>(category.total_bytes) / static_cast<double>(breakdown.total_bytes);
        out << fmt::format("{:<10} {:>8} file(s) {:>12} {:>6.1f}%\n",
                           category.category, category.file_count,
                           Utils::format_size(category.total_bytes), share);
    }
    out << fmt::format("{:<10} {:>8} file(s) {:>12}\n", "Total", breakdown.total_files,
                       Utils::format_size(breakdown.total_bytes));
}


void ConsoleReporter::print_deletion(const DeletionReport& report)
{
    if (!report.confirmed) {
        const auto info = ErrorCodes::ErrorCatalog::get_error_info(ErrorCodes::Code::ACTION_NOT_CONFIRMED);
        out << fmt::format("{} No files were removed.\n", info.message);
        return;
    }
    out << fmt::format("Deleted {} file(s), freed {}\n", report.deleted.size(),
                       Utils::format_size(report.freed_bytes));
    print_action_failures(report.failures);
}


void ConsoleReporter::print_copy(const CopyReport& report)
{
    for (const auto& path : report.skipped) {
        out << fmt::format("kept newer copy for: {}\n", path);
    }
    out << fmt::format("Copied {} file(s), skipped {}\n", report.copied.size(), report.skipped.size());
    print_action_failures(report.failures);
}


void ConsoleReporter::print_action_failures(const std::vector<ActionFailure>& failures)
{
    for (const auto& failure : failures) {
        out << fmt::format("failed: {} ({}, error {})\n", failure.path, failure.cause,
                           static_cast<int>(failure.code));
    }
}

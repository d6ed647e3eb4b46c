#ifndef CONSOLE_REPORTER_HPP
#define CONSOLE_REPORTER_HPP

#include "DuplicateActions.hpp"
#include "SizeReport.hpp"
#include "Types.hpp"

#include <ostream>
#include <vector>

// Plain-text rendering of engine results for the command line
class ConsoleReporter {
public:
    explicit ConsoleReporter(std::ostream& out);

    void print_scan_errors(const std::vector<ScanError>& errors);
    void print_duplicates(const DuplicateGroups& groups);
    void print_comparison(const ComparisonResult& result);
    void print_size_breakdown(const SizeBreakdown& breakdown);
    void print_deletion(const DeletionReport& report);
    void print_copy(const CopyReport& report);
    void print_action_failures(const std::vector<ActionFailure>& failures);

private:
    std::ostream& out;
};

#endif

#include <catch2/catch_test_macros.hpp>
#include "ConsoleReporter.hpp"
#include "DuplicateClassifier.hpp"
#include "FileScanner.hpp"
#include "TestHelpers.hpp"

#include <sstream>
#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("print_duplicates lists members and a summary") {
    TempDir temp_dir;
    const auto a = write_file(temp_dir.path() / "a.txt", "hello");
    const auto b = write_file(temp_dir.path() / "b.txt", "hello");

    FileScanner scanner;
    DuplicateClassifier classifier;
    const auto groups = classifier.classify(scanner.scan(temp_dir.path().string()).files);

    std::ostringstream out;
    ConsoleReporter(out).print_duplicates(groups);
    const std::string text = out.str();
    CHECK(contains(text, "5d41402abc4b2a76b9719d911017c592 (5 B, 2 files)"));
    CHECK(contains(text, "  " + a.string()));
    CHECK(contains(text, "  " + b.string()));
    CHECK(contains(text, "1 group(s), 2 file(s), 5 B reclaimable"));
}

TEST_CASE("print_duplicates reports when nothing was found") {
    std::ostringstream out;
    ConsoleReporter(out).print_duplicates({});
    CHECK(out.str() == "No duplicate files found.\n");
}

TEST_CASE("print_scan_errors names each skipped path") {
    std::ostringstream out;
    ConsoleReporter(out).print_scan_errors({{"/x/locked.bin", "Permission denied"}});
    CHECK(out.str() == "skipped: /x/locked.bin (Permission denied)\n");
}

TEST_CASE("print_comparison lists both partitions") {
    TempDir temp_dir;
    ComparisonResult result;
    result.duplicates.push_back(FileDescriptor::create(write_file(temp_dir.path() / "z.txt", "hello")));
    result.unique.push_back(FileDescriptor::create(write_file(temp_dir.path() / "w.bin", "unique")));

    std::ostringstream out;
    ConsoleReporter(out).print_comparison(result);
    const std::string text = out.str();
    CHECK(contains(text, "Duplicates (1):\n"));
    CHECK(contains(text, "Unique (1):\n"));
    CHECK(text.find("z.txt") < text.find("Unique"));
    CHECK(text.find("w.bin") > text.find("Unique"));
}

TEST_CASE("print_deletion distinguishes declined and completed runs") {
    std::ostringstream declined;
    ConsoleReporter(declined).print_deletion(DeletionReport{});
    CHECK(contains(declined.str(), "not confirmed"));
    CHECK(contains(declined.str(), "No files were removed."));

    DeletionReport done;
    done.confirmed = true;
    done.freed_bytes = 2048;
    done.failures.push_back(ActionFailure{"/b/stuck", "Permission denied", ErrorCodes::Code::FILE_DELETE_FAILED});
    std::ostringstream completed;
    ConsoleReporter(completed).print_deletion(done);
    CHECK(contains(completed.str(), "Deleted 0 file(s), freed 2.0 KiB"));
    CHECK(contains(completed.str(), "failed: /b/stuck (Permission denied, error 1205)"));
}

TEST_CASE("print_copy reports skipped files") {
    CopyReport report;
    report.copied = {"/b/new.txt"};
    report.skipped = {"/b/old.txt"};
    std::ostringstream out;
    ConsoleReporter(out).print_copy(report);
    CHECK(contains(out.str(), "kept newer copy for: /b/old.txt"));
    CHECK(contains(out.str(), "Copied 1 file(s), skipped 1"));
}

TEST_CASE("print_size_breakdown ends with a total line") {
    SizeBreakdown breakdown;
    breakdown.categories.push_back(CategoryTotal{"Images", 2, 1024});
    breakdown.total_files = 2;
    breakdown.total_bytes = 1024;
    std::ostringstream out;
    ConsoleReporter(out).print_size_breakdown(breakdown);
    CHECK(contains(out.str(), "Images"));
    CHECK(contains(out.str(), "100.0%"));
    CHECK(contains(out.str(), "Total"));
}

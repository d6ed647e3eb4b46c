#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "CommandLine.hpp"
#include "DupFinderApp.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct AppFixture {
    TempDir config_root;
    EnvVarGuard config_guard{"DUPFINDER_CONFIG_DIR", config_root.path().string()};
    TempDir dir_a;
    TempDir dir_b;
    Settings settings;
    std::ostringstream out;
    std::istringstream in;

    int run(const std::vector<std::string>& args, const std::string& input = "") {
        in.str(input);
        in.clear();
        DupFinderApp app(settings, out, in);
        return app.run(CommandLine::parse(args));
    }

    std::string a() const { return dir_a.path().string(); }
    std::string b() const { return dir_b.path().string(); }

    void populate() {
        write_file(dir_a.path() / "x.txt", "hello");
        write_file(dir_a.path() / "y.txt", "world!");
        write_file(dir_b.path() / "z.txt", "hello");
        write_file(dir_b.path() / "w.bin", "unique");
    }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("version and help print without touching the disk") {
    AppFixture fixture;
    CHECK(fixture.run({"--version"}) == EXIT_SUCCESS);
    CHECK(contains(fixture.out.str(), std::string("dupfinder ") + DUPFINDER_VERSION));

    fixture.out.str("");
    CHECK(fixture.run({}) == EXIT_SUCCESS);
    CHECK(contains(fixture.out.str(), "Usage: dupfinder"));
}

TEST_CASE("scan prints duplicate groups and writes JSON") {
    AppFixture fixture;
    write_file(fixture.dir_a.path() / "a.txt", "hello");
    write_file(fixture.dir_a.path() / "sub" / "b.txt", "hello");
    write_file(fixture.dir_a.path() / "c.txt", "world");
    const auto json_path = fixture.dir_b.path() / "report.json";

    REQUIRE(fixture.run({"scan", fixture.a(), "--json", json_path.string(), "--threads", "2"}) == EXIT_SUCCESS);
    CHECK(contains(fixture.out.str(), "1 group(s), 2 file(s)"));
    CHECK(fs::exists(json_path));
    CHECK(fixture.settings.get_worker_threads() == 2);
}

TEST_CASE("sizes prints a category breakdown") {
    AppFixture fixture;
    write_file(fixture.dir_a.path() / "photo.jpg", std::string(2048, 'p'));
    write_file(fixture.dir_a.path() / "notes.txt", "notes");

    REQUIRE(fixture.run({"sizes", fixture.a()}) == EXIT_SUCCESS);
    CHECK(contains(fixture.out.str(), "Images"));
    CHECK(contains(fixture.out.str(), "Documents"));
}

TEST_CASE("compare prints both partitions") {
    AppFixture fixture;
    fixture.populate();

    REQUIRE(fixture.run({"compare", fixture.a(), fixture.b(), "--strategy", "size-prefilter"}) == EXIT_SUCCESS);
    const std::string text = fixture.out.str();
    CHECK(contains(text, "Duplicates (1):"));
    CHECK(contains(text, (fixture.dir_b.path() / "z.txt").string()));
    CHECK(contains(text, "Unique (1):"));
    CHECK(fixture.settings.get_compare_strategy() == CompareStrategy::SizePrefilter);
}

TEST_CASE("delete-duplicates asks before deleting") {
    AppFixture fixture;
    fixture.populate();
    const auto duplicate = fixture.dir_b.path() / "z.txt";

    SECTION("declined") {
        REQUIRE(fixture.run({"delete-duplicates", fixture.a(), fixture.b()}, "n\n") == EXIT_SUCCESS);
        CHECK(contains(fixture.out.str(), "Delete these 1 file(s) (5 B)"));
        CHECK(contains(fixture.out.str(), "No files were removed."));
        CHECK(fs::exists(duplicate));
    }
    SECTION("no answer") {
        REQUIRE(fixture.run({"delete-duplicates", fixture.a(), fixture.b()}) == EXIT_SUCCESS);
        CHECK(fs::exists(duplicate));
    }
    SECTION("confirmed") {
        REQUIRE(fixture.run({"delete-duplicates", fixture.a(), fixture.b()}, "YES\n") == EXIT_SUCCESS);
        CHECK(contains(fixture.out.str(), "Deleted 1 file(s), freed 5 B"));
        CHECK_FALSE(fs::exists(duplicate));
        CHECK(fs::exists(fixture.dir_b.path() / "w.bin"));
        CHECK(fs::exists(fixture.dir_a.path() / "x.txt"));
    }
    SECTION("assumed with --yes") {
        REQUIRE(fixture.run({"delete-duplicates", fixture.a(), fixture.b(), "--yes"}) == EXIT_SUCCESS);
        CHECK_FALSE(contains(fixture.out.str(), "[y/N]"));
        CHECK_FALSE(fs::exists(duplicate));
    }
}

TEST_CASE("delete-duplicates refuses a B inside A and keeps every file") {
    AppFixture fixture;
    const auto keep = write_file(fixture.dir_a.path() / "keep.txt", "precious");
    const auto nested = write_file(fixture.dir_a.path() / "sub" / "precious.txt", "precious");
    const std::string inner = (fixture.dir_a.path() / "sub").string();

    SECTION("nested") {
        try {
            fixture.run({"delete-duplicates", fixture.a(), inner, "--yes"});
            FAIL("expected AppException");
        } catch (const ErrorCodes::AppException& ex) {
            CHECK(ex.get_error_code() == ErrorCodes::Code::VALIDATION_INVALID_INPUT);
        }
    }
    SECTION("same directory") {
        REQUIRE_THROWS_AS(fixture.run({"delete-duplicates", fixture.a(), fixture.a(), "--yes"}),
                          ErrorCodes::AppException);
    }
    CHECK(fs::exists(keep));
    CHECK(fs::exists(nested));
}

TEST_CASE("copy-unique reports files that share a name") {
    AppFixture fixture;
    write_file(fixture.dir_b.path() / "one" / "notes.txt", "first");
    write_file(fixture.dir_b.path() / "two" / "notes.txt", "second");

    CHECK(fixture.run({"copy-unique", fixture.a(), fixture.b()}) == EXIT_FAILURE);
    CHECK(read_file(fixture.dir_a.path() / "notes.txt") == "first");
    CHECK(contains(fixture.out.str(), "Copied 1 file(s), skipped 0"));
    CHECK(contains(fixture.out.str(), "error 1207"));
}

TEST_CASE("delete-duplicates with nothing to delete does not prompt") {
    AppFixture fixture;
    write_file(fixture.dir_b.path() / "only.txt", "solo");

    REQUIRE(fixture.run({"delete-duplicates", fixture.a(), fixture.b()}) == EXIT_SUCCESS);
    CHECK(contains(fixture.out.str(), "No duplicates to delete."));
}

TEST_CASE("copy-unique copies unique files of B into A") {
    AppFixture fixture;
    fixture.populate();

    REQUIRE(fixture.run({"copy-unique", fixture.a(), fixture.b()}) == EXIT_SUCCESS);
    CHECK(read_file(fixture.dir_a.path() / "w.bin") == "unique");
    CHECK_FALSE(fs::exists(fixture.dir_a.path() / "z.txt"));
    CHECK(contains(fixture.out.str(), "Copied 1 file(s), skipped 0"));
}

TEST_CASE("a missing directory surfaces as NotFoundError") {
    AppFixture fixture;
    const std::string missing = (fixture.dir_a.path() / "missing").string();
    REQUIRE_THROWS_AS(fixture.run({"scan", missing}), ErrorCodes::NotFoundError);
    REQUIRE_THROWS_AS(fixture.run({"compare", fixture.a(), missing}), ErrorCodes::NotFoundError);
}

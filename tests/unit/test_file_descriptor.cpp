#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "FileDescriptor.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>

TEST_CASE("create captures size, name and modification time") {
    TempDir temp_dir;
    const auto path = write_file(temp_dir.path() / "notes.txt", "hello world");

    const auto file = FileDescriptor::create(path);
    CHECK(file->path() == path.string());
    CHECK(file->name() == "notes.txt");
    CHECK(file->size() == 11);
    CHECK(file->modification_time() == std::filesystem::last_write_time(path));
    CHECK_FALSE(file->has_leading_bytes());
    CHECK_FALSE(file->has_content_fingerprint());
}

TEST_CASE("create on a missing path throws AccessError") {
    TempDir temp_dir;
    const auto missing = temp_dir.path() / "gone.bin";
    try {
        FileDescriptor::create(missing);
        FAIL("expected AccessError");
    } catch (const ErrorCodes::AccessError& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::FILE_NOT_FOUND);
        CHECK(ex.path() == missing.string());
    }
}

TEST_CASE("leading bytes cover at most five bytes") {
    TempDir temp_dir;
    const auto long_file = FileDescriptor::create(write_file(temp_dir.path() / "long.txt", "ABCDEFGH"));
    const auto short_file = FileDescriptor::create(write_file(temp_dir.path() / "short.txt", "AB"));
    const auto empty_file = FileDescriptor::create(write_file(temp_dir.path() / "empty.txt", ""));

    CHECK(long_file->leading_bytes() == "4142434445");
    CHECK(short_file->leading_bytes() == "4142");
    CHECK(empty_file->leading_bytes().empty());
    CHECK(empty_file->has_leading_bytes());
}

TEST_CASE("content fingerprint is the MD5 of the whole file") {
    TempDir temp_dir;
    const auto hello = FileDescriptor::create(write_file(temp_dir.path() / "hello.txt", "hello"));
    const auto empty = FileDescriptor::create(write_file(temp_dir.path() / "empty.txt", ""));

    CHECK(hello->content_fingerprint() == "5d41402abc4b2a76b9719d911017c592");
    CHECK(empty->content_fingerprint() == "d41d8cd98f00b204e9800998ecf8427e");
    CHECK(hello->has_content_fingerprint());
}

TEST_CASE("content fingerprint spans several read chunks") {
    TempDir temp_dir;
    std::string big(FileDescriptor::kReadChunkSize * 3 + 17, 'q');
    std::string other = big;
    other.back() = 'r';

    const auto a = FileDescriptor::create(write_file(temp_dir.path() / "a.bin", big));
    const auto b = FileDescriptor::create(write_file(temp_dir.path() / "b.bin", big));
    const auto c = FileDescriptor::create(write_file(temp_dir.path() / "c.bin", other));

    CHECK(a->content_fingerprint() == b->content_fingerprint());
    CHECK(a->content_fingerprint() != c->content_fingerprint());
    CHECK(a->leading_bytes() == c->leading_bytes());
}

TEST_CASE("fingerprints are computed once and then cached") {
    TempDir temp_dir;
    const auto path = write_file(temp_dir.path() / "cached.txt", "hello");
    const auto file = FileDescriptor::create(path);

    const std::string leading = file->leading_bytes();
    const std::string fingerprint = file->content_fingerprint();

    // The cached values survive the file disappearing
    std::filesystem::remove(path);
    CHECK(file->leading_bytes() == leading);
    CHECK(file->content_fingerprint() == fingerprint);
}

TEST_CASE("fingerprinting a vanished file throws and leaves the field unset") {
    TempDir temp_dir;
    const auto path = write_file(temp_dir.path() / "vanish.txt", "hello");
    const auto file = FileDescriptor::create(path);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(file->leading_bytes(), ErrorCodes::AccessError);
    REQUIRE_THROWS_AS(file->content_fingerprint(), ErrorCodes::AccessError);
    CHECK_FALSE(file->has_leading_bytes());
    CHECK_FALSE(file->has_content_fingerprint());

    // A later success fills the field
    write_file(path, "hello");
    CHECK(file->content_fingerprint() == "5d41402abc4b2a76b9719d911017c592");
}

TEST_CASE("open failures carry the OS cause of the missing file") {
    TempDir temp_dir;
    const auto path = write_file(temp_dir.path() / "gone.txt", "hello");
    const auto file = FileDescriptor::create(path);
    std::filesystem::remove(path);

    try {
        file->content_fingerprint();
        FAIL("expected AccessError");
    } catch (const ErrorCodes::AccessError& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::FILE_NOT_FOUND);
        CHECK(ex.cause() == std::errc::no_such_file_or_directory);
        CHECK(ex.path() == path.string());
    }
}

TEST_CASE("content equality ignores paths and names") {
    TempDir temp_dir;
    const auto a = FileDescriptor::create(write_file(temp_dir.path() / "one" / "a.txt", "same bytes"));
    const auto b = FileDescriptor::create(write_file(temp_dir.path() / "two" / "renamed.dat", "same bytes"));
    const auto c = FileDescriptor::create(write_file(temp_dir.path() / "c.txt", "other bytes"));
    const auto d = FileDescriptor::create(write_file(temp_dir.path() / "d.txt", "same byte"));

    CHECK(content_equal(*a, *b));
    CHECK(content_equal(*b, *a));
    CHECK(content_equal(*a, *a));
    CHECK_FALSE(content_equal(*a, *c));
    CHECK_FALSE(content_equal(*a, *d));
}

TEST_CASE("content keys of equal files hash to the same set entry") {
    TempDir temp_dir;
    const auto a = FileDescriptor::create(write_file(temp_dir.path() / "a.txt", "payload"));
    const auto b = FileDescriptor::create(write_file(temp_dir.path() / "b.txt", "payload"));
    const auto c = FileDescriptor::create(write_file(temp_dir.path() / "c.txt", "different"));

    std::unordered_set<ContentKey, ContentKeyHash> keys;
    keys.insert(content_key(*a));
    CHECK(keys.contains(content_key(*b)));
    CHECK_FALSE(keys.contains(content_key(*c)));
    CHECK(ContentKeyHash{}(content_key(*a)) == ContentKeyHash{}(content_key(*b)));
}

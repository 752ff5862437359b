#include <doctest/doctest.h>
#include <uberpack/platform.hpp>
#include <uberpack/zip.hpp>

#include "../support/test_helpers.hpp"
#include "../support/zip_fixtures.hpp"

#include <sstream>

using namespace uberpack;
using uberpack::test::TempDir;

namespace {

std::string pattern_bytes(size_t size) {
    std::string data;
    data.reserve(size);
    uint32_t state = 12345;
    for (size_t i = 0; i < size; ++i) {
        state = state * 1103515245u + 12345u;
        data.push_back(static_cast<char>((state >> 16) & 0xff));
    }
    return data;
}

} // namespace

TEST_CASE("ZipWriter output reads back with ZipReader") {
    TempDir tmp;
    std::string archive = tmp / "out.jar";
    std::string large = pattern_bytes(100 * 1024);

    {
        ZipWriter writer(archive);
        REQUIRE(writer.open().ok);
        CHECK(writer.add_directory("com", 1700000000).ok);
        CHECK(writer.add_bytes("com/a.txt", "hello", 1700000000).ok);
        CHECK(writer.add_bytes("empty.txt", "", 1700000002).ok);
        std::istringstream in(large);
        CHECK(writer.add_stream("big.bin", in, 1700000004).ok);
        CHECK(writer.entry_count() == 4);
        CHECK(writer.contains("com/"));
        REQUIRE(writer.finish().ok);
    }

    ZipReader reader(archive);
    REQUIRE(reader.open().ok);
    const auto& entries = reader.entries();
    REQUIRE(entries.size() == 4);

    CHECK(entries[0].name == "com/");
    CHECK(entries[0].is_directory());
    CHECK(entries[1].name == "com/a.txt");
    CHECK(entries[1].method == ZIP_METHOD_DEFLATED);
    CHECK(entries[1].uncompressed_size == 5);
    CHECK(entries[1].last_modified() == 1700000000);
    CHECK(entries[2].last_modified() == 1700000002);

    std::string content;
    REQUIRE(reader.read_entry(entries[1], content).ok);
    CHECK(content == "hello");

    REQUIRE(reader.read_entry(entries[2], content).ok);
    CHECK(content.empty());

    std::ostringstream out;
    std::vector<char> buffer(1024);
    REQUIRE(reader.read_entry(entries[3], out, buffer).ok);
    CHECK(out.str() == large);
}

TEST_CASE("ZipWriter rejects duplicate entries") {
    TempDir tmp;
    ZipWriter writer(tmp / "dup.jar");
    REQUIRE(writer.open().ok);
    REQUIRE(writer.add_bytes("a.txt", "1", 0).ok);

    auto again = writer.add_bytes("a.txt", "2", 0);
    CHECK_FALSE(again.ok);
    CHECK(again.error.find("duplicate") != std::string::npos);
    CHECK(writer.finish().ok);
}

TEST_CASE("ZipWriter refuses entries after finish") {
    TempDir tmp;
    ZipWriter writer(tmp / "done.jar");
    REQUIRE(writer.open().ok);
    REQUIRE(writer.finish().ok);
    CHECK_FALSE(writer.add_bytes("late.txt", "x", 0).ok);
}

TEST_CASE("ZipReader rejects files that are not archives") {
    TempDir tmp;
    std::string path = tmp / "not.jar";
    uberpack::test::write_text(path, std::string(200, 'x'));

    ZipReader reader(path);
    auto result = reader.open();
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("not a zip archive") != std::string::npos);
}

TEST_CASE("ZipReader rejects a missing file") {
    ZipReader reader("/nonexistent/uberpack/missing.jar");
    CHECK_FALSE(reader.open().ok);
}

TEST_CASE("ZipReader detects corrupted entry data") {
    TempDir tmp;
    std::string archive = tmp / "corrupt.jar";
    std::string body = pattern_bytes(4096);
    REQUIRE(uberpack::test::make_archive(archive, {{"a.bin", body}}));

    // Local header (30) + name (5) + extended timestamp extra (9)
    auto bytes = read_file(archive);
    REQUIRE(bytes);
    std::string damaged = *bytes;
    for (size_t i = 44; i < 44 + 64; ++i) {
        damaged[i] = static_cast<char>(damaged[i] ^ 0x5a);
    }
    REQUIRE(write_file(archive, damaged).ok);

    ZipReader reader(archive);
    REQUIRE(reader.open().ok);
    std::string out;
    CHECK_FALSE(reader.read_entry(reader.entries()[0], out).ok);
}

TEST_CASE("ZipReader reads stored and deflated entries without data descriptors") {
    TempDir tmp;
    std::string archive = tmp / "foreign.jar";
    REQUIRE(uberpack::test::write_fixture(archive, uberpack::test::FOREIGN_JAR));

    ZipReader reader(archive);
    REQUIRE(reader.open().ok);
    const auto& entries = reader.entries();
    REQUIRE(entries.size() == 2);

    const auto& stored = entries[0];
    CHECK(stored.name == "stored.txt");
    CHECK(stored.method == ZIP_METHOD_STORED);
    CHECK((stored.flags & ZIP_FLAG_DATA_DESCRIPTOR) == 0);
    CHECK(stored.extended_mtime == std::optional<int64_t>(1600000000));
    CHECK(stored.last_modified() == 1600000000);

    std::string content;
    REQUIRE(reader.read_entry(stored, content).ok);
    CHECK(content == "stored entry\n");

    const auto& deflated = entries[1];
    CHECK(deflated.name == "lib/deflated.txt");
    CHECK(deflated.method == ZIP_METHOD_DEFLATED);
    CHECK((deflated.flags & ZIP_FLAG_DATA_DESCRIPTOR) == 0);
    CHECK_FALSE(deflated.extended_mtime.has_value());
    // 2020-01-02 03:04:06
    CHECK(deflated.dos_date == ((40 << 9) | (1 << 5) | 2));
    CHECK(deflated.dos_time == ((3 << 11) | (4 << 5) | 3));
    CHECK(deflated.last_modified() == dos_to_unix_time(deflated.dos_date, deflated.dos_time));

    std::string expected;
    for (int i = 0; i < 20; ++i) {
        expected += "deflated ";
    }
    REQUIRE(reader.read_entry(deflated, content).ok);
    CHECK(content == expected);
}

TEST_CASE("ZipReader follows ZIP64 end records and extra fields") {
    TempDir tmp;
    std::string archive = tmp / "zip64.jar";
    REQUIRE(uberpack::test::write_fixture(archive, uberpack::test::FOREIGN_ZIP64_JAR));

    ZipReader reader(archive);
    auto opened = reader.open();
    REQUIRE_MESSAGE(opened.ok, opened.error);
    const auto& entries = reader.entries();
    REQUIRE(entries.size() == 2);

    CHECK(entries[0].name == "a.txt");
    CHECK(entries[0].uncompressed_size == 6);
    CHECK(entries[0].compressed_size == 6);
    CHECK(entries[1].name == "b/b.txt");
    CHECK(entries[1].uncompressed_size == 70);
    CHECK(entries[1].local_header_offset == 61);

    std::string content;
    REQUIRE(reader.read_entry(entries[0], content).ok);
    CHECK(content == "first\n");
    REQUIRE(reader.read_entry(entries[1], content).ok);
    CHECK(content.size() == 70);
    CHECK(content.rfind("second second ", 0) == 0);
}

TEST_CASE("ZipWriter switches to ZIP64 end records past 65535 entries") {
    TempDir tmp;
    std::string archive = tmp / "many.jar";
    const size_t directories = 70000;

    {
        ZipWriter writer(archive);
        REQUIRE(writer.open().ok);
        for (size_t i = 0; i < directories; ++i) {
            auto added = writer.add_directory("d/" + std::to_string(i), 1700000000);
            REQUIRE_MESSAGE(added.ok, added.error);
        }
        REQUIRE(writer.add_bytes("last.txt", "tail", 1700000000).ok);
        auto finished = writer.finish();
        REQUIRE_MESSAGE(finished.ok, finished.error);
    }

    // Classic end record saturated, ZIP64 locator right before it
    auto bytes = read_file(archive);
    REQUIRE(bytes);
    REQUIRE(bytes->size() > 42);
    auto byte_at = [&](size_t pos) { return static_cast<uint8_t>((*bytes)[pos]); };
    size_t end = bytes->size() - 22;
    CHECK(byte_at(end + 10) == 0xFF);
    CHECK(byte_at(end + 11) == 0xFF);
    size_t locator = end - 20;
    CHECK(byte_at(locator) == 0x50);
    CHECK(byte_at(locator + 1) == 0x4b);
    CHECK(byte_at(locator + 2) == 0x06);
    CHECK(byte_at(locator + 3) == 0x07);

    ZipReader reader(archive);
    auto opened = reader.open();
    REQUIRE_MESSAGE(opened.ok, opened.error);
    REQUIRE(reader.entries().size() == directories + 1);
    CHECK(reader.entries()[directories - 1].name == "d/" + std::to_string(directories - 1) + "/");

    std::string content;
    REQUIRE(reader.read_entry(reader.entries().back(), content).ok);
    CHECK(content == "tail");
}

TEST_CASE("DOS timestamps keep even seconds") {
    uint16_t dos_date = 0;
    uint16_t dos_time = 0;
    unix_to_dos_time(1700000000, dos_date, dos_time);
    CHECK(dos_to_unix_time(dos_date, dos_time) == 1700000000);
}

TEST_CASE("DOS timestamps clamp to 1980") {
    uint16_t dos_date = 0;
    uint16_t dos_time = 0;
    unix_to_dos_time(0, dos_date, dos_time);
    CHECK(dos_date == ((1 << 5) | 1));
    CHECK(dos_time == 0);
}

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tessera/disk/atomic_file.hpp>
#include <tessera/disk/digest.hpp>
#include "test_support.hpp"

using namespace tessera::disk;
using namespace tessera::test;

TEST_CASE("md5_hex known vectors", "[disk][digest]") {
    CHECK(*md5_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    CHECK(*md5_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
    CHECK(*md5_hex("The quick brown fox jumps over the lazy dog") == "9e107d9d372bb6826bd81d3542a419d6");
}

TEST_CASE("file_md5_hex", "[disk][digest]") {
    TempDir dir("digest");

    SECTION("Matches the in-memory digest across buffer boundaries") {
        const std::string payload = make_payload(100'000);
        const std::string path = dir.file("payload.bin");
        write_file(path, payload);

        auto file_digest = file_md5_hex(path);
        REQUIRE(file_digest.has_value());
        CHECK(*file_digest == *md5_hex(payload));
    }

    SECTION("Empty file") {
        const std::string path = dir.file("empty.bin");
        write_file(path, "");
        CHECK(*file_md5_hex(path) == "d41d8cd98f00b204e9800998ecf8427e");
    }

    SECTION("Missing file") {
        auto result = file_md5_hex(dir.file("absent.bin"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DiskErrc::file_not_found);
    }
}

TEST_CASE("write_file_atomic", "[disk]") {
    TempDir dir("atomic");
    const std::string path = dir.file("nested/state.json");

    SECTION("Creates parent directories and writes content") {
        REQUIRE_FALSE(write_file_atomic(path, "first"));
        CHECK(read_file(path) == "first");
        CHECK_FALSE(fs::exists(staging_path(path)));
    }

    SECTION("Replaces existing content") {
        REQUIRE_FALSE(write_file_atomic(path, "a much longer first version"));
        REQUIRE_FALSE(write_file_atomic(path, "short"));
        CHECK(read_file(path) == "short");
    }
}

TEST_CASE("replace_file and remove_file", "[disk]") {
    TempDir dir("replace");
    const std::string staged = dir.file("out.bin.staged");
    const std::string final_path = dir.file("out.bin");

    write_file(staged, "new");
    write_file(final_path, "old");

    REQUIRE_FALSE(sync_file(staged));
    REQUIRE_FALSE(replace_file(staged, final_path));
    CHECK(read_file(final_path) == "new");
    CHECK_FALSE(fs::exists(staged));

    CHECK(replace_file(dir.file("absent"), final_path) == DiskErrc::rename_error);
    CHECK(sync_file(dir.file("absent")) == DiskErrc::file_not_found);

    CHECK_FALSE(remove_file(final_path));
    CHECK_FALSE(fs::exists(final_path));
    CHECK_FALSE(remove_file(final_path));
}

TEST_CASE("staging_path", "[disk]") {
    CHECK(staging_path("a/b.json") == "a/b.json.tmp");
    CHECK(staging_path("a/b.bin", ".commit") == "a/b.bin.commit");
}

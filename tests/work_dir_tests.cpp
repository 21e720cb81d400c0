// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/disk/error.hpp>
#include <ferry/disk/work_dir.hpp>
#include "test_support.hpp"

using namespace ferry::disk;
using ferry::test::TempDir;
using ferry::test::write_file;

namespace fs = std::filesystem;

TEST_CASE("prepare_fresh clears previous contents", "[disk]") {
    TempDir tmp;
    auto dir = tmp.path() / "job";
    write_file(dir / "leftover.bin", 10);

    REQUIRE_FALSE(prepare_fresh(dir));
    CHECK(fs::is_directory(dir));
    CHECK(fs::is_empty(dir));

    SECTION("Empty path is rejected") {
        CHECK(prepare_fresh({}) == DiskErrc::invalid_path);
    }
}

TEST_CASE("scan_files walks recursively in path order", "[disk]") {
    TempDir tmp;
    write_file(tmp.path() / "b.bin", 2);
    write_file(tmp.path() / "a.bin", 1);
    write_file(tmp.path() / "sub" / "c.bin", 3);
    fs::create_directories(tmp.path() / "empty");

    auto files = scan_files(tmp.path());
    REQUIRE(files.has_value());
    REQUIRE(files->size() == 3);
    CHECK((*files)[0].path.filename() == "a.bin");
    CHECK((*files)[1].path.filename() == "b.bin");
    CHECK((*files)[2].path.filename() == "c.bin");
    CHECK((*files)[2].size == 3);

    SECTION("Missing directory is empty, not an error") {
        auto none = scan_files(tmp.path() / "missing");
        REQUIRE(none.has_value());
        CHECK(none->empty());
    }
}

TEST_CASE("remove_if_drained only removes directories without files", "[disk]") {
    TempDir tmp;
    auto dir = tmp.path() / "job";

    SECTION("Empty subdirectories do not count") {
        fs::create_directories(dir / "a" / "b");
        CHECK(remove_if_drained(dir));
        CHECK_FALSE(fs::exists(dir));
    }

    SECTION("A remaining file keeps the directory") {
        write_file(dir / "a" / "kept.bin", 5);
        CHECK_FALSE(remove_if_drained(dir));
        CHECK(fs::exists(dir / "a" / "kept.bin"));
    }

    SECTION("Missing directory") {
        CHECK_FALSE(remove_if_drained(dir));
    }
}

TEST_CASE("remove_entries_older_than judges by modification time", "[disk]") {
    TempDir tmp;
    auto old_dir = tmp.path() / "user_1_old";
    auto new_dir = tmp.path() / "user_1_new";
    write_file(old_dir / "x.bin", 1);
    write_file(new_dir / "y.bin", 1);

    const auto now = fs::file_time_type::clock::now();
    fs::last_write_time(old_dir, now - std::chrono::hours(10));

    CHECK(remove_entries_older_than(tmp.path(), now - std::chrono::hours(6)) == 1);
    CHECK_FALSE(fs::exists(old_dir));
    CHECK(fs::exists(new_dir));
}

TEST_CASE("remove_path tolerates missing paths", "[disk]") {
    TempDir tmp;
    CHECK_FALSE(remove_path(tmp.path() / "nothing-here"));
}

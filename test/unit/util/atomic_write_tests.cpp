// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for atomic file writes (files.cpp)

#include <catch2/catch_test_macros.hpp>

#include "util/files.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <sys/stat.h>

using namespace quorumwire::util;

namespace {

std::filesystem::path fresh_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

size_t count_temp_files(const std::filesystem::path& dir) {
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
            ++n;
        }
    }
    return n;
}

}  // namespace

TEST_CASE("Atomic write: basic write and read back", "[atomic_write]") {
    auto dir = fresh_dir("quorumwire_atomic_basic");

    SECTION("Binary data") {
        auto path = dir / "data.bin";
        std::vector<uint8_t> data = {0x00, 0x01, 0xfe, 0xff, 0x7f};
        REQUIRE(atomic_write_file(path, data, 0600));
        CHECK(read_file(path) == data);
    }

    SECTION("String data") {
        auto path = dir / "data.txt";
        REQUIRE(atomic_write_file(path, std::string("hello quorum"), 0600));
        CHECK(read_file_string(path) == "hello quorum");
    }

    SECTION("Empty file") {
        auto path = dir / "empty.dat";
        REQUIRE(atomic_write_file(path, std::vector<uint8_t>{}, 0600));
        CHECK(std::filesystem::exists(path));
        CHECK(std::filesystem::file_size(path) == 0);
        CHECK(read_file(path).empty());
    }

    SECTION("Overwrite replaces content entirely") {
        auto path = dir / "overwrite.txt";
        REQUIRE(atomic_write_file(path, std::string("a much longer first version"), 0600));
        REQUIRE(atomic_write_file(path, std::string("short"), 0600));
        CHECK(read_file_string(path) == "short");
    }

    SECTION("No temp files left behind") {
        for (int i = 0; i < 5; ++i) {
            REQUIRE(atomic_write_file(dir / "repeat.txt", std::to_string(i), 0600));
        }
        CHECK(count_temp_files(dir) == 0);
        CHECK(read_file_string(dir / "repeat.txt") == "4");
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Atomic write: parent directory creation", "[atomic_write]") {
    auto dir = fresh_dir("quorumwire_atomic_parent");
    auto path = dir / "a" / "b" / "c" / "key.hex";

    REQUIRE(atomic_write_file(path, std::string("nested"), 0600));
    CHECK(std::filesystem::is_directory(dir / "a" / "b" / "c"));
    CHECK(read_file_string(path) == "nested");

    std::filesystem::remove_all(dir);
}

TEST_CASE("Atomic write: file permissions", "[atomic_write][permissions]") {
    auto dir = fresh_dir("quorumwire_atomic_perms");

    SECTION("Owner-only mode") {
        auto path = dir / "secret.key";
        REQUIRE(atomic_write_file(path, std::string("deadbeef"), 0600));

        struct stat st{};
        REQUIRE(stat(path.c_str(), &st) == 0);
        CHECK((st.st_mode & 0777) == 0600);
    }

    SECTION("Readable mode keeps write access owner-only") {
        auto path = dir / "config.json";
        REQUIRE(atomic_write_file(path, std::string("{}"), 0644));

        struct stat st{};
        REQUIRE(stat(path.c_str(), &st) == 0);
        CHECK((st.st_mode & 0600) == 0600);
        CHECK((st.st_mode & 0022) == 0);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Atomic write: symlink target is not followed", "[atomic_write][security]") {
    auto dir = fresh_dir("quorumwire_atomic_symlink");
    auto real_file = dir / "real.txt";
    auto link = dir / "link.txt";

    {
        std::ofstream f(real_file);
        f << "untouched";
    }
    std::filesystem::create_symlink(real_file, link);

    // rename() replaces the link itself, never the file it points to
    REQUIRE(atomic_write_file(link, std::string("replacement"), 0600));
    CHECK(read_file_string(real_file) == "untouched");
    CHECK_FALSE(std::filesystem::is_symlink(link));
    CHECK(read_file_string(link) == "replacement");

    std::filesystem::remove_all(dir);
}

TEST_CASE("Atomic write: failure cases", "[atomic_write]") {
    auto dir = fresh_dir("quorumwire_atomic_fail");

    SECTION("Parent path is a regular file") {
        auto blocker = dir / "blocker";
        {
            std::ofstream f(blocker);
            f << "x";
        }
        CHECK_FALSE(atomic_write_file(blocker / "child.txt", std::string("data"), 0600));
    }

    SECTION("Target is an existing directory") {
        std::filesystem::create_directories(dir / "occupied");
        CHECK_FALSE(atomic_write_file(dir / "occupied", std::string("data"), 0600));
        CHECK(std::filesystem::is_directory(dir / "occupied"));
        CHECK(count_temp_files(dir) == 0);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("read_file: limits and missing files", "[atomic_write][read_file]") {
    auto dir = fresh_dir("quorumwire_read_file");

    SECTION("Missing file yields empty") {
        CHECK(read_file(dir / "does_not_exist").empty());
        CHECK(read_file_string(dir / "does_not_exist").empty());
    }

    SECTION("One MiB is accepted") {
        std::vector<uint8_t> data(1024 * 1024, 0xab);
        REQUIRE(atomic_write_file(dir / "limit.bin", data, 0600));
        CHECK(read_file(dir / "limit.bin").size() == data.size());
    }

    SECTION("Larger files are refused") {
        std::vector<uint8_t> data(1024 * 1024 + 1, 0xab);
        REQUIRE(atomic_write_file(dir / "too_big.bin", data, 0600));
        CHECK(read_file(dir / "too_big.bin").empty());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("ensure_directory", "[atomic_write]") {
    auto dir = fresh_dir("quorumwire_ensure_dir");

    CHECK(ensure_directory(dir / "x" / "y"));
    CHECK(std::filesystem::is_directory(dir / "x" / "y"));
    // Existing directory is fine
    CHECK(ensure_directory(dir / "x" / "y"));

    std::filesystem::remove_all(dir);
}

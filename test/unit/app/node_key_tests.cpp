// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "app/node_key.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <string>

#include <sys/stat.h>

using namespace quorumwire;

TEST_CASE("Node key: created once and reloaded", "[node_key]") {
    auto dir = std::filesystem::temp_directory_path() / "quorumwire_node_key_test";
    std::filesystem::remove_all(dir);
    auto path = dir / "node.key";

    auto created = app::LoadOrCreateNodeKey(path);
    REQUIRE(created);
    REQUIRE(std::filesystem::exists(path));

    struct stat st{};
    REQUIRE(stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    // 64 hex characters plus newline
    CHECK(util::read_file_string(path).size() == 65);

    auto reloaded = app::LoadOrCreateNodeKey(path);
    REQUIRE(reloaded);
    CHECK(reloaded->public_key() == created->public_key());
    CHECK(reloaded->bytes() == created->bytes());

    std::filesystem::remove_all(dir);
}

TEST_CASE("Node key: malformed files are refused", "[node_key]") {
    auto dir = std::filesystem::temp_directory_path() / "quorumwire_node_key_bad";
    std::filesystem::remove_all(dir);
    auto path = dir / "node.key";

    SECTION("Not hex") {
        REQUIRE(util::atomic_write_file(path, std::string("this is not a key"), 0600));
        CHECK_FALSE(app::LoadOrCreateNodeKey(path));
    }

    SECTION("Wrong length") {
        REQUIRE(util::atomic_write_file(path, std::string("0102030405"), 0600));
        CHECK_FALSE(app::LoadOrCreateNodeKey(path));
    }

    SECTION("Zero scalar") {
        REQUIRE(util::atomic_write_file(path, std::string(64, '0'), 0600));
        CHECK_FALSE(app::LoadOrCreateNodeKey(path));
    }

    // The bad file is left untouched
    CHECK(std::filesystem::exists(path));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Node key: explicit save", "[node_key]") {
    auto dir = std::filesystem::temp_directory_path() / "quorumwire_node_key_save";
    std::filesystem::remove_all(dir);

    auto key = crypto::PrivateKey::Generate();
    REQUIRE(key);
    REQUIRE(app::SaveNodeKey(dir / "saved.key", *key));

    auto loaded = app::LoadOrCreateNodeKey(dir / "saved.key");
    REQUIRE(loaded);
    CHECK(loaded->public_key() == key->public_key());

    std::filesystem::remove_all(dir);
}

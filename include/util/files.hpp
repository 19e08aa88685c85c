// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace quorumwire {
namespace util {

// Write data to path atomically (temp file, fsync, rename). mode is the
// permission of the created file.
bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);

// Read a whole file. Returns empty on failure (logged).
std::vector<uint8_t> read_file(const std::filesystem::path& path);
std::string read_file_string(const std::filesystem::path& path);

bool ensure_directory(const std::filesystem::path& dir);

}  // namespace util
}  // namespace quorumwire

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace quorumwire {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path& dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<uint64_t> dis;
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
  return std::string(buf);
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: Failed to create parent directory: {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  // O_EXCL: refuse a pre-created temp file; O_NOFOLLOW: refuse symlinks
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: Failed to create temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: Failed to write to temp file {}: {} (errno={}, written {}/{})", temp_path.string(),
                std::strerror(errno), errno, total, data.size());
      close(fd);
      std::filesystem::remove(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    LOG_ERROR("atomic_write_file: Failed to fsync temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    close(fd);
    std::filesystem::remove(temp_path);
    return false;
  }

  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    LOG_ERROR("atomic_write_file: Failed to fsync parent directory {} for atomic write of {}: {} (errno={})",
              parent.string(), path.string(), std::strerror(errno), errno);
    std::filesystem::remove(temp_path);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: Failed to rename {} to {}: {} (code={})", temp_path.string(), path.string(),
              ec.message(), ec.value());
    std::filesystem::remove(temp_path);
    return false;
  }

  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  std::vector<uint8_t> vec(data.begin(), data.end());
  return atomic_write_file(path, vec, mode);
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    LOG_ERROR("read_file: Failed to open file {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    LOG_ERROR("read_file: Failed to get file size for {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return {};
  }

  std::streamsize size = static_cast<std::streamsize>(pos);

  // Key and config files are tiny; refuse anything absurd
  constexpr std::streamsize MAX_FILE_SIZE = 1024 * 1024;
  if (size < 0 || size > MAX_FILE_SIZE) {
    LOG_ERROR("read_file: Invalid file size ({}) for {}", size, path.string());
    return {};
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  file.seekg(0);
  file.read(reinterpret_cast<char*>(data.data()), size);

  if (!file) {
    LOG_ERROR("read_file: Failed to read {} bytes from {}: {} (errno={})", size, path.string(), std::strerror(errno),
              errno);
    return {};
  }

  return data;
}

std::string read_file_string(const std::filesystem::path& path) {
  auto data = read_file(path);
  return std::string(data.begin(), data.end());
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

}  // namespace util
}  // namespace quorumwire

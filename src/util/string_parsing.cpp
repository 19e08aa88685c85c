// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <cctype>
#include <charconv>

namespace quorumwire {
namespace util {

namespace {

int HexDigitValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  if (str.empty() || str.size() > 20) {
    return std::nullopt;
  }
  // from_chars accepts a leading '-' but never '+' or whitespace
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc{} || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  if (str.empty() || str[0] == '-') {
    return std::nullopt;
  }
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port) {
  if (host_port.empty()) {
    return false;
  }

  std::string port_str;
  if (host_port[0] == '[') {
    size_t bracket_end = host_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;
    }
    if (bracket_end + 1 >= host_port.size() || host_port[bracket_end + 1] != ':') {
      return false;
    }
    out_host = host_port.substr(1, bracket_end - 1);
    port_str = host_port.substr(bracket_end + 2);
  } else {
    size_t colon = host_port.rfind(':');
    if (colon == std::string::npos || colon == 0) {
      return false;
    }
    // Unbracketed IPv6 is ambiguous
    if (host_port.find(':') != colon) {
      return false;
    }
    out_host = host_port.substr(0, colon);
    port_str = host_port.substr(colon + 1);
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return false;
  }
  out_port = *port;
  return true;
}

std::string HexStr(std::span<const uint8_t> data) {
  static constexpr char kHexChars[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(kHexChars[b >> 4]);
    out.push_back(kHexChars[b & 0x0f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string& str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])))
    --end;

  if ((end - begin) % 2 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve((end - begin) / 2);
  for (size_t i = begin; i < end; i += 2) {
    int hi = HexDigitValue(str[i]);
    int lo = HexDigitValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

}  // namespace util
}  // namespace quorumwire

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace quorumwire {
namespace util {

// Parse a decimal port in [1, 65535]. Rejects signs, whitespace and trailing characters.
std::optional<uint16_t> SafeParsePort(const std::string& str);

// Parse a decimal integer in [min, max]. Rejects whitespace and trailing characters.
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

// Split "host:port" or "[ipv6]:port". Host may be a name; it is resolved later.
bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port);

// Lowercase hex encoding
std::string HexStr(std::span<const uint8_t> data);

// Strict hex decoding: even length, hex digits only (surrounding whitespace ignored).
std::optional<std::vector<uint8_t>> ParseHex(const std::string& str);

}  // namespace util
}  // namespace quorumwire

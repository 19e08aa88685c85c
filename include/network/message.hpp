// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace quorumwire {
namespace message {

// VarInt - compact-size length encoding
// < 0xfd: 1 byte; 0xfd + uint16; 0xfe + uint32; 0xff + uint64 (all little-endian)
class VarInt {
public:
  uint64_t value;

  VarInt() : value(0) {}
  explicit VarInt(uint64_t v) : value(v) {}

  // Get encoded size in bytes
  size_t encoded_size() const;

  // Encode to buffer (must hold encoded_size() bytes)
  size_t encode(uint8_t* buffer) const;

  // Decode from buffer, returns bytes consumed (0 on truncated or non-canonical input)
  size_t decode(const uint8_t* buffer, size_t available);
};

// Serialization buffer for building wire-format payloads
class MessageSerializer {
public:
  MessageSerializer() = default;

  void write_uint8(uint8_t value);
  void write_varint(uint64_t value);
  void write_bytes(std::span<const uint8_t> data);

  // Compact-size length prefix followed by the bytes
  void write_byte_string(std::span<const uint8_t> data);

  std::vector<uint8_t> release() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

// Deserialization cursor over a received payload. Reads past the end set the
// error flag and return zero/empty values; callers check has_error().
class MessageDeserializer {
public:
  explicit MessageDeserializer(std::span<const uint8_t> data);

  uint8_t read_uint8();
  uint64_t read_varint();
  std::vector<uint8_t> read_bytes(size_t count);

  size_t bytes_remaining() const { return data_.size() - position_; }
  bool has_error() const { return error_; }

private:
  bool check_available(size_t bytes);

  std::span<const uint8_t> data_;
  size_t position_ = 0;
  bool error_ = false;
};

}  // namespace message
}  // namespace quorumwire

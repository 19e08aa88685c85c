// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"

namespace quorumwire {
namespace message {

namespace {

void WriteLE(uint8_t* out, uint64_t value, size_t width) {
  for (size_t i = 0; i < width; ++i) {
    out[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

uint64_t ReadLE(const uint8_t* in, size_t width) {
  uint64_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value |= static_cast<uint64_t>(in[i]) << (8 * i);
  }
  return value;
}

}  // namespace

// ============================================================================
// VarInt
// ============================================================================

size_t VarInt::encoded_size() const {
  if (value < 0xfd)
    return 1;
  if (value <= 0xffff)
    return 3;
  if (value <= 0xffffffff)
    return 5;
  return 9;
}

size_t VarInt::encode(uint8_t* buffer) const {
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  }
  if (value <= 0xffff) {
    buffer[0] = 0xfd;
    WriteLE(buffer + 1, value, 2);
    return 3;
  }
  if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    WriteLE(buffer + 1, value, 4);
    return 5;
  }
  buffer[0] = 0xff;
  WriteLE(buffer + 1, value, 8);
  return 9;
}

size_t VarInt::decode(const uint8_t* buffer, size_t available) {
  if (available < 1)
    return 0;

  const uint8_t first = buffer[0];
  size_t width = 0;
  uint64_t min_value = 0;
  if (first < 0xfd) {
    value = first;
    return 1;
  } else if (first == 0xfd) {
    width = 2;
    min_value = 0xfd;
  } else if (first == 0xfe) {
    width = 4;
    min_value = 0x10000;
  } else {
    width = 8;
    min_value = 0x100000000ULL;
  }

  if (available < 1 + width)
    return 0;

  const uint64_t decoded = ReadLE(buffer + 1, width);
  // Reject non-canonical encodings
  if (decoded < min_value)
    return 0;

  value = decoded;
  return 1 + width;
}

// ============================================================================
// MessageSerializer
// ============================================================================

void MessageSerializer::write_uint8(uint8_t value) {
  buffer_.push_back(value);
}

void MessageSerializer::write_varint(uint64_t value) {
  VarInt vi(value);
  uint8_t encoded[9];
  size_t len = vi.encode(encoded);
  buffer_.insert(buffer_.end(), encoded, encoded + len);
}

void MessageSerializer::write_bytes(std::span<const uint8_t> data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void MessageSerializer::write_byte_string(std::span<const uint8_t> data) {
  write_varint(data.size());
  write_bytes(data);
}

// ============================================================================
// MessageDeserializer
// ============================================================================

MessageDeserializer::MessageDeserializer(std::span<const uint8_t> data) : data_(data) {}

bool MessageDeserializer::check_available(size_t bytes) {
  if (error_ || bytes > bytes_remaining()) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint64_t MessageDeserializer::read_varint() {
  if (error_)
    return 0;
  VarInt vi;
  size_t consumed = vi.decode(data_.data() + position_, bytes_remaining());
  if (consumed == 0) {
    error_ = true;
    return 0;
  }
  position_ += consumed;
  return vi.value;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  if (!check_available(count))
    return {};
  auto begin = data_.begin() + static_cast<std::ptrdiff_t>(position_);
  std::vector<uint8_t> out(begin, begin + static_cast<std::ptrdiff_t>(count));
  position_ += count;
  return out;
}

}  // namespace message
}  // namespace quorumwire

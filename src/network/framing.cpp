// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/framing.hpp"

namespace quorumwire {
namespace network {

std::string FramingErrorToString(FramingError error) {
  switch (error) {
  case FramingError::None:
    return "none";
  case FramingError::EmptyMessage:
    return "empty message";
  case FramingError::OversizedMessage:
    return "message exceeds maximum length";
  }
  return "unknown";
}

FramingError CheckMessageLength(uint64_t length) {
  if (length == 0) {
    return FramingError::EmptyMessage;
  }
  if (length > protocol::MAX_MESSAGE_LENGTH) {
    return FramingError::OversizedMessage;
  }
  return FramingError::None;
}

LengthPrefix EncodeLength(uint32_t length) {
  return {static_cast<uint8_t>(length & 0xff), static_cast<uint8_t>((length >> 8) & 0xff),
          static_cast<uint8_t>((length >> 16) & 0xff), static_cast<uint8_t>((length >> 24) & 0xff)};
}

FramingError DecodeLength(const LengthPrefix& prefix, uint32_t& out_length) {
  const uint32_t length = static_cast<uint32_t>(prefix[0]) | (static_cast<uint32_t>(prefix[1]) << 8) |
                          (static_cast<uint32_t>(prefix[2]) << 16) | (static_cast<uint32_t>(prefix[3]) << 24);
  FramingError error = CheckMessageLength(length);
  if (error == FramingError::None) {
    out_length = length;
  }
  return error;
}

std::optional<std::vector<uint8_t>> Frame(std::span<const uint8_t> payload, FramingError* out_error) {
  FramingError error = CheckMessageLength(payload.size());
  if (out_error) {
    *out_error = error;
  }
  if (error != FramingError::None) {
    return std::nullopt;
  }

  const LengthPrefix prefix = EncodeLength(static_cast<uint32_t>(payload.size()));
  std::vector<uint8_t> framed;
  framed.reserve(prefix.size() + payload.size());
  framed.insert(framed.end(), prefix.begin(), prefix.end());
  framed.insert(framed.end(), payload.begin(), payload.end());
  return framed;
}

}  // namespace network
}  // namespace quorumwire

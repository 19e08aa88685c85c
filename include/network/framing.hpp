// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace quorumwire {
namespace network {

enum class FramingError {
  None,
  EmptyMessage,     // length prefix of 0
  OversizedMessage  // length prefix above protocol::MAX_MESSAGE_LENGTH
};

std::string FramingErrorToString(FramingError error);

using LengthPrefix = std::array<uint8_t, protocol::LENGTH_PREFIX_SIZE>;

// Validate a payload length against framing limits
FramingError CheckMessageLength(uint64_t length);

// Encode the little-endian length prefix for a payload of the given size
LengthPrefix EncodeLength(uint32_t length);

// Decode and validate a length prefix. On success returns None and sets out_length.
FramingError DecodeLength(const LengthPrefix& prefix, uint32_t& out_length);

// Produce len:uint32-LE | payload. Returns nullopt (with the reason in
// out_error when provided) for an empty or oversized payload.
std::optional<std::vector<uint8_t>> Frame(std::span<const uint8_t> payload, FramingError* out_error = nullptr);

}  // namespace network
}  // namespace quorumwire

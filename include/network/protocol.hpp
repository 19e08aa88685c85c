// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace quorumwire {
namespace protocol {

// Default TCP port for quorumwired
constexpr uint16_t DEFAULT_PORT = 7580;

// Envelope command tags (first byte of every framed payload)
namespace commands {
constexpr uint8_t NOP = 0;
constexpr uint8_t KEY_AUTH_INIT = 1;
constexpr uint8_t KEY_AUTH_CHALLENGE = 2;
constexpr uint8_t KEY_AUTH_CHALLENGE_REPLY = 3;
constexpr uint8_t CONSENSUS = 4;
}  // namespace commands

// ============================================================================
// FRAMING
// ============================================================================

// Every message is len:uint32-LE | payload
constexpr size_t LENGTH_PREFIX_SIZE = 4;

// Largest accepted payload (32 MiB). Zero-length payloads are rejected.
constexpr uint32_t MAX_MESSAGE_LENGTH = 32 * 1024 * 1024;

// ============================================================================
// AUTHENTICATION
// ============================================================================

// Challenge plaintext and ciphertext length (CFB keeps sizes equal)
constexpr size_t CHALLENGE_SIZE = 128;

// AES-CFB initialization vector
constexpr size_t CHALLENGE_IV_SIZE = 16;

// Affine secp256k1 coordinate, big-endian, leading zeros may be stripped
constexpr size_t MAX_COORDINATE_SIZE = 32;

// ============================================================================
// TIMING
// ============================================================================

// Idle deadline for each socket read and write, reset per I/O call
constexpr auto DEFAULT_READ_TIMEOUT = std::chrono::seconds(10);
constexpr auto DEFAULT_WRITE_TIMEOUT = std::chrono::seconds(10);

// Outbound TCP connect deadline
constexpr auto DEFAULT_CONNECT_TIMEOUT = std::chrono::seconds(10);

// Consensus engine Update() period; re-armed after each call returns
constexpr auto DEFAULT_UPDATE_INTERVAL = std::chrono::milliseconds(20);

}  // namespace protocol
}  // namespace quorumwire

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace quorumwire {
namespace network {

// Envelope wire layout: command:uint8 | body (remainder of the frame).
// Auth bodies are sequences of compact-size prefixed byte strings.

enum class DecodeError {
  None,
  UnknownCommand,  // command tag not in protocol::commands
  Truncated,       // body ends before a field is complete
  InvalidLength,   // field length outside its allowed range
  TrailingData     // bytes left over after the last field
};

std::string DecodeErrorToString(DecodeError error);

// Human-readable command name for logging
std::string CommandToString(uint8_t command);

struct Envelope {
  uint8_t command{protocol::commands::NOP};
  std::vector<uint8_t> body;
};

// KEY_AUTH_INIT: initiator's long-term public key
struct AuthInit {
  std::vector<uint8_t> x;
  std::vector<uint8_t> y;
};

// KEY_AUTH_CHALLENGE: responder's ephemeral public key plus the encrypted challenge
struct AuthChallenge {
  std::vector<uint8_t> x;
  std::vector<uint8_t> y;
  std::vector<uint8_t> ciphertext;
  std::vector<uint8_t> iv;
};

// KEY_AUTH_CHALLENGE_REPLY: decrypted challenge
struct AuthChallengeReply {
  std::vector<uint8_t> plaintext;
};

// Split a frame payload into command and body. An empty payload is Truncated.
DecodeError DecodeEnvelope(std::span<const uint8_t> payload, Envelope& out);

std::vector<uint8_t> EncodeEnvelope(uint8_t command, std::span<const uint8_t> body);

// Serialized envelopes, ready to frame
std::vector<uint8_t> EncodeNop();
std::vector<uint8_t> EncodeConsensus(std::span<const uint8_t> payload);
std::vector<uint8_t> EncodeAuthInit(const AuthInit& msg);
std::vector<uint8_t> EncodeAuthChallenge(const AuthChallenge& msg);
std::vector<uint8_t> EncodeAuthChallengeReply(const AuthChallengeReply& msg);

// Body decoders; the body is the envelope body without the command byte
DecodeError DecodeAuthInit(std::span<const uint8_t> body, AuthInit& out);
DecodeError DecodeAuthChallenge(std::span<const uint8_t> body, AuthChallenge& out);
DecodeError DecodeAuthChallengeReply(std::span<const uint8_t> body, AuthChallengeReply& out);

}  // namespace network
}  // namespace quorumwire

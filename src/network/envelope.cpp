// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/envelope.hpp"

#include "network/message.hpp"

#include <utility>

namespace quorumwire {
namespace network {

namespace {

// Read one compact-size prefixed field whose length must lie in [min_len, max_len]
DecodeError ReadField(message::MessageDeserializer& d, size_t min_len, size_t max_len, std::vector<uint8_t>& out) {
  const uint64_t len = d.read_varint();
  if (d.has_error()) {
    return DecodeError::Truncated;
  }
  if (len < min_len || len > max_len) {
    return DecodeError::InvalidLength;
  }
  if (len > d.bytes_remaining()) {
    return DecodeError::Truncated;
  }
  out = d.read_bytes(static_cast<size_t>(len));
  return d.has_error() ? DecodeError::Truncated : DecodeError::None;
}

DecodeError Finish(const message::MessageDeserializer& d) {
  return d.bytes_remaining() == 0 ? DecodeError::None : DecodeError::TrailingData;
}

bool IsKnownCommand(uint8_t command) {
  return command <= protocol::commands::CONSENSUS;
}

}  // namespace

std::string DecodeErrorToString(DecodeError error) {
  switch (error) {
  case DecodeError::None:
    return "none";
  case DecodeError::UnknownCommand:
    return "unknown command";
  case DecodeError::Truncated:
    return "truncated body";
  case DecodeError::InvalidLength:
    return "invalid field length";
  case DecodeError::TrailingData:
    return "trailing data";
  }
  return "unknown";
}

std::string CommandToString(uint8_t command) {
  switch (command) {
  case protocol::commands::NOP:
    return "NOP";
  case protocol::commands::KEY_AUTH_INIT:
    return "KEY_AUTH_INIT";
  case protocol::commands::KEY_AUTH_CHALLENGE:
    return "KEY_AUTH_CHALLENGE";
  case protocol::commands::KEY_AUTH_CHALLENGE_REPLY:
    return "KEY_AUTH_CHALLENGE_REPLY";
  case protocol::commands::CONSENSUS:
    return "CONSENSUS";
  }
  return "UNKNOWN(" + std::to_string(command) + ")";
}

DecodeError DecodeEnvelope(std::span<const uint8_t> payload, Envelope& out) {
  if (payload.empty()) {
    return DecodeError::Truncated;
  }
  if (!IsKnownCommand(payload[0])) {
    return DecodeError::UnknownCommand;
  }
  out.command = payload[0];
  out.body.assign(payload.begin() + 1, payload.end());
  return DecodeError::None;
}

std::vector<uint8_t> EncodeEnvelope(uint8_t command, std::span<const uint8_t> body) {
  message::MessageSerializer s;
  s.write_uint8(command);
  s.write_bytes(body);
  return s.release();
}

std::vector<uint8_t> EncodeNop() {
  return EncodeEnvelope(protocol::commands::NOP, {});
}

std::vector<uint8_t> EncodeConsensus(std::span<const uint8_t> payload) {
  return EncodeEnvelope(protocol::commands::CONSENSUS, payload);
}

std::vector<uint8_t> EncodeAuthInit(const AuthInit& msg) {
  message::MessageSerializer s;
  s.write_uint8(protocol::commands::KEY_AUTH_INIT);
  s.write_byte_string(msg.x);
  s.write_byte_string(msg.y);
  return s.release();
}

std::vector<uint8_t> EncodeAuthChallenge(const AuthChallenge& msg) {
  message::MessageSerializer s;
  s.write_uint8(protocol::commands::KEY_AUTH_CHALLENGE);
  s.write_byte_string(msg.x);
  s.write_byte_string(msg.y);
  s.write_byte_string(msg.ciphertext);
  s.write_byte_string(msg.iv);
  return s.release();
}

std::vector<uint8_t> EncodeAuthChallengeReply(const AuthChallengeReply& msg) {
  message::MessageSerializer s;
  s.write_uint8(protocol::commands::KEY_AUTH_CHALLENGE_REPLY);
  s.write_byte_string(msg.plaintext);
  return s.release();
}

DecodeError DecodeAuthInit(std::span<const uint8_t> body, AuthInit& out) {
  message::MessageDeserializer d(body);
  AuthInit msg;
  if (auto err = ReadField(d, 1, protocol::MAX_COORDINATE_SIZE, msg.x); err != DecodeError::None)
    return err;
  if (auto err = ReadField(d, 1, protocol::MAX_COORDINATE_SIZE, msg.y); err != DecodeError::None)
    return err;
  if (auto err = Finish(d); err != DecodeError::None)
    return err;
  out = std::move(msg);
  return DecodeError::None;
}

DecodeError DecodeAuthChallenge(std::span<const uint8_t> body, AuthChallenge& out) {
  message::MessageDeserializer d(body);
  AuthChallenge msg;
  if (auto err = ReadField(d, 1, protocol::MAX_COORDINATE_SIZE, msg.x); err != DecodeError::None)
    return err;
  if (auto err = ReadField(d, 1, protocol::MAX_COORDINATE_SIZE, msg.y); err != DecodeError::None)
    return err;
  if (auto err = ReadField(d, protocol::CHALLENGE_SIZE, protocol::CHALLENGE_SIZE, msg.ciphertext);
      err != DecodeError::None)
    return err;
  if (auto err = ReadField(d, protocol::CHALLENGE_IV_SIZE, protocol::CHALLENGE_IV_SIZE, msg.iv);
      err != DecodeError::None)
    return err;
  if (auto err = Finish(d); err != DecodeError::None)
    return err;
  out = std::move(msg);
  return DecodeError::None;
}

DecodeError DecodeAuthChallengeReply(std::span<const uint8_t> body, AuthChallengeReply& out) {
  message::MessageDeserializer d(body);
  AuthChallengeReply msg;
  if (auto err = ReadField(d, protocol::CHALLENGE_SIZE, protocol::CHALLENGE_SIZE, msg.plaintext);
      err != DecodeError::None)
    return err;
  if (auto err = Finish(d); err != DecodeError::None)
    return err;
  out = std::move(msg);
  return DecodeError::None;
}

}  // namespace network
}  // namespace quorumwire

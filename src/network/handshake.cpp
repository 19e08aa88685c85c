// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/handshake.hpp"

#include "crypto/cipher.hpp"
#include "util/logging.hpp"

#include <utility>

#include <openssl/crypto.h>

namespace quorumwire {
namespace network {

namespace {

std::vector<uint8_t> ToVector(std::span<const uint8_t> bytes) {
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

void Cleanse(crypto::SharedSecret& secret) {
  OPENSSL_cleanse(secret.data(), secret.size());
}

}  // namespace

std::string AuthStateToString(AuthState state) {
  switch (state) {
  case AuthState::NotAuthenticated:
    return "not-authenticated";
  case AuthState::ChallengeIssued:
    return "challenge-issued";
  case AuthState::Authenticated:
    return "authenticated";
  case AuthState::AuthenticationFailed:
    return "authentication-failed";
  }
  return "unknown";
}

std::string LocalAuthStateToString(LocalAuthState state) {
  switch (state) {
  case LocalAuthState::NotStarted:
    return "not-started";
  case LocalAuthState::AuthKeySent:
    return "auth-key-sent";
  case LocalAuthState::ChallengeAnswered:
    return "challenge-answered";
  }
  return "unknown";
}

std::string HandshakeResultToString(HandshakeResult result) {
  switch (result) {
  case HandshakeResult::Ok:
    return "ok";
  case HandshakeResult::InvalidState:
    return "invalid authentication state";
  case HandshakeResult::InvalidResponse:
    return "invalid challenge response";
  case HandshakeResult::InvalidKey:
    return "invalid public key";
  case HandshakeResult::CryptoFailure:
    return "cryptographic failure";
  }
  return "unknown";
}

bool IsValidTransition(AuthState from, AuthState to) {
  switch (from) {
  case AuthState::NotAuthenticated:
    return to == AuthState::ChallengeIssued;
  case AuthState::ChallengeIssued:
    return to == AuthState::Authenticated || to == AuthState::AuthenticationFailed;
  case AuthState::Authenticated:
  case AuthState::AuthenticationFailed:
    return false;
  }
  return false;
}

bool IsValidTransition(LocalAuthState from, LocalAuthState to) {
  return (from == LocalAuthState::NotStarted && to == LocalAuthState::AuthKeySent) ||
         (from == LocalAuthState::AuthKeySent && to == LocalAuthState::ChallengeAnswered);
}

Handshake::Handshake(std::shared_ptr<const crypto::PrivateKey> local_key) : local_key_(std::move(local_key)) {}

Handshake::~Handshake() {
  wipe_challenge();
}

bool Handshake::advance(AuthState to) {
  if (!IsValidTransition(state_, to)) {
    return false;
  }
  state_ = to;
  return true;
}

bool Handshake::advance(LocalAuthState to) {
  if (!IsValidTransition(local_state_, to)) {
    return false;
  }
  local_state_ = to;
  return true;
}

void Handshake::wipe_challenge() {
  crypto::SecureWipe(challenge_plaintext_);
  crypto::SecureWipe(challenge_iv_);
}

std::optional<crypto::PublicKey> Handshake::authenticated_key() const {
  if (state_ != AuthState::Authenticated) {
    return std::nullopt;
  }
  return claimed_key_;
}

HandshakeResult Handshake::BeginAuthentication(std::vector<uint8_t>& out_envelope) {
  if (!local_key_) {
    return HandshakeResult::CryptoFailure;
  }
  if (!IsValidTransition(local_state_, LocalAuthState::AuthKeySent)) {
    return HandshakeResult::InvalidState;
  }

  const crypto::PublicKey& pub = local_key_->public_key();
  out_envelope = EncodeAuthInit(AuthInit{ToVector(pub.x), ToVector(pub.y)});
  advance(LocalAuthState::AuthKeySent);
  return HandshakeResult::Ok;
}

HandshakeResult Handshake::OnAuthInit(const AuthInit& msg, std::vector<uint8_t>& out_envelope) {
  if (!IsValidTransition(state_, AuthState::ChallengeIssued)) {
    return HandshakeResult::InvalidState;
  }

  auto claimed = crypto::PublicKey::FromCoordinates(msg.x, msg.y);
  if (!claimed) {
    return HandshakeResult::InvalidKey;
  }

  auto ephemeral = crypto::PrivateKey::Generate();
  if (!ephemeral) {
    return HandshakeResult::CryptoFailure;
  }

  auto secret = ephemeral->ComputeSharedSecret(*claimed);
  if (!secret) {
    return HandshakeResult::CryptoFailure;
  }

  std::vector<uint8_t> plaintext(protocol::CHALLENGE_SIZE);
  std::vector<uint8_t> iv(protocol::CHALLENGE_IV_SIZE);
  if (!crypto::GetRandomBytes(plaintext) || !crypto::GetRandomBytes(iv)) {
    Cleanse(*secret);
    return HandshakeResult::CryptoFailure;
  }

  auto ciphertext = crypto::EncryptCfb(*secret, iv, plaintext);
  Cleanse(*secret);
  if (!ciphertext) {
    crypto::SecureWipe(plaintext);
    return HandshakeResult::CryptoFailure;
  }

  const crypto::PublicKey& eph_pub = ephemeral->public_key();
  out_envelope = EncodeAuthChallenge(AuthChallenge{ToVector(eph_pub.x), ToVector(eph_pub.y), std::move(*ciphertext), iv});

  claimed_key_ = *claimed;
  challenge_plaintext_ = std::move(plaintext);
  challenge_iv_ = std::move(iv);
  advance(AuthState::ChallengeIssued);
  return HandshakeResult::Ok;
}

HandshakeResult Handshake::OnChallenge(const AuthChallenge& msg, std::vector<uint8_t>& out_envelope) {
  if (!IsValidTransition(local_state_, LocalAuthState::ChallengeAnswered)) {
    return HandshakeResult::InvalidState;
  }
  if (!local_key_) {
    return HandshakeResult::CryptoFailure;
  }

  auto ephemeral = crypto::PublicKey::FromCoordinates(msg.x, msg.y);
  if (!ephemeral) {
    return HandshakeResult::InvalidKey;
  }

  auto secret = local_key_->ComputeSharedSecret(*ephemeral);
  if (!secret) {
    return HandshakeResult::CryptoFailure;
  }

  auto plaintext = crypto::DecryptCfb(*secret, msg.iv, msg.ciphertext);
  Cleanse(*secret);
  if (!plaintext) {
    return HandshakeResult::CryptoFailure;
  }

  AuthChallengeReply reply{std::move(*plaintext)};
  out_envelope = EncodeAuthChallengeReply(reply);
  crypto::SecureWipe(reply.plaintext);
  advance(LocalAuthState::ChallengeAnswered);
  return HandshakeResult::Ok;
}

HandshakeResult Handshake::OnChallengeReply(const AuthChallengeReply& msg) {
  if (state_ != AuthState::ChallengeIssued) {
    return HandshakeResult::InvalidState;
  }

  const bool match = crypto::ConstantTimeEqual(msg.plaintext, challenge_plaintext_);
  wipe_challenge();

  if (!match) {
    advance(AuthState::AuthenticationFailed);
    return HandshakeResult::InvalidResponse;
  }

  advance(AuthState::Authenticated);
  LOG_NET_DEBUG("peer authenticated as {}", claimed_key_ ? claimed_key_->ToHex() : std::string("?"));
  return HandshakeResult::Ok;
}

}  // namespace network
}  // namespace quorumwire

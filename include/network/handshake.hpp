// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keys.hpp"
#include "network/envelope.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quorumwire {
namespace network {

// Authentication of the remote peer (we are the responder)
//
//   NotAuthenticated --KEY_AUTH_INIT--> ChallengeIssued --reply ok--> Authenticated
//                                                       --mismatch--> AuthenticationFailed
//
// Authenticated and AuthenticationFailed are terminal.
enum class AuthState { NotAuthenticated, ChallengeIssued, Authenticated, AuthenticationFailed };

// Authentication of ourselves to the remote peer (we are the initiator)
enum class LocalAuthState { NotStarted, AuthKeySent, ChallengeAnswered };

enum class HandshakeResult {
  Ok,
  InvalidState,     // message not acceptable in the current state, nothing changed
  InvalidResponse,  // challenge reply did not match
  InvalidKey,       // claimed public key is not a secp256k1 point
  CryptoFailure     // RNG, ECDH or cipher failure
};

std::string AuthStateToString(AuthState state);
std::string LocalAuthStateToString(LocalAuthState state);
std::string HandshakeResultToString(HandshakeResult result);

// Transition tables; anything not listed is rejected
bool IsValidTransition(AuthState from, AuthState to);
bool IsValidTransition(LocalAuthState from, LocalAuthState to);

// Per-connection handshake state machine. Produces serialized envelopes for the
// caller to queue; performs no I/O. Not thread-safe: the owning Peer serializes
// access under its own mutex.
class Handshake {
public:
  explicit Handshake(std::shared_ptr<const crypto::PrivateKey> local_key);
  ~Handshake();

  Handshake(const Handshake&) = delete;
  Handshake& operator=(const Handshake&) = delete;

  // Initiator: KEY_AUTH_INIT with our long-term key. NotStarted -> AuthKeySent.
  HandshakeResult BeginAuthentication(std::vector<uint8_t>& out_envelope);

  // Responder: answer a claimed identity with an encrypted challenge.
  HandshakeResult OnAuthInit(const AuthInit& msg, std::vector<uint8_t>& out_envelope);

  // Initiator: decrypt the challenge with our long-term key and reply.
  HandshakeResult OnChallenge(const AuthChallenge& msg, std::vector<uint8_t>& out_envelope);

  // Responder: verify the reply against the retained plaintext.
  HandshakeResult OnChallengeReply(const AuthChallengeReply& msg);

  AuthState state() const { return state_; }
  LocalAuthState local_state() const { return local_state_; }

  // The remote identity, only once Authenticated
  std::optional<crypto::PublicKey> authenticated_key() const;

  // True while a challenge plaintext and IV are retained
  bool has_pending_challenge() const { return !challenge_plaintext_.empty(); }

private:
  bool advance(AuthState to);
  bool advance(LocalAuthState to);
  void wipe_challenge();

  std::shared_ptr<const crypto::PrivateKey> local_key_;
  AuthState state_{AuthState::NotAuthenticated};
  LocalAuthState local_state_{LocalAuthState::NotStarted};

  // Tentative identity claimed in KEY_AUTH_INIT
  std::optional<crypto::PublicKey> claimed_key_;

  // In-flight challenge (ChallengeIssued only)
  std::vector<uint8_t> challenge_plaintext_;
  std::vector<uint8_t> challenge_iv_;
};

}  // namespace network
}  // namespace quorumwire

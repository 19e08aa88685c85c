// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the challenge-response handshake state machine

#include <catch2/catch_test_macros.hpp>

#include "network/handshake.hpp"

#include <memory>
#include <vector>

using namespace quorumwire::network;
using namespace quorumwire::crypto;
using namespace quorumwire::protocol;

namespace {

std::shared_ptr<const PrivateKey> NewKey() {
    auto key = PrivateKey::Generate();
    if (!key) {
        return nullptr;
    }
    return std::make_shared<const PrivateKey>(*key);
}

Envelope Decode(const std::vector<uint8_t>& encoded) {
    Envelope env;
    REQUIRE(DecodeEnvelope(encoded, env) == DecodeError::None);
    return env;
}

// Drive initiator -> responder up to (but not including) the reply verification
struct HandshakePair {
    std::shared_ptr<const PrivateKey> initiator_key = NewKey();
    std::shared_ptr<const PrivateKey> responder_key = NewKey();
    Handshake initiator{initiator_key};
    Handshake responder{responder_key};

    AuthChallengeReply run_to_reply() {
        std::vector<uint8_t> out;
        REQUIRE(initiator.BeginAuthentication(out) == HandshakeResult::Ok);

        AuthInit init;
        REQUIRE(DecodeAuthInit(Decode(out).body, init) == DecodeError::None);
        REQUIRE(responder.OnAuthInit(init, out) == HandshakeResult::Ok);

        AuthChallenge challenge;
        REQUIRE(DecodeAuthChallenge(Decode(out).body, challenge) == DecodeError::None);
        REQUIRE(initiator.OnChallenge(challenge, out) == HandshakeResult::Ok);

        AuthChallengeReply reply;
        REQUIRE(DecodeAuthChallengeReply(Decode(out).body, reply) == DecodeError::None);
        return reply;
    }
};

}  // namespace

TEST_CASE("Handshake: successful authentication", "[handshake]") {
    HandshakePair pair;
    REQUIRE(pair.initiator_key);
    REQUIRE(pair.responder_key);

    auto reply = pair.run_to_reply();
    CHECK(pair.responder.state() == AuthState::ChallengeIssued);
    CHECK(pair.responder.has_pending_challenge());
    CHECK_FALSE(pair.responder.authenticated_key());
    CHECK(pair.initiator.local_state() == LocalAuthState::ChallengeAnswered);

    REQUIRE(pair.responder.OnChallengeReply(reply) == HandshakeResult::Ok);
    CHECK(pair.responder.state() == AuthState::Authenticated);
    CHECK_FALSE(pair.responder.has_pending_challenge());

    auto key = pair.responder.authenticated_key();
    REQUIRE(key);
    CHECK(*key == pair.initiator_key->public_key());

    SECTION("No transition out of Authenticated") {
        CHECK(pair.responder.OnChallengeReply(reply) == HandshakeResult::InvalidState);

        std::vector<uint8_t> out;
        const auto& pub = pair.initiator_key->public_key();
        AuthInit again{std::vector<uint8_t>(pub.x.begin(), pub.x.end()),
                       std::vector<uint8_t>(pub.y.begin(), pub.y.end())};
        CHECK(pair.responder.OnAuthInit(again, out) == HandshakeResult::InvalidState);
        CHECK(out.empty());
        CHECK(pair.responder.state() == AuthState::Authenticated);
    }
}

TEST_CASE("Handshake: corrupted reply fails authentication", "[handshake]") {
    HandshakePair pair;
    auto reply = pair.run_to_reply();
    reply.plaintext[17] ^= 0x01;

    CHECK(pair.responder.OnChallengeReply(reply) == HandshakeResult::InvalidResponse);
    CHECK(pair.responder.state() == AuthState::AuthenticationFailed);
    CHECK_FALSE(pair.responder.has_pending_challenge());
    CHECK_FALSE(pair.responder.authenticated_key());

    // Terminal: a correct reply afterwards changes nothing
    reply.plaintext[17] ^= 0x01;
    CHECK(pair.responder.OnChallengeReply(reply) == HandshakeResult::InvalidState);
    CHECK(pair.responder.state() == AuthState::AuthenticationFailed);
}

TEST_CASE("Handshake: out-of-order messages", "[handshake]") {
    auto key = NewKey();
    REQUIRE(key);
    Handshake hs(key);

    SECTION("Reply before init leaves state untouched") {
        AuthChallengeReply reply{std::vector<uint8_t>(CHALLENGE_SIZE, 0x00)};
        CHECK(hs.OnChallengeReply(reply) == HandshakeResult::InvalidState);
        CHECK(hs.state() == AuthState::NotAuthenticated);
    }

    SECTION("Challenge without our own init") {
        AuthChallenge challenge;
        std::vector<uint8_t> out;
        CHECK(hs.OnChallenge(challenge, out) == HandshakeResult::InvalidState);
        CHECK(hs.local_state() == LocalAuthState::NotStarted);
        CHECK(out.empty());
    }

    SECTION("Second BeginAuthentication") {
        std::vector<uint8_t> out;
        REQUIRE(hs.BeginAuthentication(out) == HandshakeResult::Ok);
        CHECK(hs.local_state() == LocalAuthState::AuthKeySent);
        std::vector<uint8_t> again;
        CHECK(hs.BeginAuthentication(again) == HandshakeResult::InvalidState);
        CHECK(again.empty());
    }

    SECTION("Second init while a challenge is pending") {
        HandshakePair pair;
        pair.run_to_reply();
        const auto& pub = pair.initiator_key->public_key();
        AuthInit again{std::vector<uint8_t>(pub.x.begin(), pub.x.end()),
                       std::vector<uint8_t>(pub.y.begin(), pub.y.end())};
        std::vector<uint8_t> out;
        CHECK(pair.responder.OnAuthInit(again, out) == HandshakeResult::InvalidState);
        CHECK(pair.responder.state() == AuthState::ChallengeIssued);
        CHECK(pair.responder.has_pending_challenge());
    }
}

TEST_CASE("Handshake: invalid claimed key", "[handshake]") {
    auto key = NewKey();
    REQUIRE(key);
    Handshake hs(key);

    const auto& pub = key->public_key();
    std::vector<uint8_t> y(pub.y.begin(), pub.y.end());
    y.back() ^= 0x01;
    AuthInit bad{std::vector<uint8_t>(pub.x.begin(), pub.x.end()), y};

    std::vector<uint8_t> out;
    CHECK(hs.OnAuthInit(bad, out) == HandshakeResult::InvalidKey);
    CHECK(hs.state() == AuthState::NotAuthenticated);
    CHECK_FALSE(hs.has_pending_challenge());
}

TEST_CASE("Handshake: challenge encrypted for another key", "[handshake]") {
    HandshakePair pair;
    std::vector<uint8_t> out;
    REQUIRE(pair.initiator.BeginAuthentication(out) == HandshakeResult::Ok);

    // An impostor claims the initiator's identity but holds a different key
    auto impostor_key = NewKey();
    REQUIRE(impostor_key);
    Handshake impostor(impostor_key);
    std::vector<uint8_t> impostor_init;
    REQUIRE(impostor.BeginAuthentication(impostor_init) == HandshakeResult::Ok);

    AuthInit claimed;
    REQUIRE(DecodeAuthInit(Decode(out).body, claimed) == DecodeError::None);
    REQUIRE(pair.responder.OnAuthInit(claimed, out) == HandshakeResult::Ok);

    AuthChallenge challenge;
    REQUIRE(DecodeAuthChallenge(Decode(out).body, challenge) == DecodeError::None);
    REQUIRE(impostor.OnChallenge(challenge, out) == HandshakeResult::Ok);

    AuthChallengeReply reply;
    REQUIRE(DecodeAuthChallengeReply(Decode(out).body, reply) == DecodeError::None);
    CHECK(pair.responder.OnChallengeReply(reply) == HandshakeResult::InvalidResponse);
    CHECK(pair.responder.state() == AuthState::AuthenticationFailed);
}

TEST_CASE("Handshake: transition tables", "[handshake]") {
    CHECK(IsValidTransition(AuthState::NotAuthenticated, AuthState::ChallengeIssued));
    CHECK(IsValidTransition(AuthState::ChallengeIssued, AuthState::Authenticated));
    CHECK(IsValidTransition(AuthState::ChallengeIssued, AuthState::AuthenticationFailed));

    CHECK_FALSE(IsValidTransition(AuthState::NotAuthenticated, AuthState::Authenticated));
    CHECK_FALSE(IsValidTransition(AuthState::NotAuthenticated, AuthState::AuthenticationFailed));
    CHECK_FALSE(IsValidTransition(AuthState::Authenticated, AuthState::NotAuthenticated));
    CHECK_FALSE(IsValidTransition(AuthState::Authenticated, AuthState::ChallengeIssued));
    CHECK_FALSE(IsValidTransition(AuthState::AuthenticationFailed, AuthState::Authenticated));
    CHECK_FALSE(IsValidTransition(AuthState::ChallengeIssued, AuthState::NotAuthenticated));

    CHECK(IsValidTransition(LocalAuthState::NotStarted, LocalAuthState::AuthKeySent));
    CHECK(IsValidTransition(LocalAuthState::AuthKeySent, LocalAuthState::ChallengeAnswered));
    CHECK_FALSE(IsValidTransition(LocalAuthState::NotStarted, LocalAuthState::ChallengeAnswered));
    CHECK_FALSE(IsValidTransition(LocalAuthState::ChallengeAnswered, LocalAuthState::NotStarted));

    CHECK(HandshakeResultToString(HandshakeResult::InvalidState) == "invalid authentication state");
    CHECK(AuthStateToString(AuthState::Authenticated) == "authenticated");
    CHECK(LocalAuthStateToString(LocalAuthState::AuthKeySent) == "auth-key-sent");
}

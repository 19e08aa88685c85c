// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "app/diagnostic_engine.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace quorumwire;

namespace {

class StubPeer : public network::ConsensusPeer {
public:
    std::error_code Send(std::span<const uint8_t>) override { return {}; }
    std::string RemoteAddr() const override { return "127.0.0.1:1"; }
    std::optional<crypto::PublicKey> GetPublicKey() const override { return std::nullopt; }
};

}  // namespace

TEST_CASE("DiagnosticEngine: counts consensus traffic", "[app][engine]") {
    app::DiagnosticEngine engine;
    const auto now = std::chrono::system_clock::now();

    CHECK_FALSE(engine.ReceiveMessage(std::vector<uint8_t>(10, 0x01), now));
    CHECK_FALSE(engine.ReceiveMessage(std::vector<uint8_t>(5, 0x02), now));
    CHECK(engine.messages_received() == 2);
    CHECK(engine.bytes_received() == 15);
}

TEST_CASE("DiagnosticEngine: peer registration", "[app][engine]") {
    app::DiagnosticEngine engine(std::chrono::seconds(1));
    const auto now = std::chrono::system_clock::now();

    CHECK_FALSE(engine.AddPeer(nullptr));

    auto kept = std::make_shared<StubPeer>();
    auto dropped = std::make_shared<StubPeer>();
    CHECK(engine.AddPeer(kept));
    CHECK(engine.AddPeer(dropped));
    CHECK(engine.live_peers() == 2);

    // The engine never extends a peer's lifetime
    dropped.reset();
    CHECK(engine.live_peers() == 1);

    CHECK_FALSE(engine.Update(now));
    CHECK_FALSE(engine.Update(now + std::chrono::seconds(2)));
    CHECK(engine.live_peers() == 1);
}

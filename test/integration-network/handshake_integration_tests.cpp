// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Two nodes on loopback authenticating each other and exchanging consensus traffic

#include <catch2/catch_test_macros.hpp>

#include "infra/network_test_util.hpp"
#include "network/network_manager.hpp"

#include <atomic>
#include <memory>

using namespace quorumwire;
using namespace quorumwire::network;
using namespace quorumwire::test;
using namespace std::chrono_literals;

namespace {

NetworkManager::Config LoopbackConfig(bool listen) {
    NetworkManager::Config config;
    config.listen_port = 0;
    config.listen_enabled = listen;
    config.bind_address = "127.0.0.1";
    config.io_threads = 2;
    config.agent.update_interval = 10ms;
    return config;
}

// One side of the pair: key, engine, manager
struct Node {
    std::shared_ptr<const crypto::PrivateKey> key = NewKey();
    std::shared_ptr<FakeEngine> engine = std::make_shared<FakeEngine>();
    std::unique_ptr<NetworkManager> manager;

    explicit Node(NetworkManager::Config config) {
        manager = std::make_unique<NetworkManager>(engine, key, std::move(config));
    }

    PeerPtr first_peer() {
        auto peers = manager->agent().peers();
        return peers.empty() ? nullptr : peers.front();
    }
};

bool IsAuthenticated(const PeerPtr& peer) {
    return peer && peer->auth_state() == AuthState::Authenticated &&
           peer->local_auth_state() == LocalAuthState::ChallengeAnswered;
}

}  // namespace

TEST_CASE("Handshake: two nodes authenticate mutually", "[network][handshake][integration]") {
    Node server(LoopbackConfig(true));
    Node client(LoopbackConfig(false));
    REQUIRE(server.manager->start());
    REQUIRE(client.manager->start());

    const uint16_t port = server.manager->listening_port();
    REQUIRE(port != 0);

    std::atomic<bool> dialed{false};
    REQUIRE(client.manager->connect_to("127.0.0.1", port, [&](PeerPtr peer, const asio::error_code& ec) {
        CHECK_FALSE(ec);
        CHECK(peer);
        dialed = true;
    }) == ConnectionResult::Success);
    REQUIRE(WaitFor([&] { return dialed.load(); }));

    REQUIRE(WaitFor([&] { return IsAuthenticated(server.first_peer()) && IsAuthenticated(client.first_peer()); }));

    auto server_side = server.first_peer();
    auto client_side = client.first_peer();
    CHECK(server_side->is_inbound());
    CHECK_FALSE(client_side->is_inbound());

    // Each side learned the other's long-term key
    auto seen_by_server = server_side->GetPublicKey();
    auto seen_by_client = client_side->GetPublicKey();
    REQUIRE(seen_by_server);
    REQUIRE(seen_by_client);
    CHECK(*seen_by_server == client.key->public_key());
    CHECK(*seen_by_client == server.key->public_key());

    SECTION("Consensus traffic flows both ways") {
        const std::vector<uint8_t> proposal = {0x10, 0x20, 0x30, 0x40};
        const std::vector<uint8_t> vote = {0xaa, 0xbb};

        REQUIRE(client.engine->peer_count() == 1);
        REQUIRE(server.engine->peer_count() == 1);
        CHECK_FALSE(client.engine->peers()[0]->Send(proposal));
        CHECK_FALSE(server.engine->peers()[0]->Send(vote));

        REQUIRE(WaitFor([&] { return server.engine->message_count() == 1 && client.engine->message_count() == 1; }));
        CHECK(server.engine->messages()[0] == proposal);
        CHECK(client.engine->messages()[0] == vote);
    }

    SECTION("Stopping one node disconnects the other") {
        server.manager->stop();
        CHECK(WaitFor([&] { return client.manager->agent().peer_count() == 0; }));
        CHECK_FALSE(client_side->is_open());
    }

    client.manager->stop();
    server.manager->stop();
}

TEST_CASE("Handshake: consensus before authentication is refused", "[network][handshake][integration]") {
    // The client never initiates, so the server never authenticates it
    auto client_config = LoopbackConfig(false);
    client_config.initiate_authentication = false;
    client_config.agent.require_authentication = false;

    Node server(LoopbackConfig(true));
    Node client(client_config);
    REQUIRE(server.manager->start());
    REQUIRE(client.manager->start());

    REQUIRE(client.manager->connect_to("127.0.0.1", server.manager->listening_port()) == ConnectionResult::Success);
    REQUIRE(WaitFor([&] { return client.engine->peer_count() == 1; }));

    CHECK_FALSE(client.engine->peers()[0]->Send(std::vector<uint8_t>{0x01}));

    CHECK(WaitFor([&] { return client.manager->agent().peer_count() == 0; }));
    CHECK(server.engine->message_count() == 0);

    client.manager->stop();
    server.manager->stop();
}

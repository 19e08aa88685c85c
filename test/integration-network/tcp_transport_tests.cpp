// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "infra/network_test_util.hpp"
#include "network/tcp_transport.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>

using namespace quorumwire::network;
using namespace quorumwire::test;
using namespace std::chrono_literals;

namespace {

// Result of one connect() call
struct DialOutcome {
    std::mutex mutex;
    std::atomic<int> calls{0};
    asio::error_code ec;
    std::optional<asio::ip::tcp::socket> socket;

    ConnectCallback callback() {
        return [this](const asio::error_code& error, asio::ip::tcp::socket s) {
            std::lock_guard<std::mutex> lock(mutex);
            ec = error;
            socket.emplace(std::move(s));
            calls.fetch_add(1);
        };
    }
};

}  // namespace

TEST_CASE("TcpTransport lifecycle is idempotent", "[network][transport]") {
    TestIoContext io;
    auto t = TcpTransport::create(io.get());
    CHECK(t->is_running());
    CHECK(t->listening_port() == 0);

    t->stop();
    t->stop();
    CHECK_FALSE(t->is_running());
}

TEST_CASE("TcpTransport listen and connect on loopback", "[network][transport]") {
    TestIoContext io;
    auto server = TcpTransport::create(io.get());
    auto client = TcpTransport::create(io.get());

    std::mutex accepted_mutex;
    std::optional<asio::ip::tcp::socket> accepted;
    REQUIRE(server->listen(
        0,
        [&](asio::ip::tcp::socket s) {
            std::lock_guard<std::mutex> lock(accepted_mutex);
            accepted.emplace(std::move(s));
        },
        "127.0.0.1"));
    const uint16_t port = server->listening_port();
    REQUIRE(port != 0);

    // A second listen on the same transport is refused
    CHECK_FALSE(server->listen(0, [](asio::ip::tcp::socket) {}));

    DialOutcome outcome;
    client->connect("127.0.0.1", port, outcome.callback());

    REQUIRE(WaitFor([&] { return outcome.calls.load() == 1; }));
    REQUIRE(WaitFor([&] {
        std::lock_guard<std::mutex> lock(accepted_mutex);
        return accepted.has_value();
    }));

    std::lock_guard<std::mutex> lock(outcome.mutex);
    CHECK_FALSE(outcome.ec);
    REQUIRE(outcome.socket);
    CHECK(outcome.socket->is_open());
    CHECK(outcome.socket->remote_endpoint().port() == port);

    // Bytes flow both ways
    const uint8_t ping[3] = {'p', 'n', 'g'};
    asio::write(*outcome.socket, asio::buffer(ping));
    uint8_t got[3] = {};
    {
        std::lock_guard<std::mutex> accepted_lock(accepted_mutex);
        asio::read(*accepted, asio::buffer(got));
    }
    CHECK(std::equal(std::begin(ping), std::end(ping), std::begin(got)));

    server->stop();
    client->stop();
}

TEST_CASE("TcpTransport dual-stack listener accepts IPv4", "[network][transport]") {
    TestIoContext io;
    auto server = TcpTransport::create(io.get());
    auto client = TcpTransport::create(io.get());

    std::atomic<int> accepted{0};
    REQUIRE(server->listen(0, [&](asio::ip::tcp::socket) { accepted.fetch_add(1); }));
    const uint16_t port = server->listening_port();
    REQUIRE(port != 0);

    DialOutcome outcome;
    client->connect("127.0.0.1", port, outcome.callback());
    REQUIRE(WaitFor([&] { return outcome.calls.load() == 1; }));
    CHECK(WaitFor([&] { return accepted.load() == 1; }));

    server->stop();
}

TEST_CASE("TcpTransport connect failures", "[network][transport]") {
    TestIoContext io;
    auto client = TcpTransport::create(io.get());

    SECTION("Refused") {
        // Bind then release a port so nothing listens there
        uint16_t port = 0;
        {
            asio::ip::tcp::acceptor scratch(io.get(), asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
            port = scratch.local_endpoint().port();
        }

        DialOutcome outcome;
        client->connect("127.0.0.1", port, outcome.callback());
        REQUIRE(WaitFor([&] { return outcome.calls.load() == 1; }));
        std::lock_guard<std::mutex> lock(outcome.mutex);
        CHECK(outcome.ec);
        CHECK_FALSE(outcome.socket->is_open());
    }

    SECTION("Deadline on an unroutable address") {
        client->set_connect_timeout(200ms);
        CHECK(client->connect_timeout() == 200ms);

        DialOutcome outcome;
        client->connect("10.255.255.1", 9, outcome.callback());
        // Either the deadline fires or the network reports unreachable first
        REQUIRE(WaitFor([&] { return outcome.calls.load() == 1; }, 3000ms));
        std::lock_guard<std::mutex> lock(outcome.mutex);
        CHECK(outcome.ec);
    }

    SECTION("Unresolvable host") {
        DialOutcome outcome;
        client->connect("no-such-host.invalid", 7580, outcome.callback());
        REQUIRE(WaitFor([&] { return outcome.calls.load() == 1; }, 10000ms));
        std::lock_guard<std::mutex> lock(outcome.mutex);
        CHECK(outcome.ec);
    }

    SECTION("After stop") {
        client->stop();
        DialOutcome outcome;
        client->connect("127.0.0.1", 1, outcome.callback());
        REQUIRE(WaitFor([&] { return outcome.calls.load() == 1; }));
        std::lock_guard<std::mutex> lock(outcome.mutex);
        CHECK(outcome.ec == asio::error::operation_aborted);
    }

    // The callback never fires twice
    std::this_thread::sleep_for(50ms);
}

TEST_CASE("TcpTransport stop_listening releases the port", "[network][transport]") {
    TestIoContext io;
    auto server = TcpTransport::create(io.get());

    REQUIRE(server->listen(0, [](asio::ip::tcp::socket) {}, "127.0.0.1"));
    CHECK(server->listening_port() != 0);

    server->stop_listening();
    CHECK(server->listening_port() == 0);

    // Listening again is allowed after stop_listening
    CHECK(server->listen(0, [](asio::ip::tcp::socket) {}, "127.0.0.1"));
    server->stop();
    CHECK(server->listening_port() == 0);
}

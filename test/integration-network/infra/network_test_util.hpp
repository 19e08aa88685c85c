// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Shared helpers for the loopback network tests

#pragma once

#include "crypto/keys.hpp"
#include "network/consensus_engine.hpp"
#include "network/framing.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <asio/executor_work_guard.hpp>

namespace quorumwire {
namespace test {

// io_context + worker thread for tests
class TestIoContext {
public:
    explicit TestIoContext(size_t threads = 1) : work_guard_(asio::make_work_guard(io_context_)) {
        for (size_t i = 0; i < threads; ++i) {
            threads_.emplace_back([this]() { io_context_.run(); });
        }
    }

    ~TestIoContext() {
        work_guard_.reset();
        io_context_.stop();
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    asio::io_context& get() { return io_context_; }

private:
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
};

// Poll until pred() holds or the timeout expires
inline bool WaitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Connected loopback socket pair; both ends belong to io
struct SocketPair {
    asio::ip::tcp::socket local;
    asio::ip::tcp::socket remote;
};

inline SocketPair MakeSocketPair(asio::io_context& io) {
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    asio::ip::tcp::socket remote(io);
    remote.connect(acceptor.local_endpoint());
    asio::ip::tcp::socket local(io);
    acceptor.accept(local);
    return SocketPair{std::move(local), std::move(remote)};
}

inline std::shared_ptr<const crypto::PrivateKey> NewKey() {
    auto key = crypto::PrivateKey::Generate();
    if (!key) {
        return nullptr;
    }
    return std::make_shared<const crypto::PrivateKey>(*key);
}

// Write one framed payload on a raw socket
inline void WriteFrame(asio::ip::tcp::socket& socket, std::span<const uint8_t> payload) {
    auto prefix = network::EncodeLength(static_cast<uint32_t>(payload.size()));
    asio::write(socket, asio::buffer(prefix));
    if (!payload.empty()) {
        asio::write(socket, asio::buffer(payload.data(), payload.size()));
    }
}

// Read one framed payload from a raw socket; nullopt on error or close
inline std::optional<std::vector<uint8_t>> ReadFrame(asio::ip::tcp::socket& socket) {
    network::LengthPrefix prefix{};
    asio::error_code ec;
    asio::read(socket, asio::buffer(prefix), ec);
    if (ec) {
        return std::nullopt;
    }
    uint32_t length = 0;
    if (network::DecodeLength(prefix, length) != network::FramingError::None) {
        return std::nullopt;
    }
    std::vector<uint8_t> payload(length);
    asio::read(socket, asio::buffer(payload), ec);
    if (ec) {
        return std::nullopt;
    }
    return payload;
}

// True once the remote end observes EOF or a reset; skips any frames still in flight
inline bool WaitForRemoteClose(asio::ip::tcp::socket& socket) {
    for (;;) {
        uint8_t byte = 0;
        asio::error_code ec;
        asio::read(socket, asio::buffer(&byte, 1), ec);
        if (ec) {
            return ec == asio::error::eof || ec == asio::error::connection_reset;
        }
    }
}

// Consensus engine double recording every call
class FakeEngine : public network::ConsensusEngine {
public:
    bool AddPeer(network::ConsensusPeerPtr peer) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accept_peers_) {
            ++rejected_;
            return false;
        }
        peers_.push_back(std::move(peer));
        return true;
    }

    std::error_code Update(TimePoint) override {
        updates_.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        return update_error_;
    }

    std::error_code ReceiveMessage(std::span<const uint8_t> payload, TimePoint) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.emplace_back(payload.begin(), payload.end());
        return receive_error_;
    }

    void set_accept_peers(bool accept) {
        std::lock_guard<std::mutex> lock(mutex_);
        accept_peers_ = accept;
    }
    void set_update_error(std::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        update_error_ = ec;
    }
    void set_receive_error(std::error_code ec) {
        std::lock_guard<std::mutex> lock(mutex_);
        receive_error_ = ec;
    }

    uint64_t updates() const { return updates_.load(); }

    size_t peer_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_.size();
    }
    size_t rejected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejected_;
    }
    std::vector<network::ConsensusPeerPtr> peers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_;
    }
    std::vector<std::vector<uint8_t>> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }
    size_t message_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

private:
    mutable std::mutex mutex_;
    bool accept_peers_{true};
    std::error_code update_error_;
    std::error_code receive_error_;
    size_t rejected_{0};
    std::vector<network::ConsensusPeerPtr> peers_;
    std::vector<std::vector<uint8_t>> messages_;
    std::atomic<uint64_t> updates_{0};
};

}  // namespace test
}  // namespace quorumwire

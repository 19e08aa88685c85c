// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keys.hpp"
#include "network/agent.hpp"
#include "network/consensus_engine.hpp"
#include "network/protocol.hpp"
#include "network/tcp_transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace quorumwire {
namespace network {

// Connection result codes
enum class ConnectionResult { Success, NotRunning, InvalidAddress };

std::string ConnectionResultToString(ConnectionResult result);

// Completion of an outbound dial: the attached peer, or nullptr with the reason
using DialCallback = std::function<void(PeerPtr peer, const asio::error_code& ec)>;

// NetworkManager - process-level owner of the networking stack
// Owns the io_context and its worker threads, the TCP transport and the Agent.
// Single-use: once stopped it cannot be started again.
class NetworkManager {
public:
  struct Config {
    uint16_t listen_port{protocol::DEFAULT_PORT};  // 0 = ephemeral
    bool listen_enabled{true};
    std::string bind_address;  // empty = all interfaces
    size_t io_threads{2};
    std::chrono::milliseconds connect_timeout{protocol::DEFAULT_CONNECT_TIMEOUT};
    // NOP keepalive period keeping idle links inside the read deadline (0 disables)
    std::chrono::milliseconds keepalive_interval{std::chrono::seconds(5)};
    // Send KEY_AUTH_INIT on every new connection, inbound and outbound
    bool initiate_authentication{true};
    Agent::Options agent;
  };

  NetworkManager(std::shared_ptr<ConsensusEngine> engine, std::shared_ptr<const crypto::PrivateKey> key,
                 Config config);
  ~NetworkManager();

  NetworkManager(const NetworkManager&) = delete;
  NetworkManager& operator=(const NetworkManager&) = delete;

  // Start listening, the agent update loop and the io threads.
  // Returns false if already started, stopped, or the listener cannot bind.
  bool start();

  // Close every peer, stop listening and join the io threads. Idempotent.
  // Must not be called from an io thread.
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Dial host:port and attach the connection to the agent
  ConnectionResult connect_to(const std::string& host, uint16_t port, DialCallback callback = {});

  // "host:port" or "[ipv6]:port"
  ConnectionResult connect_to(const std::string& host_port, DialCallback callback = {});

  uint16_t listening_port() const { return transport_->listening_port(); }

  Agent& agent() { return *agent_; }
  const Agent& agent() const { return *agent_; }
  asio::io_context& io_context() { return *io_context_; }

private:
  PeerPtr attach(asio::ip::tcp::socket socket, bool is_inbound);
  void schedule_keepalive();

  // Declared first: destroyed last, after everything holding sockets or timers
  std::unique_ptr<asio::io_context> io_context_;
  const Config config_;

  std::shared_ptr<TcpTransport> transport_;
  std::shared_ptr<Agent> agent_;
  std::unique_ptr<asio::steady_timer> keepalive_timer_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  std::mutex start_stop_mutex_;
  std::atomic<bool> running_{false};
  bool stopped_{false};  // guarded by start_stop_mutex_
};

}  // namespace network
}  // namespace quorumwire

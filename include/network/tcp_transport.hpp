// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <asio.hpp>

namespace quorumwire {
namespace network {

// Connected socket on success; ec set (asio::error::timed_out on deadline) otherwise.
// Invoked exactly once.
using ConnectCallback = std::function<void(const asio::error_code& ec, asio::ip::tcp::socket socket)>;
using AcceptCallback = std::function<void(asio::ip::tcp::socket socket)>;

// TcpTransport - TCP listener and dialer producing connected sockets
// Uses an external io_context; the caller runs it.
class TcpTransport : public std::enable_shared_from_this<TcpTransport> {
private:
  struct PrivateTag {};

public:
  static std::shared_ptr<TcpTransport> create(asio::io_context& io_context);

  TcpTransport(PrivateTag, asio::io_context& io_context);
  ~TcpTransport();

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  // Listen on port (0 = ephemeral). Empty bind_address means all interfaces,
  // dual-stack when available.
  bool listen(uint16_t port, AcceptCallback accept_callback, const std::string& bind_address = "");

  // Resolve and connect with the configured connect timeout
  void connect(const std::string& host, uint16_t port, ConnectCallback callback);

  void stop_listening();

  // Stop listening and refuse further connects
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Bound listening port (0 if not listening)
  uint16_t listening_port() const;

  void set_connect_timeout(std::chrono::milliseconds timeout) { connect_timeout_ms_.store(timeout.count()); }
  std::chrono::milliseconds connect_timeout() const { return std::chrono::milliseconds(connect_timeout_ms_.load()); }

  asio::io_context& io_context() { return io_context_; }

private:
  void start_accept();
  void handle_accept(const asio::error_code& ec, asio::ip::tcp::socket socket);

  asio::io_context& io_context_;
  std::atomic<bool> running_{true};
  std::atomic<int64_t> connect_timeout_ms_{
      std::chrono::duration_cast<std::chrono::milliseconds>(protocol::DEFAULT_CONNECT_TIMEOUT).count()};

  // Guarded by acceptor_mutex_
  mutable std::mutex acceptor_mutex_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  uint16_t last_listen_port_{0};
};

}  // namespace network
}  // namespace quorumwire

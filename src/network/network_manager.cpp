// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/network_manager.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace quorumwire {
namespace network {

namespace {
constexpr std::chrono::seconds SHUTDOWN_DRAIN_TIMEOUT{2};
}  // namespace

std::string ConnectionResultToString(ConnectionResult result) {
  switch (result) {
  case ConnectionResult::Success:
    return "success";
  case ConnectionResult::NotRunning:
    return "network not running";
  case ConnectionResult::InvalidAddress:
    return "invalid address";
  }
  return "unknown";
}

NetworkManager::NetworkManager(std::shared_ptr<ConsensusEngine> engine, std::shared_ptr<const crypto::PrivateKey> key,
                               Config config)
    : io_context_(std::make_unique<asio::io_context>()), config_(std::move(config)) {
  transport_ = TcpTransport::create(*io_context_);
  transport_->set_connect_timeout(config_.connect_timeout);
  agent_ = Agent::create(*io_context_, std::move(engine), std::move(key), config_.agent);
}

NetworkManager::~NetworkManager() {
  stop();
  // Release sockets and timers while the io_context still exists
  keepalive_timer_.reset();
  agent_.reset();
  transport_.reset();
}

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire) || stopped_) {
    return false;
  }
  if (config_.io_threads == 0) {
    LOG_NET_ERROR("network manager needs at least one io thread");
    return false;
  }

  if (config_.listen_enabled) {
    bool success = transport_->listen(
        config_.listen_port, [this](asio::ip::tcp::socket socket) { attach(std::move(socket), true); },
        config_.bind_address);
    if (!success) {
      LOG_NET_ERROR("failed to start listener on port {}", config_.listen_port);
      return false;
    }
  }

  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(*io_context_));
  running_.store(true, std::memory_order_release);

  agent_->Start();

  if (config_.keepalive_interval.count() > 0) {
    keepalive_timer_ = std::make_unique<asio::steady_timer>(*io_context_);
    schedule_keepalive();
  }

  for (size_t i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }

  LOG_NET_INFO("network started ({} io threads, node key {})", config_.io_threads, agent_->public_key().ToHex());
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    stopped_ = true;
    return;
  }
  stopped_ = true;

  if (keepalive_timer_) {
    (void)keepalive_timer_->cancel();
  }

  // 1. Close peers while the io threads still run so close handlers execute
  agent_->Shutdown();

  // 2. Stop accepting and dialing
  transport_->stop();

  // 3. Wait (bounded) for every peer's close to complete on its strand
  const auto deadline = std::chrono::steady_clock::now() + SHUTDOWN_DRAIN_TIMEOUT;
  while (agent_->peer_count() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  if (agent_->peer_count() > 0) {
    LOG_NET_WARN("{} peers still closing at shutdown", agent_->peer_count());
  }

  // 4. Stop the io_context
  work_guard_.reset();
  io_context_->stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  LOG_NET_INFO("network stopped");
}

PeerPtr NetworkManager::attach(asio::ip::tcp::socket socket, bool is_inbound) {
  if (!running_.load(std::memory_order_acquire)) {
    asio::error_code ignored;
    socket.close(ignored);
    return nullptr;
  }

  auto peer = agent_->AttachConnection(std::move(socket), is_inbound);
  if (peer && config_.initiate_authentication) {
    auto result = peer->InitiateAuthentication();
    if (result != HandshakeResult::Ok) {
      LOG_NET_DEBUG("peer={} auth not initiated: {}", peer->id(), HandshakeResultToString(result));
    }
  }
  return peer;
}

ConnectionResult NetworkManager::connect_to(const std::string& host, uint16_t port, DialCallback callback) {
  if (!running_.load(std::memory_order_acquire)) {
    return ConnectionResult::NotRunning;
  }
  if (host.empty() || port == 0) {
    return ConnectionResult::InvalidAddress;
  }

  LOG_NET_DEBUG("connecting to {}:{}", host, port);
  transport_->connect(host, port,
                      [this, host, port, callback = std::move(callback)](const asio::error_code& ec,
                                                                         asio::ip::tcp::socket socket) {
                        if (ec) {
                          LOG_NET_WARN("connection to {}:{} failed: {}", host, port, ec.message());
                          if (callback) {
                            callback(nullptr, ec);
                          }
                          return;
                        }
                        PeerPtr peer = attach(std::move(socket), false);
                        if (callback) {
                          callback(peer, peer ? asio::error_code{} : asio::error_code(asio::error::connection_refused));
                        }
                      });
  return ConnectionResult::Success;
}

ConnectionResult NetworkManager::connect_to(const std::string& host_port, DialCallback callback) {
  std::string host;
  uint16_t port = 0;
  if (!util::ParseHostPort(host_port, host, port)) {
    return ConnectionResult::InvalidAddress;
  }
  return connect_to(host, port, std::move(callback));
}

void NetworkManager::schedule_keepalive() {
  (void)keepalive_timer_->expires_after(config_.keepalive_interval);
  keepalive_timer_->async_wait([this](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || !running_.load(std::memory_order_acquire)) {
      return;
    }
    for (const auto& peer : agent_->peers()) {
      peer->SendKeepalive();
    }
    schedule_keepalive();
  });
}

}  // namespace network
}  // namespace quorumwire

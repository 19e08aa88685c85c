// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/agent.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <utility>

namespace quorumwire {
namespace network {

std::shared_ptr<Agent> Agent::create(asio::io_context& io_context, std::shared_ptr<ConsensusEngine> engine,
                                     std::shared_ptr<const crypto::PrivateKey> key, Options options) {
  return std::make_shared<Agent>(PrivateTag{}, io_context, std::move(engine), std::move(key), options);
}

Agent::Agent(PrivateTag, asio::io_context& io_context, std::shared_ptr<ConsensusEngine> engine,
             std::shared_ptr<const crypto::PrivateKey> key, Options options)
    : strand_(asio::make_strand(io_context)),
      update_timer_(strand_),
      key_(std::move(key)),
      options_(options),
      engine_(std::move(engine)) {}

Agent::~Agent() = default;

PeerPtr Agent::AttachConnection(asio::ip::tcp::socket socket, bool is_inbound) {
  Peer::Options peer_options;
  peer_options.read_timeout = options_.read_timeout;
  peer_options.write_timeout = options_.write_timeout;
  peer_options.require_authentication = options_.require_authentication;

  auto peer = Peer::create(std::move(socket), key_, is_inbound, peer_options);

  if (is_shutdown()) {
    peer->Close();
    return nullptr;
  }

  std::weak_ptr<Agent> weak_self = weak_from_this();
  peer->set_consensus_handler([weak_self](PeerPtr from, std::vector<uint8_t> payload) {
    if (auto self = weak_self.lock()) {
      self->HandleConsensusMessage(from, payload);
    }
  });
  peer->set_disconnect_handler([weak_self](PeerPtr closed) {
    if (auto self = weak_self.lock()) {
      self->remove_peer(closed);
    }
  });

  if (!AddPeer(peer)) {
    LOG_NET_DEBUG("engine rejected peer={} {}", peer->id(), peer->RemoteAddr());
    peer->Close();
    return nullptr;
  }

  peer->start();
  return peer;
}

bool Agent::AddPeer(const PeerPtr& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  // Shutdown() snapshots peers_ under this lock after raising the flag
  if (is_shutdown()) {
    return false;
  }
  if (!engine_->AddPeer(peer)) {
    return false;
  }
  peers_.push_back(peer);
  return true;
}

void Agent::Start() {
  if (started_.exchange(true) || is_shutdown()) {
    return;
  }
  LOG_NET_DEBUG("agent update loop started ({}ms interval)", options_.update_interval.count());
  asio::dispatch(strand_, [self = shared_from_this()]() { self->schedule_update(); });
}

void Agent::schedule_update() {
  if (is_shutdown()) {
    return;
  }

  (void)update_timer_.expires_after(options_.update_interval);
  update_timer_.async_wait(asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || self->is_shutdown()) {
      return;
    }
    self->run_update();
    // Re-arm only once Update() returned
    self->schedule_update();
  }));
}

void Agent::run_update() {
  std::error_code err;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    err = engine_->Update(util::GetSystemTime());
  }
  update_count_.fetch_add(1, std::memory_order_relaxed);

  if (err) {
    LOG_NET_ERROR_RL(0, "consensus engine update failed: {}", err.message());
  }
}

void Agent::HandleConsensusMessage(const PeerPtr& peer, std::span<const uint8_t> payload) {
  std::error_code err;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    err = engine_->ReceiveMessage(payload, util::GetSystemTime());
  }

  if (err) {
    LOG_NET_WARN_RL(peer ? peer->id() : 0, "consensus engine rejected message from peer={} {}: {}",
                    peer ? peer->id() : 0, peer ? peer->RemoteAddr() : std::string("?"), err.message());
  }
}

void Agent::remove_peer(const PeerPtr& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.erase(std::remove(peers_.begin(), peers_.end(), peer), peers_.end());
}

std::vector<PeerPtr> Agent::peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

size_t Agent::peer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

void Agent::Shutdown() {
  if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
    return;  // Already shut down
  }

  LOG_NET_DEBUG("agent shutting down");

  asio::dispatch(strand_, [self = shared_from_this()]() { (void)self->update_timer_.cancel(); });

  // Close outside the agent lock; disconnect handlers take it
  std::vector<PeerPtr> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    to_close = peers_;
  }
  for (const auto& peer : to_close) {
    peer->Close();
  }
}

}  // namespace network
}  // namespace quorumwire

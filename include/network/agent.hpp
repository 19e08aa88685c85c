// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keys.hpp"
#include "network/consensus_engine.hpp"
#include "network/peer.hpp"
#include "network/protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

#include <asio.hpp>

namespace quorumwire {
namespace network {

// Agent - owns the consensus engine and the node key, tracks connected peers,
// drives the periodic Update() and forwards inbound consensus payloads.
//
// Lock order: Agent::mutex_ may be held while the engine calls into a Peer
// (Send takes the peer lock). A Peer never calls the Agent while holding its own lock.
class Agent : public std::enable_shared_from_this<Agent> {
private:
  struct PrivateTag {};

public:
  struct Options {
    std::chrono::milliseconds update_interval{protocol::DEFAULT_UPDATE_INTERVAL};
    std::chrono::milliseconds read_timeout{protocol::DEFAULT_READ_TIMEOUT};
    std::chrono::milliseconds write_timeout{protocol::DEFAULT_WRITE_TIMEOUT};
    // CONSENSUS traffic from a peer that has not authenticated closes the connection
    bool require_authentication{true};
  };

  static std::shared_ptr<Agent> create(asio::io_context& io_context, std::shared_ptr<ConsensusEngine> engine,
                                       std::shared_ptr<const crypto::PrivateKey> key, Options options);

  Agent(PrivateTag, asio::io_context& io_context, std::shared_ptr<ConsensusEngine> engine,
        std::shared_ptr<const crypto::PrivateKey> key, Options options);
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Wrap a connected socket in a Peer, register it and start it.
  // Returns nullptr (and closes the socket) if the engine rejected the peer or the
  // agent is shut down.
  PeerPtr AttachConnection(asio::ip::tcp::socket socket, bool is_inbound);

  // Register a peer with the engine; returns the engine's verdict
  bool AddPeer(const PeerPtr& peer);

  // Start the periodic engine Update(). Only the first call has an effect.
  void Start();

  // Forward a CONSENSUS body to the engine
  void HandleConsensusMessage(const PeerPtr& peer, std::span<const uint8_t> payload);

  // Stop the update loop and close every peer. Idempotent, thread-safe.
  void Shutdown();

  bool is_shutdown() const { return shutdown_.load(std::memory_order_acquire); }

  std::vector<PeerPtr> peers() const;
  size_t peer_count() const;
  uint64_t update_count() const { return update_count_.load(std::memory_order_relaxed); }

  const crypto::PublicKey& public_key() const { return key_->public_key(); }
  const std::shared_ptr<const crypto::PrivateKey>& private_key() const { return key_; }
  const Options& options() const { return options_; }

private:
  void schedule_update();
  void run_update();
  void remove_peer(const PeerPtr& peer);

  asio::strand<asio::io_context::executor_type> strand_;
  asio::steady_timer update_timer_;

  const std::shared_ptr<const crypto::PrivateKey> key_;
  const Options options_;

  // Guarded by mutex_
  mutable std::mutex mutex_;
  std::shared_ptr<ConsensusEngine> engine_;
  std::vector<PeerPtr> peers_;

  std::atomic<bool> started_{false};
  std::atomic<bool> shutdown_{false};
  std::atomic<uint64_t> update_count_{0};
};

}  // namespace network
}  // namespace quorumwire

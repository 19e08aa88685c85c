// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keys.hpp"
#include "network/consensus_engine.hpp"
#include "network/envelope.hpp"
#include "network/framing.hpp"
#include "network/handshake.hpp"
#include "network/protocol.hpp"
#include "util/notification.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>

namespace quorumwire {
namespace network {

class Peer;
using PeerPtr = std::shared_ptr<Peer>;

// Inbound consensus payload (CONSENSUS envelope body). Invoked on the peer's strand
// without the peer lock held.
using ConsensusHandler = std::function<void(PeerPtr peer, std::vector<uint8_t> payload)>;

// Delivered exactly once after the connection closed
using DisconnectHandler = std::function<void(PeerPtr peer)>;

// Peer - one authenticated TCP connection
//
// Runs two independent async chains on a per-peer strand:
// - read chain: length prefix -> body -> envelope -> handshake or consensus handler
// - write chain: parks on wake_timer_ until a queue is notified, swaps the queues
//   out under the peer lock, then frames and writes each payload in order
//   (internal traffic before consensus traffic)
//
// Any read, framing, decode or handshake error closes the connection. A Peer is
// single-use: once closed it is never reconnected.
//
// Threading Model:
// - Send(), InitiateAuthentication(), SendKeepalive(), GetPublicKey() and Close()
//   are safe from any thread
// - mutex_ guards the handshake and both queues; it is never held across socket
//   operations or while calling handlers
class Peer : public ConsensusPeer, public std::enable_shared_from_this<Peer> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  struct Options {
    std::chrono::milliseconds read_timeout{protocol::DEFAULT_READ_TIMEOUT};
    std::chrono::milliseconds write_timeout{protocol::DEFAULT_WRITE_TIMEOUT};
    // Reject CONSENSUS traffic until the remote peer authenticated
    bool require_authentication{true};
  };

  static PeerPtr create(asio::ip::tcp::socket socket, std::shared_ptr<const crypto::PrivateKey> local_key,
                        bool is_inbound, Options options);
  static PeerPtr create(asio::ip::tcp::socket socket, std::shared_ptr<const crypto::PrivateKey> local_key,
                        bool is_inbound) {
    return create(std::move(socket), std::move(local_key), is_inbound, Options{});
  }

  // Public constructor for make_shared, but requires PrivateTag (passkey idiom)
  Peer(PrivateTag, asio::ip::tcp::socket socket, std::shared_ptr<const crypto::PrivateKey> local_key,
       bool is_inbound, Options options);
  ~Peer() override;

  Peer(const Peer&) = delete;
  Peer& operator=(const Peer&) = delete;

  // Handlers must be installed before start()
  void set_consensus_handler(ConsensusHandler handler);
  void set_disconnect_handler(DisconnectHandler handler);

  // Start the read and write chains. Only the first call has an effect.
  void start();

  // ConsensusPeer
  std::error_code Send(std::span<const uint8_t> payload) override;
  std::string RemoteAddr() const override { return remote_addr_; }
  std::optional<crypto::PublicKey> GetPublicKey() const override;

  // Idempotent, thread-safe. Closes the socket once and fires the disconnect handler once.
  void Close();

  // Queue KEY_AUTH_INIT with our long-term key
  HandshakeResult InitiateAuthentication();

  // Queue a NOP envelope
  void SendKeepalive();

  AuthState auth_state() const;
  LocalAuthState local_auth_state() const;
  bool is_open() const { return !closed_.load(std::memory_order_acquire); }
  bool is_inbound() const { return is_inbound_; }
  uint64_t id() const { return id_; }

private:
  // Queue a serialized envelope on the internal queue (mutex_ held)
  bool enqueue_internal_locked(std::vector<uint8_t> envelope);
  // Wake the writer if this call filled an empty notification slot
  void notify_writer(util::Notification& notification);

  // Read chain (strand)
  void read_prefix();
  void read_body(uint32_t length);
  bool handle_payload(const std::vector<uint8_t>& payload);
  bool handle_handshake(const Envelope& envelope);
  bool handle_consensus(Envelope& envelope);

  // Write chain (strand)
  void start_write_cycle();
  void wait_for_work();
  void write_next();

  void arm_deadline(asio::steady_timer& timer, std::chrono::milliseconds timeout, const char* what);

  // Log and close; used by every fatal path
  void fail(const std::string& reason);
  void close_impl();

  asio::ip::tcp::socket socket_;
  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer read_deadline_;
  asio::steady_timer write_deadline_;
  asio::steady_timer wake_timer_;

  const Options options_;
  const bool is_inbound_;
  const uint64_t id_;
  std::string remote_addr_;
  static std::atomic<uint64_t> next_id_;

  // Guarded by mutex_
  mutable std::mutex mutex_;
  Handshake handshake_;
  std::vector<std::vector<uint8_t>> consensus_queue_;
  std::vector<std::vector<uint8_t>> internal_queue_;
  ConsensusHandler consensus_handler_;
  DisconnectHandler disconnect_handler_;

  util::Notification consensus_ready_;
  util::Notification internal_ready_;

  std::atomic<bool> started_{false};
  std::atomic<bool> closed_{false};

  // Strand-only state
  LengthPrefix read_prefix_{};
  std::vector<uint8_t> read_buffer_;
  std::deque<std::vector<uint8_t>> outgoing_;  // framed, in write order
};

}  // namespace network
}  // namespace quorumwire

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer.hpp"

#include "util/logging.hpp"

#include <utility>

namespace quorumwire {
namespace network {

std::atomic<uint64_t> Peer::next_id_{1};

namespace {

std::string FormatEndpoint(const asio::ip::tcp::endpoint& ep) {
  asio::ip::address addr = ep.address();
  // Dual-stack listeners report IPv4 peers as ::ffff:a.b.c.d
  if (addr.is_v6() && addr.to_v6().is_v4_mapped()) {
    addr = asio::ip::make_address_v4(asio::ip::v4_mapped, addr.to_v6());
  }
  if (addr.is_v6()) {
    return "[" + addr.to_string() + "]:" + std::to_string(ep.port());
  }
  return addr.to_string() + ":" + std::to_string(ep.port());
}

// Push the expiry out so a stale expiry handler sees a future deadline and exits
void Disarm(asio::steady_timer& timer) {
  (void)timer.expires_at(asio::steady_timer::time_point::max());
}

}  // namespace

PeerPtr Peer::create(asio::ip::tcp::socket socket, std::shared_ptr<const crypto::PrivateKey> local_key,
                     bool is_inbound, Options options) {
  return std::make_shared<Peer>(PrivateTag{}, std::move(socket), std::move(local_key), is_inbound, options);
}

Peer::Peer(PrivateTag, asio::ip::tcp::socket socket, std::shared_ptr<const crypto::PrivateKey> local_key,
           bool is_inbound, Options options)
    : socket_(std::move(socket)),
      strand_(asio::make_strand(socket_.get_executor())),
      read_deadline_(strand_),
      write_deadline_(strand_),
      wake_timer_(strand_),
      options_(options),
      is_inbound_(is_inbound),
      id_(next_id_++),
      handshake_(std::move(local_key)) {
  asio::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  remote_addr_ = ec ? std::string("unknown") : FormatEndpoint(ep);
}

Peer::~Peer() {
  LOG_NET_TRACE("peer={} destroyed", id_);
}

void Peer::set_consensus_handler(ConsensusHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  consensus_handler_ = std::move(handler);
}

void Peer::set_disconnect_handler(DisconnectHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect_handler_ = std::move(handler);
}

void Peer::start() {
  if (started_.exchange(true)) {
    LOG_NET_ERROR("peer={} restart attempted; Peer objects are single-use", id_);
    return;
  }

  LOG_NET_DEBUG("starting {} peer={} {}", is_inbound_ ? "inbound" : "outbound", id_, remote_addr_);

  asio::dispatch(strand_, [self = shared_from_this()]() {
    if (self->closed_.load(std::memory_order_acquire)) {
      return;
    }
    self->read_prefix();
    self->start_write_cycle();
  });
}

// ============================================================================
// Outgoing queues
// ============================================================================

std::error_code Peer::Send(std::span<const uint8_t> payload) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.load(std::memory_order_acquire)) {
      return {};
    }
    consensus_queue_.emplace_back(payload.begin(), payload.end());
  }
  notify_writer(consensus_ready_);
  return {};
}

HandshakeResult Peer::InitiateAuthentication() {
  HandshakeResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint8_t> envelope;
    result = handshake_.BeginAuthentication(envelope);
    if (result == HandshakeResult::Ok) {
      enqueue_internal_locked(std::move(envelope));
    }
  }

  if (result != HandshakeResult::Ok) {
    LOG_NET_DEBUG("peer={} cannot initiate authentication: {}", id_, HandshakeResultToString(result));
    return result;
  }

  LOG_NET_DEBUG("peer={} sent KEY_AUTH_INIT", id_);
  notify_writer(internal_ready_);
  return result;
}

void Peer::SendKeepalive() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    enqueue_internal_locked(EncodeNop());
  }
  notify_writer(internal_ready_);
}

bool Peer::enqueue_internal_locked(std::vector<uint8_t> envelope) {
  if (closed_.load(std::memory_order_acquire)) {
    return false;
  }
  internal_queue_.push_back(std::move(envelope));
  return true;
}

void Peer::notify_writer(util::Notification& notification) {
  if (!notification.notify()) {
    return;  // a wakeup is already pending
  }
  asio::post(strand_, [self = shared_from_this()]() { (void)self->wake_timer_.cancel(); });
}

std::optional<crypto::PublicKey> Peer::GetPublicKey() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handshake_.authenticated_key();
}

AuthState Peer::auth_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handshake_.state();
}

LocalAuthState Peer::local_auth_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handshake_.local_state();
}

// ============================================================================
// Read chain
// ============================================================================

void Peer::arm_deadline(asio::steady_timer& timer, std::chrono::milliseconds timeout, const char* what) {
  (void)timer.expires_after(timeout);
  timer.async_wait(
      asio::bind_executor(strand_, [this, self = shared_from_this(), &timer, what](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || closed_.load(std::memory_order_acquire)) {
          return;
        }
        // Re-armed or disarmed after this wait completed
        if (timer.expiry() > asio::steady_timer::clock_type::now()) {
          return;
        }
        fail(std::string(what) + " timeout");
      }));
}

void Peer::read_prefix() {
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }

  arm_deadline(read_deadline_, options_.read_timeout, "read");
  asio::async_read(socket_, asio::buffer(read_prefix_),
                   asio::bind_executor(strand_, [this, self = shared_from_this()](const asio::error_code& ec, size_t) {
                     Disarm(read_deadline_);
                     if (closed_.load(std::memory_order_acquire)) {
                       return;
                     }
                     if (ec) {
                       if (ec == asio::error::eof) {
                         LOG_NET_DEBUG("peer={} {} closed the connection", id_, remote_addr_);
                         Close();
                       } else {
                         fail("read error: " + ec.message());
                       }
                       return;
                     }

                     uint32_t length = 0;
                     FramingError err = DecodeLength(read_prefix_, length);
                     if (err != FramingError::None) {
                       fail("framing error: " + FramingErrorToString(err));
                       return;
                     }
                     read_body(length);
                   }));
}

void Peer::read_body(uint32_t length) {
  read_buffer_.resize(length);

  arm_deadline(read_deadline_, options_.read_timeout, "read");
  asio::async_read(socket_, asio::buffer(read_buffer_),
                   asio::bind_executor(strand_, [this, self = shared_from_this()](const asio::error_code& ec, size_t) {
                     Disarm(read_deadline_);
                     if (closed_.load(std::memory_order_acquire)) {
                       return;
                     }
                     if (ec) {
                       fail("read error: " + ec.message());
                       return;
                     }

                     std::vector<uint8_t> payload;
                     payload.swap(read_buffer_);
                     if (handle_payload(payload)) {
                       read_prefix();
                     }
                   }));
}

bool Peer::handle_payload(const std::vector<uint8_t>& payload) {
  Envelope envelope;
  DecodeError err = DecodeEnvelope(payload, envelope);
  if (err != DecodeError::None) {
    fail("malformed envelope: " + DecodeErrorToString(err));
    return false;
  }

  LOG_NET_TRACE("peer={} received {} ({} bytes)", id_, CommandToString(envelope.command), payload.size());

  switch (envelope.command) {
  case protocol::commands::NOP:
    return true;
  case protocol::commands::CONSENSUS:
    return handle_consensus(envelope);
  default:
    return handle_handshake(envelope);
  }
}

bool Peer::handle_handshake(const Envelope& envelope) {
  DecodeError decode_error = DecodeError::None;
  HandshakeResult result = HandshakeResult::Ok;
  bool queued = false;
  std::optional<crypto::PublicKey> authenticated;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint8_t> reply;

    switch (envelope.command) {
    case protocol::commands::KEY_AUTH_INIT: {
      AuthInit msg;
      decode_error = DecodeAuthInit(envelope.body, msg);
      if (decode_error == DecodeError::None) {
        result = handshake_.OnAuthInit(msg, reply);
      }
      break;
    }
    case protocol::commands::KEY_AUTH_CHALLENGE: {
      AuthChallenge msg;
      decode_error = DecodeAuthChallenge(envelope.body, msg);
      if (decode_error == DecodeError::None) {
        result = handshake_.OnChallenge(msg, reply);
      }
      break;
    }
    case protocol::commands::KEY_AUTH_CHALLENGE_REPLY: {
      AuthChallengeReply msg;
      decode_error = DecodeAuthChallengeReply(envelope.body, msg);
      if (decode_error == DecodeError::None) {
        result = handshake_.OnChallengeReply(msg);
        authenticated = handshake_.authenticated_key();
      }
      crypto::SecureWipe(msg.plaintext);
      break;
    }
    default:
      decode_error = DecodeError::UnknownCommand;
      break;
    }

    if (decode_error == DecodeError::None && result == HandshakeResult::Ok && !reply.empty()) {
      queued = enqueue_internal_locked(std::move(reply));
    }
  }

  if (decode_error != DecodeError::None) {
    fail("malformed " + CommandToString(envelope.command) + ": " + DecodeErrorToString(decode_error));
    return false;
  }
  if (result != HandshakeResult::Ok) {
    fail(CommandToString(envelope.command) + " rejected: " + HandshakeResultToString(result));
    return false;
  }

  if (queued) {
    notify_writer(internal_ready_);
  }
  if (authenticated) {
    LOG_NET_INFO("peer={} {} authenticated as {}", id_, remote_addr_, authenticated->ToHex());
  }
  return true;
}

bool Peer::handle_consensus(Envelope& envelope) {
  ConsensusHandler handler;
  bool trusted = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (options_.require_authentication && handshake_.state() != AuthState::Authenticated) {
      trusted = false;
    } else {
      handler = consensus_handler_;
    }
  }

  if (!trusted) {
    fail("consensus message from unauthenticated peer");
    return false;
  }

  if (handler) {
    handler(shared_from_this(), std::move(envelope.body));
  }
  return !closed_.load(std::memory_order_acquire);
}

// ============================================================================
// Write chain
// ============================================================================

void Peer::start_write_cycle() {
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }

  // Consume before swapping so an enqueue racing with the swap leaves a pending signal
  (void)internal_ready_.consume();
  (void)consensus_ready_.consume();

  std::vector<std::vector<uint8_t>> internal;
  std::vector<std::vector<uint8_t>> consensus;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    internal.swap(internal_queue_);
    consensus.swap(consensus_queue_);
  }

  if (internal.empty() && consensus.empty()) {
    wait_for_work();
    return;
  }

  FramingError err = FramingError::None;
  for (const auto& envelope : internal) {
    auto framed = Frame(envelope, &err);
    if (!framed) {
      fail("refusing to send internal message: " + FramingErrorToString(err));
      return;
    }
    outgoing_.push_back(std::move(*framed));
  }
  for (const auto& payload : consensus) {
    auto framed = Frame(EncodeConsensus(payload), &err);
    if (!framed) {
      fail("refusing to send consensus message: " + FramingErrorToString(err));
      return;
    }
    outgoing_.push_back(std::move(*framed));
  }

  write_next();
}

void Peer::wait_for_work() {
  if (internal_ready_.pending() || consensus_ready_.pending()) {
    asio::post(strand_, [self = shared_from_this()]() { self->start_write_cycle(); });
    return;
  }

  (void)wake_timer_.expires_at(asio::steady_timer::time_point::max());
  wake_timer_.async_wait(asio::bind_executor(strand_, [self = shared_from_this()](const asio::error_code&) {
    // Woken by cancel() from notify_writer() or close_impl()
    if (self->closed_.load(std::memory_order_acquire)) {
      return;
    }
    self->start_write_cycle();
  }));
}

void Peer::write_next() {
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }
  if (outgoing_.empty()) {
    start_write_cycle();
    return;
  }

  arm_deadline(write_deadline_, options_.write_timeout, "write");
  asio::async_write(socket_, asio::buffer(outgoing_.front()),
                    asio::bind_executor(strand_, [this, self = shared_from_this()](const asio::error_code& ec, size_t) {
                      Disarm(write_deadline_);
                      if (closed_.load(std::memory_order_acquire)) {
                        return;
                      }
                      if (ec) {
                        fail("write error: " + ec.message());
                        return;
                      }
                      outgoing_.pop_front();
                      write_next();
                    }));
}

// ============================================================================
// Shutdown
// ============================================================================

void Peer::fail(const std::string& reason) {
  if (closed_.load(std::memory_order_acquire)) {
    return;
  }
  LOG_NET_WARN_RL(id_, "closing peer={} {}: {}", id_, remote_addr_, reason);
  Close();
}

void Peer::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;  // Already closed
  }
  asio::dispatch(strand_, [self = shared_from_this()]() { self->close_impl(); });
}

void Peer::close_impl() {
  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);

  (void)read_deadline_.cancel();
  (void)write_deadline_.cancel();
  (void)wake_timer_.cancel();
  outgoing_.clear();

  DisconnectHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    consensus_queue_.clear();
    internal_queue_.clear();
    consensus_handler_ = {};
    handler = std::move(disconnect_handler_);
    disconnect_handler_ = {};
  }

  LOG_NET_DEBUG("peer={} {} disconnected", id_, remote_addr_);
  util::PeerLogBudget::instance().Forget(id_);

  if (handler) {
    // Post to the io_context (not the strand) so the handler may take other locks freely
    asio::post(socket_.get_executor(), [handler = std::move(handler), self = shared_from_this()]() { handler(self); });
  }
}

}  // namespace network
}  // namespace quorumwire

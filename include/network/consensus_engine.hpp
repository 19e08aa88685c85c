// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/keys.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>

namespace quorumwire {
namespace network {

// Connection as seen by the consensus engine
class ConsensusPeer {
public:
  virtual ~ConsensusPeer() = default;

  // Queue a consensus payload; never blocks and always succeeds locally
  virtual std::error_code Send(std::span<const uint8_t> payload) = 0;

  virtual std::string RemoteAddr() const = 0;

  // Present only once the peer proved ownership of the key
  virtual std::optional<crypto::PublicKey> GetPublicKey() const = 0;
};

using ConsensusPeerPtr = std::shared_ptr<ConsensusPeer>;

// Opaque consensus algorithm driven by the Agent. All calls come from the Agent
// under its lock, so implementations need no locking of their own.
class ConsensusEngine {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  virtual ~ConsensusEngine() = default;

  // Register a connection; false rejects it
  virtual bool AddPeer(ConsensusPeerPtr peer) = 0;

  // Periodic tick
  virtual std::error_code Update(TimePoint now) = 0;

  // Inbound consensus payload (CONSENSUS envelope body)
  virtual std::error_code ReceiveMessage(std::span<const uint8_t> payload, TimePoint now) = 0;
};

}  // namespace network
}  // namespace quorumwire

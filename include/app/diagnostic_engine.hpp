// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/consensus_engine.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace quorumwire {
namespace app {

// Stand-in consensus engine for quorumwired: accepts every peer, counts inbound
// consensus traffic and periodically logs connection and authentication status.
// Called only by the Agent, under its lock.
class DiagnosticEngine : public network::ConsensusEngine {
public:
  explicit DiagnosticEngine(std::chrono::seconds report_interval = std::chrono::seconds(30));

  bool AddPeer(network::ConsensusPeerPtr peer) override;
  std::error_code Update(TimePoint now) override;
  std::error_code ReceiveMessage(std::span<const uint8_t> payload, TimePoint now) override;

  uint64_t messages_received() const { return messages_received_; }
  uint64_t bytes_received() const { return bytes_received_; }

  // Registered peers that are still alive
  size_t live_peers() const;

private:
  void report();

  const std::chrono::seconds report_interval_;
  TimePoint next_report_{};
  std::vector<std::weak_ptr<network::ConsensusPeer>> peers_;
  uint64_t messages_received_{0};
  uint64_t bytes_received_{0};
};

}  // namespace app
}  // namespace quorumwire

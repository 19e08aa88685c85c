// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace quorumwire {
namespace util {

/**
 * PeerLogBudget - log line allowance for events a remote peer can trigger
 *
 * Two token buckets guard every rate-limited callsite: one shared by all
 * peers, and one per (peer, callsite). A single misbehaving peer exhausts
 * its own bucket long before the shared one, so the remaining peers keep
 * their log lines. Buckets start full and refill linearly over the period.
 *
 * Peer id 0 means "not tied to a peer": only the shared bucket applies.
 */
class PeerLogBudget {
public:
  struct Limits {
    int callsite_burst = 200;  // all peers together
    int peer_burst = 20;       // one peer
    std::chrono::seconds refill_period{3600};
  };

  PeerLogBudget() = default;
  explicit PeerLogBudget(const Limits& limits) : limits_(limits) {}

  // Spend one line at `callsite` for `peer_id`. A refused peer does not
  // drain the shared bucket.
  bool Allow(const std::string& callsite, uint64_t peer_id);

  // Release the buckets held for a peer that went away
  void Forget(uint64_t peer_id);

  size_t tracked_peers() const;

  const Limits& limits() const { return limits_; }

  static PeerLogBudget& instance();

private:
  struct Bucket {
    double tokens = -1.0;  // negative until first use
    std::chrono::steady_clock::time_point stamp;
  };

  void Refill(Bucket& bucket, int capacity, std::chrono::steady_clock::time_point now) const;

  Limits limits_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Bucket> callsites_;
  std::unordered_map<uint64_t, std::unordered_map<std::string, Bucket>> peers_;
};

}  // namespace util
}  // namespace quorumwire

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/log_budget.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace quorumwire {
namespace util {

void PeerLogBudget::Refill(Bucket& bucket, int capacity, std::chrono::steady_clock::time_point now) const {
  if (bucket.tokens < 0.0) {
    bucket.tokens = capacity;
    bucket.stamp = now;
    return;
  }
  if (now <= bucket.stamp) {
    return;
  }
  std::chrono::duration<double> elapsed = now - bucket.stamp;
  std::chrono::duration<double> period = limits_.refill_period;
  bucket.tokens = std::min<double>(capacity, bucket.tokens + capacity * elapsed.count() / period.count());
  bucket.stamp = now;
}

bool PeerLogBudget::Allow(const std::string& callsite, uint64_t peer_id) {
  const auto now = GetSteadyTime();
  std::lock_guard<std::mutex> lock(mutex_);

  Bucket& shared = callsites_[callsite];
  Refill(shared, limits_.callsite_burst, now);

  Bucket* own = nullptr;
  if (peer_id != 0) {
    own = &peers_[peer_id][callsite];
    Refill(*own, limits_.peer_burst, now);
    if (own->tokens < 1.0) {
      return false;
    }
  }
  if (shared.tokens < 1.0) {
    return false;
  }

  shared.tokens -= 1.0;
  if (own) {
    own->tokens -= 1.0;
  }
  return true;
}

void PeerLogBudget::Forget(uint64_t peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_.erase(peer_id);
}

size_t PeerLogBudget::tracked_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

PeerLogBudget& PeerLogBudget::instance() {
  static PeerLogBudget budget;
  return budget;
}

}  // namespace util
}  // namespace quorumwire

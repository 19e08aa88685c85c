// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>

namespace quorumwire {
namespace util {

// Single-slot coalescing "work available" flag.
// notify() never blocks; any number of notify() calls before the consumer
// drains collapse into one pending signal.
class Notification {
public:
  // Returns true if this call filled the empty slot (the caller should wake the consumer)
  bool notify() { return !pending_.exchange(true, std::memory_order_acq_rel); }

  // Take the pending signal, if any
  bool consume() { return pending_.exchange(false, std::memory_order_acq_rel); }

  bool pending() const { return pending_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> pending_{false};
};

}  // namespace util
}  // namespace quorumwire

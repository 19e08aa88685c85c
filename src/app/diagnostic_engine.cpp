// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/diagnostic_engine.hpp"

#include "util/logging.hpp"

#include <algorithm>

namespace quorumwire {
namespace app {

DiagnosticEngine::DiagnosticEngine(std::chrono::seconds report_interval) : report_interval_(report_interval) {}

bool DiagnosticEngine::AddPeer(network::ConsensusPeerPtr peer) {
  if (!peer) {
    return false;
  }
  LOG_APP_INFO("peer {} registered", peer->RemoteAddr());
  peers_.push_back(peer);
  return true;
}

std::error_code DiagnosticEngine::Update(TimePoint now) {
  if (now < next_report_) {
    return {};
  }
  next_report_ = now + report_interval_;

  // Drop peers that closed since the last report
  peers_.erase(std::remove_if(peers_.begin(), peers_.end(), [](const auto& weak) { return weak.expired(); }),
               peers_.end());
  report();
  return {};
}

std::error_code DiagnosticEngine::ReceiveMessage(std::span<const uint8_t> payload, TimePoint) {
  ++messages_received_;
  bytes_received_ += payload.size();
  LOG_APP_INFO("consensus message ({} bytes)", payload.size());
  return {};
}

size_t DiagnosticEngine::live_peers() const {
  return static_cast<size_t>(
      std::count_if(peers_.begin(), peers_.end(), [](const auto& weak) { return !weak.expired(); }));
}

void DiagnosticEngine::report() {
  size_t authenticated = 0;
  for (const auto& weak : peers_) {
    auto peer = weak.lock();
    if (!peer) {
      continue;
    }
    auto key = peer->GetPublicKey();
    if (key) {
      ++authenticated;
    }
    LOG_APP_INFO("  {} {}", peer->RemoteAddr(), key ? key->ToHex() : std::string("(unauthenticated)"));
  }
  LOG_APP_INFO("status: {} peers ({} authenticated), {} consensus messages / {} bytes received", peers_.size(),
               authenticated, messages_received_, bytes_received_);
}

}  // namespace app
}  // namespace quorumwire

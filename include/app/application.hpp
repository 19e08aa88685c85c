// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/diagnostic_engine.hpp"
#include "app/node_config.hpp"
#include "network/network_manager.hpp"

#include <atomic>
#include <memory>

namespace quorumwire {
namespace app {

// Application - quorumwired process lifecycle
// initialize() -> start() -> wait_for_shutdown() (SIGINT/SIGTERM) -> stop()
class Application {
public:
  explicit Application(const NodeConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Logging, node key, network stack
  bool initialize();

  // Install signal handlers, start networking, dial configured peers
  bool start();

  // Block until a signal or request_shutdown(), then stop
  void wait_for_shutdown();

  void stop();

  void request_shutdown() { shutdown_requested_ = true; }

  static Application* instance();

private:
  void setup_signal_handlers();
  static void signal_handler(int signal);

  NodeConfig config_;
  std::shared_ptr<DiagnosticEngine> engine_;
  std::unique_ptr<network::NetworkManager> network_manager_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace quorumwire

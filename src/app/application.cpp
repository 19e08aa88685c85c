// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"

#include "app/node_key.hpp"
#include "util/logging.hpp"

#include <chrono>
#include <csignal>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace quorumwire {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const NodeConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  util::LogManager::Initialize(config_.log_level, !config_.log_file.empty(),
                               config_.log_file.empty() ? "debug.log" : config_.log_file);

  LOG_INFO("Initializing quorumwired...");

  auto key = LoadOrCreateNodeKey(config_.key_file);
  if (!key) {
    LOG_ERROR("Failed to load node key from {}", config_.key_file);
    return false;
  }

  engine_ = std::make_shared<DiagnosticEngine>();
  network_manager_ = std::make_unique<network::NetworkManager>(engine_, key, ToNetworkConfig(config_));

  if (!config_.require_authentication) {
    LOG_WARN("Accepting consensus traffic from unauthenticated peers");
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!network_manager_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  setup_signal_handlers();

  if (!network_manager_->start()) {
    LOG_ERROR("Failed to start network manager");
    return false;
  }
  running_ = true;

  for (const auto& peer : config_.connect) {
    auto result = network_manager_->connect_to(peer);
    if (result != network::ConnectionResult::Success) {
      LOG_WARN("Cannot connect to {}: {}", peer, network::ConnectionResultToString(result));
    }
  }

  if (config_.listen) {
    LOG_INFO("Listening on port: {}", network_manager_->listening_port());
  } else {
    LOG_INFO("Inbound connections disabled");
  }
  LOG_INFO("quorumwired started, press Ctrl+C to stop");
  return true;
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  stop();
}

void Application::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down quorumwired...");
  if (network_manager_) {
    network_manager_->stop();
  }
  LOG_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Ignore SIGPIPE to prevent crashes on broken network connections
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int) {
  if (instance_) {
    // write() is async-signal-safe; std::cout is not
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace quorumwire

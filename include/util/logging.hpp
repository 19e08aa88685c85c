// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace quorumwire {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and access to the component
 * loggers ("default", "network", "crypto", "app").
 *
 * Thread-safety: All methods are thread-safe. Initialize() runs once
 * (std::call_once); loggers handed out before it are created at level
 * "off" and replaced when it runs. Logger access is protected by a mutex.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Multiple calls are safe; only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component. Unknown components map to "default".
  // Auto-initializes at level "off"; the first Initialize() call still takes effect.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component (network, crypto, app, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace quorumwire

// Convenience macros for logging
#define LOG_TRACE(...) quorumwire::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) quorumwire::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) quorumwire::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) quorumwire::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) quorumwire::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) quorumwire::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) quorumwire::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) quorumwire::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) quorumwire::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) quorumwire::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_CRYPTO_DEBUG(...) quorumwire::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_INFO(...) quorumwire::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...) quorumwire::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

#define LOG_APP_INFO(...) quorumwire::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) quorumwire::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) quorumwire::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// For anything a remote peer can trigger (malformed frames, failed handshakes,
// rejected consensus messages). The first argument is the peer id, or 0 when
// the line is not tied to one peer. See util::PeerLogBudget for the limits:
// 200 lines per hour per callsite, at most 20 of them from any single peer.

#include "util/log_budget.hpp"

#define QW_STRINGIFY_(x) #x
#define QW_STRINGIFY(x) QW_STRINGIFY_(x)
#define CALLSITE_KEY_ (__FILE__ ":" QW_STRINGIFY(__LINE__))

#define LOG_NET_ERROR_RL(peer_id, ...)                                                                                 \
  do {                                                                                                                 \
    if (quorumwire::util::PeerLogBudget::instance().Allow(CALLSITE_KEY_, (peer_id))) {                                 \
      quorumwire::util::LogManager::GetLogger("network")->error(__VA_ARGS__);                                          \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(peer_id, ...)                                                                                  \
  do {                                                                                                                 \
    if (quorumwire::util::PeerLogBudget::instance().Allow(CALLSITE_KEY_, (peer_id))) {                                 \
      quorumwire::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                           \
    }                                                                                                                  \
  } while (0)

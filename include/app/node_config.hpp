// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/network_manager.hpp"
#include "network/protocol.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace quorumwire {
namespace app {

// quorumwired settings. Loaded from a JSON file, then overridden by command line options.
struct NodeConfig {
  uint16_t listen_port{protocol::DEFAULT_PORT};
  bool listen{true};
  std::string bind_address;           // empty = all interfaces
  std::vector<std::string> connect;   // "host:port" peers to dial at startup
  std::string key_file{"node.key"};   // hex secp256k1 scalar, created if missing
  int64_t io_threads{2};
  std::string log_level{"info"};
  std::string log_file;               // empty = console only
  int64_t read_timeout_ms{10000};
  int64_t write_timeout_ms{10000};
  int64_t connect_timeout_ms{10000};
  int64_t update_interval_ms{20};
  int64_t keepalive_interval_ms{5000};  // 0 disables
  bool require_authentication{true};
};

// Parse a JSON object. Keys not listed in NodeConfig are rejected.
// Fields absent from the document keep their current value in out.
bool ParseNodeConfig(const std::string& json_text, NodeConfig& out, std::string& error);

// Read and parse a config file
bool LoadNodeConfig(const std::filesystem::path& path, NodeConfig& out, std::string& error);

// Serialize every field (used to write an example config)
std::string NodeConfigToJson(const NodeConfig& config);

// Range and format checks
bool ValidateNodeConfig(const NodeConfig& config, std::string& error);

// Command line overrides: --port=, --listen=0|1, --bind=, --connect=host:port (repeatable),
// --keyfile=, --threads=, --loglevel=, --logfile=, --require-auth=0|1.
// --config= and --help are handled by the caller and ignored here.
bool ApplyCommandLine(const std::vector<std::string>& args, NodeConfig& config, std::string& error);

network::NetworkManager::Config ToNetworkConfig(const NodeConfig& config);

}  // namespace app
}  // namespace quorumwire

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/node_config.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <array>
#include <chrono>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace quorumwire {
namespace app {

namespace {

constexpr std::array<const char*, 14> KNOWN_KEYS = {"listen_port",
                                                   "listen",
                                                   "bind_address",
                                                   "connect",
                                                   "key_file",
                                                   "io_threads",
                                                   "log_level",
                                                   "log_file",
                                                   "read_timeout_ms",
                                                   "write_timeout_ms",
                                                   "connect_timeout_ms",
                                                   "update_interval_ms",
                                                   "keepalive_interval_ms",
                                                   "require_authentication"};

constexpr std::array<const char*, 7> LOG_LEVELS = {"trace", "debug", "info", "warn", "error", "critical", "off"};

bool IsKnownKey(const std::string& key) {
  for (const char* known : KNOWN_KEYS) {
    if (key == known) {
      return true;
    }
  }
  return false;
}

bool ParseBool(const std::string& value, bool& out) {
  if (value == "1" || value == "true") {
    out = true;
    return true;
  }
  if (value == "0" || value == "false") {
    out = false;
    return true;
  }
  return false;
}

// Split "--name=value"; a bare "--name" yields an empty value
bool SplitOption(const std::string& arg, std::string& name, std::string& value) {
  if (arg.rfind("--", 0) != 0) {
    return false;
  }
  size_t eq = arg.find('=');
  name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
  value = eq == std::string::npos ? std::string() : arg.substr(eq + 1);
  return !name.empty();
}

}  // namespace

bool ParseNodeConfig(const std::string& json_text, NodeConfig& out, std::string& error) {
  try {
    json j = json::parse(json_text);
    if (!j.is_object()) {
      error = "config root must be a JSON object";
      return false;
    }

    for (const auto& [key, value] : j.items()) {
      if (!IsKnownKey(key)) {
        error = "unknown config key '" + key + "'";
        return false;
      }
    }

    NodeConfig cfg = out;
    const int64_t port = j.value("listen_port", static_cast<int64_t>(cfg.listen_port));
    if (port < 0 || port > 65535) {
      error = "listen_port out of range";
      return false;
    }
    cfg.listen_port = static_cast<uint16_t>(port);
    cfg.listen = j.value("listen", cfg.listen);
    cfg.bind_address = j.value("bind_address", cfg.bind_address);
    cfg.connect = j.value("connect", cfg.connect);
    cfg.key_file = j.value("key_file", cfg.key_file);
    cfg.io_threads = j.value("io_threads", cfg.io_threads);
    cfg.log_level = j.value("log_level", cfg.log_level);
    cfg.log_file = j.value("log_file", cfg.log_file);
    cfg.read_timeout_ms = j.value("read_timeout_ms", cfg.read_timeout_ms);
    cfg.write_timeout_ms = j.value("write_timeout_ms", cfg.write_timeout_ms);
    cfg.connect_timeout_ms = j.value("connect_timeout_ms", cfg.connect_timeout_ms);
    cfg.update_interval_ms = j.value("update_interval_ms", cfg.update_interval_ms);
    cfg.keepalive_interval_ms = j.value("keepalive_interval_ms", cfg.keepalive_interval_ms);
    cfg.require_authentication = j.value("require_authentication", cfg.require_authentication);

    out = std::move(cfg);
    return true;
  } catch (const std::exception& e) {
    error = e.what();
    return false;
  }
}

bool LoadNodeConfig(const std::filesystem::path& path, NodeConfig& out, std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    error = "config file not found: " + path.string();
    return false;
  }

  std::string text = util::read_file_string(path);
  if (text.empty()) {
    error = "config file is empty or unreadable: " + path.string();
    return false;
  }

  if (!ParseNodeConfig(text, out, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  LOG_APP_INFO("loaded config from {}", path.string());
  return true;
}

std::string NodeConfigToJson(const NodeConfig& config) {
  json j = {{"listen_port", config.listen_port},
            {"listen", config.listen},
            {"bind_address", config.bind_address},
            {"connect", config.connect},
            {"key_file", config.key_file},
            {"io_threads", config.io_threads},
            {"log_level", config.log_level},
            {"log_file", config.log_file},
            {"read_timeout_ms", config.read_timeout_ms},
            {"write_timeout_ms", config.write_timeout_ms},
            {"connect_timeout_ms", config.connect_timeout_ms},
            {"update_interval_ms", config.update_interval_ms},
            {"keepalive_interval_ms", config.keepalive_interval_ms},
            {"require_authentication", config.require_authentication}};
  return j.dump(2);
}

bool ValidateNodeConfig(const NodeConfig& config, std::string& error) {
  if (config.listen && config.listen_port == 0) {
    error = "listen_port must be in [1, 65535] when listening";
    return false;
  }
  if (config.io_threads < 1 || config.io_threads > 64) {
    error = "io_threads must be in [1, 64]";
    return false;
  }
  if (config.key_file.empty()) {
    error = "key_file must not be empty";
    return false;
  }

  bool level_ok = false;
  for (const char* level : LOG_LEVELS) {
    level_ok = level_ok || config.log_level == level;
  }
  if (!level_ok) {
    error = "unknown log_level '" + config.log_level + "'";
    return false;
  }

  const std::pair<const char*, int64_t> timeouts[] = {{"read_timeout_ms", config.read_timeout_ms},
                                                       {"write_timeout_ms", config.write_timeout_ms},
                                                       {"connect_timeout_ms", config.connect_timeout_ms},
                                                       {"update_interval_ms", config.update_interval_ms}};
  for (const auto& [name, value] : timeouts) {
    if (value <= 0) {
      error = std::string(name) + " must be positive";
      return false;
    }
  }
  if (config.keepalive_interval_ms < 0) {
    error = "keepalive_interval_ms must not be negative";
    return false;
  }

  for (const auto& peer : config.connect) {
    std::string host;
    uint16_t port = 0;
    if (!util::ParseHostPort(peer, host, port)) {
      error = "malformed connect address '" + peer + "' (expected host:port)";
      return false;
    }
  }
  return true;
}

bool ApplyCommandLine(const std::vector<std::string>& args, NodeConfig& config, std::string& error) {
  for (const auto& arg : args) {
    std::string name;
    std::string value;
    if (!SplitOption(arg, name, value)) {
      error = "unexpected argument '" + arg + "'";
      return false;
    }

    if (name == "config" || name == "help") {
      continue;
    } else if (name == "port") {
      auto port = util::SafeParsePort(value);
      if (!port) {
        error = "invalid --port value '" + value + "'";
        return false;
      }
      config.listen_port = *port;
    } else if (name == "listen") {
      if (!ParseBool(value.empty() ? "1" : value, config.listen)) {
        error = "invalid --listen value '" + value + "'";
        return false;
      }
    } else if (name == "bind") {
      config.bind_address = value;
    } else if (name == "connect") {
      config.connect.push_back(value);
    } else if (name == "keyfile") {
      config.key_file = value;
    } else if (name == "threads") {
      auto threads = util::SafeParseInt64(value, 1, 64);
      if (!threads) {
        error = "invalid --threads value '" + value + "'";
        return false;
      }
      config.io_threads = *threads;
    } else if (name == "loglevel") {
      config.log_level = value;
    } else if (name == "logfile") {
      config.log_file = value;
    } else if (name == "require-auth") {
      if (!ParseBool(value.empty() ? "1" : value, config.require_authentication)) {
        error = "invalid --require-auth value '" + value + "'";
        return false;
      }
    } else {
      error = "unknown option '--" + name + "'";
      return false;
    }
  }
  return true;
}

network::NetworkManager::Config ToNetworkConfig(const NodeConfig& config) {
  network::NetworkManager::Config net;
  net.listen_port = config.listen_port;
  net.listen_enabled = config.listen;
  net.bind_address = config.bind_address;
  net.io_threads = static_cast<size_t>(config.io_threads);
  net.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
  net.keepalive_interval = std::chrono::milliseconds(config.keepalive_interval_ms);
  net.initiate_authentication = true;
  net.agent.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
  net.agent.write_timeout = std::chrono::milliseconds(config.write_timeout_ms);
  net.agent.update_interval = std::chrono::milliseconds(config.update_interval_ms);
  net.agent.require_authentication = config.require_authentication;
  return net;
}

}  // namespace app
}  // namespace quorumwire

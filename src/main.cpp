// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "app/node_config.hpp"
#include "util/logging.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char* program_name) {
  std::cout << "quorumwired - authenticated TCP transport for consensus peers\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --config=<path>        JSON config file (options below override it)\n"
            << "  --port=<port>          Listen port (default: 7580)\n"
            << "  --listen=<0|1>         Accept inbound connections (default: 1)\n"
            << "  --bind=<address>       Listen address (default: all interfaces)\n"
            << "  --connect=<host:port>  Dial a peer at startup (repeatable)\n"
            << "  --keyfile=<path>       Node key file, created if missing (default: node.key)\n"
            << "  --threads=<n>          Network io threads (default: 2)\n"
            << "  --loglevel=<level>     trace, debug, info, warn, error, critical, off\n"
            << "  --logfile=<path>       Also log to this file\n"
            << "  --require-auth=<0|1>   Drop unauthenticated consensus traffic (default: 1)\n"
            << "  --dumpconfig           Print the effective config as JSON and exit\n"
            << "  --help                 Show this help message\n"
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace quorumwire;

  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path;
    bool dump_config = false;
    std::vector<std::string> overrides;

    for (const auto& arg : args) {
      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg.rfind("--config=", 0) == 0) {
        config_path = arg.substr(9);
      } else if (arg == "--dumpconfig") {
        dump_config = true;
      } else {
        overrides.push_back(arg);
      }
    }

    app::NodeConfig config;
    std::string error;
    if (!config_path.empty() && !app::LoadNodeConfig(config_path, config, error)) {
      std::cerr << "Error: " << error << std::endl;
      return 1;
    }
    if (!app::ApplyCommandLine(overrides, config, error)) {
      std::cerr << "Error: " << error << "\n\n";
      PrintUsage(argv[0]);
      return 1;
    }
    if (!app::ValidateNodeConfig(config, error)) {
      std::cerr << "Error: invalid configuration: " << error << std::endl;
      return 1;
    }

    if (dump_config) {
      std::cout << app::NodeConfigToJson(config) << std::endl;
      return 0;
    }

    app::Application application(config);
    if (!application.initialize()) {
      std::cerr << "Failed to initialize quorumwired" << std::endl;
      return 1;
    }
    if (!application.start()) {
      std::cerr << "Failed to start quorumwired" << std::endl;
      return 1;
    }

    application.wait_for_shutdown();
    util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}

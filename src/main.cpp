// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "application.hpp"
#include "util/datadir.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>         Data directory (default: ~/.mintnode)\n"
      << "  --port=<port>            Client WebSocket port (default: 7777, 0 = any)\n"
      << "  --nolisten               Do not accept client connections\n"
      << "  --metricsport=<port>     Metrics endpoint port (default: 7778)\n"
      << "  --nometrics              Disable the metrics endpoint\n"
      << "  --threads=<n>            Number of IO threads (default: 4)\n"
      << "  --maxconnections=<n>     Maximum client sessions (default: 256)\n"
      << "  --queuesize=<n>          Outbound queue capacity per session (default: 64)\n"
      << "  --strict                 Close sessions that send unknown messages\n"
      << "  --shutdowngrace=<ms>     Time allowed for sessions to drain (default: 5000)\n"
      << "  --mainnet                Use the main network (default: devnet)\n"
      << "\n"
      << "Minting:\n"
      << "  --mintinterval=<ms>      Block interval (default: 3000)\n"
      << "  --nominter               Run as a relay; never produce blocks\n"
      << "  --noemptyblocks          Skip intervals with no pending transactions\n"
      << "  --minterid=<id>          Minter identity (default: minter-0)\n"
      << "  --owner=<address>        Owner wallet credited at genesis (default: owner)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>       Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                           Default: info\n"
      << "  --debug=<component>      Enable trace logging for specific component(s)\n"
      << "                           Components: network, rpc, chain, metrics, app, all\n"
      << "                           Can be comma-separated: --debug=network,rpc\n"
      << "  --printtoconsole         Log to the console instead of <datadir>/debug.log\n"
      << "\n"
      << "Other:\n"
      << "  --version                Show version information\n"
      << "  --help                   Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    mintnode::app::AppConfig config;
    std::string log_level = "info";
    bool print_to_console = false;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << mintnode::GetFullVersionString() << std::endl;
        std::cout << mintnode::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--port=") == 0) {
        config.connection_config.listen_port =
            static_cast<uint16_t>(std::stoi(arg.substr(7)));
      } else if (arg == "--nolisten") {
        config.connection_config.listen_enabled = false;
      } else if (arg.find("--metricsport=") == 0) {
        config.metrics_config.port =
            static_cast<uint16_t>(std::stoi(arg.substr(14)));
      } else if (arg == "--nometrics") {
        config.metrics_config.enabled = false;
      } else if (arg.find("--threads=") == 0) {
        config.io_threads = std::stoul(arg.substr(10));
      } else if (arg.find("--maxconnections=") == 0) {
        config.connection_config.max_connections = std::stoul(arg.substr(17));
      } else if (arg.find("--queuesize=") == 0) {
        config.connection_config.session.outbound_queue_capacity =
            std::stoul(arg.substr(12));
      } else if (arg == "--strict") {
        config.connection_config.session.strict_mode = true;
      } else if (arg.find("--shutdowngrace=") == 0) {
        config.shutdown_grace = std::chrono::milliseconds(std::stoll(arg.substr(16)));
      } else if (arg == "--mainnet") {
        config.ledger_config.network = "mainnet";
        config.connection_config.session.network_magic =
            mintnode::protocol::magic::MAINNET;
      } else if (arg.find("--mintinterval=") == 0) {
        config.mint_config.interval =
            std::chrono::milliseconds(std::stoll(arg.substr(15)));
      } else if (arg == "--nominter") {
        config.ledger_config.is_minter = false;
      } else if (arg == "--noemptyblocks") {
        config.ledger_config.mint_empty_blocks = false;
      } else if (arg.find("--minterid=") == 0) {
        config.ledger_config.minter_id = arg.substr(11);
      } else if (arg.find("--owner=") == 0) {
        config.ledger_config.owner_wallet = arg.substr(8);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg == "--printtoconsole") {
        print_to_console = true;
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,rpc
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (config.mint_config.interval.count() <= 0) {
      std::cerr << "--mintinterval must be positive" << std::endl;
      return 1;
    }
    if (config.connection_config.session.outbound_queue_capacity == 0) {
      std::cerr << "--queuesize must be at least 1" << std::endl;
      return 1;
    }

    // The log file lives in the data directory
    if (!print_to_console &&
        !mintnode::util::ensure_directory(config.datadir)) {
      std::cerr << "Cannot create data directory: " << config.datadir.string()
                << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    mintnode::util::LogManager::Initialize(log_level, !print_to_console,
                                           log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        mintnode::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        mintnode::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!mintnode::util::LogManager::SetComponentLevel(component,
                                                                "trace")) {
        LOG_WARN("Unknown debug component: {}", component);
      }
    }

    mintnode::app::Application app(config);

    if (!app.initialize()) {
      LOG_ERROR("Failed to initialize application");
      mintnode::util::LogManager::Shutdown();
      return 1;
    }

    if (!app.start()) {
      LOG_ERROR("Failed to start application");
      mintnode::util::LogManager::Shutdown();
      return 1;
    }

    // Run until shutdown requested
    app.wait_for_shutdown();

    int exit_code = app.exit_code();
    mintnode::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    mintnode::util::LogManager::Shutdown();
    return 1;
  }
}

// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // CLI output and errors before the logger exists
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CommandLine {
  lunachain::app::AppConfig config;
  std::string log_level = "info";
  std::vector<std::string> debug_components;
};

void PrintUsage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n\n"
      << "Chain:\n"
      << "  --datadir=<path>        Data directory (default: ~/.lunachain)\n"
      << "  --regtest               Regression test chain (trivial PoW)\n"
      << "  --testnet               Test network\n"
      << "  --mempool-size=<n>      Maximum mempool entries (default: 10000)\n"
      << "  --par=<n>               Signature check threads (0 = auto)\n\n"
      << "Mining:\n"
      << "  --mine                  Start the CPU miner\n"
      << "  --threads=<n>           Mining threads (default: 1, 0 = auto)\n"
      << "  --miner-address=<addr>  Reward address (default: new wallet key)\n\n"
      << "Logging:\n"
      << "  --loglevel=<level>      trace, debug, info, warn, error, critical\n"
      << "  --debug=<a,b,...>       Trace logging for chain, mempool, mining,\n"
      << "                          crypto, app or all\n"
      << "  --verbose               Same as --loglevel=debug\n\n"
      << "  --version               Show version information\n"
      << "  --help                  Show this help message\n"
      << std::endl;
}

// Value of --name=value, or nullopt if arg is a different option
std::optional<std::string> OptionValue(const std::string &arg,
                                       const std::string &name) {
  const std::string prefix = name + "=";
  if (arg.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }
  return arg.substr(prefix.size());
}

// Returns an exit code when the process should stop before starting
std::optional<int> ParseCommandLine(int argc, char *argv[], CommandLine &cmd) {
  auto &config = cmd.config;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "--version") {
      std::cout << lunachain::GetFullVersionString() << "\n"
                << lunachain::GetCopyrightString() << std::endl;
      return 0;
    }

    if (arg == "--regtest") {
      config.chain_type = lunachain::chain::ChainType::REGTEST;
    } else if (arg == "--testnet") {
      config.chain_type = lunachain::chain::ChainType::TESTNET;
    } else if (arg == "--mine") {
      config.mine = true;
    } else if (arg == "--verbose") {
      cmd.log_level = "debug";
    } else if (auto v = OptionValue(arg, "--datadir")) {
      config.datadir = *v;
    } else if (auto v = OptionValue(arg, "--threads")) {
      config.mining_threads = std::stoi(*v);
    } else if (auto v = OptionValue(arg, "--miner-address")) {
      config.miner_address = *v;
    } else if (auto v = OptionValue(arg, "--mempool-size")) {
      int size = std::stoi(*v);
      if (size <= 0) {
        std::cerr << "--mempool-size must be positive" << std::endl;
        return 1;
      }
      config.mempool_size = static_cast<size_t>(size);
    } else if (auto v = OptionValue(arg, "--par")) {
      int par = std::stoi(*v);
      config.verify_threads = par > 0 ? static_cast<size_t>(par) : 0;
    } else if (auto v = OptionValue(arg, "--loglevel")) {
      cmd.log_level = *v;
    } else if (auto v = OptionValue(arg, "--debug")) {
      std::stringstream list(*v);
      std::string component;
      while (std::getline(list, component, ',')) {
        if (!component.empty()) {
          cmd.debug_components.push_back(component);
        }
      }
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      PrintUsage(argv[0]);
      return 1;
    }
  }
  return std::nullopt;
}

} // namespace

int main(int argc, char *argv[]) {
  using lunachain::util::LogManager;

  try {
    CommandLine cmd;
    if (auto exit_code = ParseCommandLine(argc, argv, cmd)) {
      return *exit_code;
    }

    if (!lunachain::util::ensure_directory(cmd.config.datadir)) {
      std::cerr << "Cannot create data directory "
                << cmd.config.datadir.string() << std::endl;
      return 1;
    }
    LogManager::Initialize(cmd.log_level, true,
                           (cmd.config.datadir / "debug.log").string());

    for (const auto &component : cmd.debug_components) {
      if (component == "all") {
        LogManager::SetLogLevel("trace");
      } else if (!LogManager::SetComponentLevel(component, "trace")) {
        std::cerr << "Unknown debug component: " << component << std::endl;
      }
    }

    lunachain::app::Application app(cmd.config);
    if (!app.initialize() || !app.start()) {
      LOG_APP_ERROR("Startup failed");
      LogManager::Shutdown();
      return 1;
    }

    app.wait_for_shutdown();
    LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // The logger may be the thing that failed
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    LogManager::Shutdown();
    return 1;
  }
}

// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_VERSION_HPP
#define LUNACHAIN_VERSION_HPP

#include <string>

namespace lunachain {

constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

constexpr const char *CLIENT_NAME = "lunad";
constexpr const char *COPYRIGHT_NOTICE =
    "Copyright (C) 2024 The LunaChain developers";

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return std::string(CLIENT_NAME) + " version " + GetVersionString();
}

inline std::string GetCopyrightString() { return COPYRIGHT_NOTICE; }

/**
 * One-screen startup banner. The network name is colored so that a mainnet
 * node is hard to mistake for a regtest one in a terminal.
 */
inline std::string GetStartupBanner(const std::string &network) {
  const char *color = "\033[0m";
  if (network == "main") {
    color = "\033[1;34m";
  } else if (network == "test") {
    color = "\033[1;31m";
  } else if (network == "regtest") {
    color = "\033[1;32m";
  }

  std::string banner = "\n";
  banner += "  LunaChain " + GetVersionString() + "\n";
  banner += "  account-based proof of work\n";
  banner += std::string("  network: ") + color + network + "\033[0m\n";
  banner += "  " + GetCopyrightString() + "\n\n";
  return banner;
}

} // namespace lunachain

#endif // LUNACHAIN_VERSION_HPP

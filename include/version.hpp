// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_VERSION_HPP
#define MINTNODE_VERSION_HPP

#include <string>

namespace mintnode {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 4;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2024";
constexpr const char *COPYRIGHT_HOLDERS = "The Mintnode developers";

// User agent sent in the handshake response
// Format: /mintnode:0.4.0/
inline std::string GetUserAgent() {
  return "/mintnode:" + GetVersionString() + "/";
}

// Full version info for display
inline std::string GetFullVersionString() {
  return "mintnode version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[1;32m";
constexpr const char *YELLOW = "\033[1;33m";
} // namespace colors

// Startup banner. Minting nodes are highlighted in green, relay-only nodes in
// yellow.
inline std::string GetStartupBanner(const std::string &network,
                                    bool minting) {
  const char *color = minting ? colors::GREEN : colors::YELLOW;
  const std::string role = minting ? "minter" : "relay";

  std::string banner;
  banner += "\n";
  banner += color;
  banner += "+-------------------------------------------------------+\n";
  banner += "|                        mintnode                       |\n";
  banner += "+-------------------------------------------------------+\n";

  auto line = [&banner](const std::string &label, const std::string &value) {
    std::string text = "|  " + label + value;
    if (text.size() < 56) {
      text += std::string(56 - text.size(), ' ');
    }
    banner += text + "|\n";
  };
  line("Version: ", GetVersionString());
  line("Network: ", network);
  line("Role:    ", role);
  line("", GetCopyrightString());

  banner += "+-------------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace mintnode

#endif // MINTNODE_VERSION_HPP

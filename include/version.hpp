// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace floodchain {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 1;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Format: /Floodchain:0.1.0/
inline std::string GetUserAgent() {
  return "/Floodchain:" + GetVersionString() + "/";
}

inline std::string GetFullVersionString() {
  return "Floodchain version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[1;32m";
} // namespace colors

// Startup banner with this node's peer id
inline std::string GetStartupBanner(const std::string &peer_id) {
  std::string banner;
  banner += "\n";
  banner += colors::GREEN;
  banner += "+---------------------------------------------------------------+\n";
  banner += "|  FLOODCHAIN  hash-linked ledger over LAN gossip               |\n";
  banner += "+---------------------------------------------------------------+\n";
  banner += "  Version: " + GetVersionString() + "\n";
  banner += "  Peer id: " + peer_id + "\n";
  banner += "  " + GetCopyrightString() + "\n";
  banner += colors::RESET;
  banner += "\n";
  return banner;
}

} // namespace floodchain

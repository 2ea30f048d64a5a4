// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace offsync {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Offsync Developers";

// HTTP User-Agent, e.g. "offsync/1.0.0"
inline std::string GetUserAgent() {
  return "offsync/" + GetVersionString();
}

inline std::string GetFullVersionString() {
  return "offsyncd version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

inline std::string GetStartupBanner(const std::string &server) {
  std::string banner;
  banner += "\n";
  banner += "  offsyncd " + GetVersionString() + " - offline-first sync\n";
  banner += "  server: " + server + "\n";
  banner += "\n";
  return banner;
}

} // namespace offsync

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace ipbeacon {

constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;
constexpr int COPYRIGHT_YEAR = 2025;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." + std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// "ipbeacon v1.0.0"
inline std::string GetFullVersionString() {
  return "ipbeacon v" + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::to_string(COPYRIGHT_YEAR) +
         " The Unicity Foundation\nDistributed under the MIT software license";
}

// Sent as User-Agent by the prober and as Server by the address server
inline std::string GetUserAgent() {
  return "ipbeacon/" + GetVersionString();
}

}  // namespace ipbeacon

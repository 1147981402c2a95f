// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace ipbeacon {
namespace client {

// Upper bound on the cache file; anything larger is not an address
constexpr size_t MAX_CACHE_FILE_SIZE = 256;

/**
 * AddressCache - last address confirmed delivered to the server
 *
 * One text file holding one IPv4 address, no trailing newline. Read() never
 * throws: a missing, unreadable or invalid file is reported as absent. Write()
 * goes through atomic_write_file (mode 0600), so a failed write leaves the
 * previous value intact.
 */
class AddressCache {
public:
  explicit AddressCache(std::filesystem::path path);

  std::optional<std::string> Read() const;

  // Refuses invalid addresses. Creates parent directories as needed.
  bool Write(const std::string& address);

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

// $HOME/.ipbeacon/cached_ip.txt (empty if HOME is not set)
std::filesystem::path DefaultCachePath();

}  // namespace client
}  // namespace ipbeacon

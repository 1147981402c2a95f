// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/address_cache.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

namespace ipbeacon {
namespace client {

AddressCache::AddressCache(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<std::string> AddressCache::Read() const {
  try {
    std::string content;
    std::string error;
    switch (util::read_file_string(path_, content, MAX_CACHE_FILE_SIZE, &error)) {
    case util::ReadResult::NotFound:
      LOG_CLIENT_DEBUG("No cached address at {}", path_.string());
      return std::nullopt;
    case util::ReadResult::Error:
      // Treated as absent; costs at most a redundant push
      LOG_CLIENT_WARN("Cannot read address cache {}: {}", path_.string(), error);
      return std::nullopt;
    case util::ReadResult::Success:
      break;
    }

    std::string_view address = util::Trim(content);
    if (!util::IsValidIPv4(address)) {
      LOG_CLIENT_WARN("Ignoring invalid address cache {}: '{}'", path_.string(), util::EscapeForLog(content));
      return std::nullopt;
    }
    return std::string(address);
  } catch (const std::exception& e) {
    LOG_CLIENT_WARN("Cannot read address cache {}: {}", path_.string(), e.what());
    return std::nullopt;
  }
}

bool AddressCache::Write(const std::string& address) {
  if (!util::IsValidIPv4(address)) {
    LOG_CLIENT_ERROR("Refusing to cache invalid address '{}'", util::EscapeForLog(address));
    return false;
  }

  try {
    if (path_.has_parent_path() && !util::ensure_directory(path_.parent_path())) {
      LOG_CLIENT_ERROR("Cannot create cache directory {}", path_.parent_path().string());
      return false;
    }
    if (!util::atomic_write_file(path_, address, 0600)) {
      LOG_CLIENT_ERROR("Failed to write address cache {}", path_.string());
      return false;
    }
  } catch (const std::exception& e) {
    LOG_CLIENT_ERROR("Failed to write address cache {}: {}", path_.string(), e.what());
    return false;
  }

  LOG_CLIENT_DEBUG("Cached address {} in {}", address, path_.string());
  return true;
}

std::filesystem::path DefaultCachePath() {
  auto datadir = util::get_default_datadir();
  if (datadir.empty()) {
    return {};
  }
  return datadir / "cached_ip.txt";
}

}  // namespace client
}  // namespace ipbeacon

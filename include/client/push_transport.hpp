// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "client/address_source.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ipbeacon {
namespace client {

constexpr const char* DEFAULT_REMOTE_PATH = "/var/www/html/myip.txt";

struct PushConfig {
  std::string destination;                     // "user@host"
  std::string remote_path{DEFAULT_REMOTE_PATH};
  std::string identity_file;                   // scp -i; empty uses ssh defaults
  bool strict_host_key_checking{true};
  std::chrono::milliseconds timeout{30000};
  std::string scp_program{"scp"};              // looked up in PATH
  std::filesystem::path temp_dir;              // empty = system temp directory
};

// scp -q -B [-i identity] [-o StrictHostKeyChecking=no] <local_file> <destination>:<remote_path>
std::vector<std::string> BuildScpCommand(const PushConfig& config, const std::string& local_file);

/**
 * ScopedTempFile - a uniquely named file removed when the guard goes away
 *
 * Created with mkstemps (O_EXCL, mode 0600). The file is unlinked by the
 * destructor on every exit path, so a failed or timed-out push never leaves
 * an address lying around in /tmp.
 */
class ScopedTempFile {
public:
  ScopedTempFile() = default;
  ~ScopedTempFile();

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  // Create "<dir>/<prefix>XXXXXX<suffix>". Fails if already created.
  bool Create(const std::filesystem::path& dir, const std::string& prefix, const std::string& suffix,
              std::string* error = nullptr);

  // Write data and close the descriptor
  bool Write(const std::string& data, std::string* error = nullptr);

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_{-1};
};

/**
 * ScpPublisher - delivers an address to the server with scp
 *
 * Each Push() writes the address to a fresh temp file and copies it to
 * destination:remote_path in batch mode. Success means scp exited 0 before
 * the timeout.
 */
class ScpPublisher : public AddressPublisher {
public:
  explicit ScpPublisher(PushConfig config);

  bool Push(const std::string& address) override;

  const PushConfig& config() const { return config_; }

private:
  PushConfig config_;
};

}  // namespace client
}  // namespace ipbeacon

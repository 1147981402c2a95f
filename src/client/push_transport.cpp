// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/push_transport.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/subprocess.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace ipbeacon {
namespace client {

namespace {

void set_error(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

std::string join_command(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += arg;
  }
  return out;
}

}  // namespace

std::vector<std::string> BuildScpCommand(const PushConfig& config, const std::string& local_file) {
  std::vector<std::string> argv{config.scp_program, "-q", "-B"};
  if (!config.identity_file.empty()) {
    argv.push_back("-i");
    argv.push_back(config.identity_file);
  }
  if (!config.strict_host_key_checking) {
    argv.push_back("-o");
    argv.push_back("StrictHostKeyChecking=no");
  }
  argv.push_back(local_file);
  argv.push_back(config.destination + ":" + config.remote_path);
  return argv;
}

ScopedTempFile::~ScopedTempFile() {
  if (fd_ >= 0) {
    close(fd_);
  }
  if (!path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
      LOG_CLIENT_WARN("Failed to remove temp file {}: {}", path_.string(), ec.message());
    }
  }
}

bool ScopedTempFile::Create(const std::filesystem::path& dir, const std::string& prefix, const std::string& suffix,
                            std::string* error) {
  if (!path_.empty()) {
    set_error(error, "temp file already created");
    return false;
  }

  std::string name = (dir / (prefix + "XXXXXX" + suffix)).string();
  std::vector<char> templ(name.begin(), name.end());
  templ.push_back('\0');

  int fd = mkstemps(templ.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    set_error(error, std::string("mkstemps in ") + dir.string() + ": " + std::strerror(errno));
    return false;
  }

  fd_ = fd;
  path_ = std::filesystem::path(templ.data());
  return true;
}

bool ScopedTempFile::Write(const std::string& data, std::string* error) {
  if (fd_ < 0) {
    set_error(error, "temp file not open");
    return false;
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd_, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      set_error(error, std::string("write ") + path_.string() + ": " + std::strerror(errno));
      return false;
    }
    total += static_cast<size_t>(n);
  }

  int fd = fd_;
  fd_ = -1;
  if (close(fd) != 0) {
    set_error(error, std::string("close ") + path_.string() + ": " + std::strerror(errno));
    return false;
  }
  return true;
}

ScpPublisher::ScpPublisher(PushConfig config) : config_(std::move(config)) {}

bool ScpPublisher::Push(const std::string& address) {
  if (!util::IsValidIPv4(address)) {
    LOG_CLIENT_ERROR("Refusing to push invalid address '{}'", util::EscapeForLog(address));
    return false;
  }

  try {
    std::filesystem::path dir = config_.temp_dir.empty() ? std::filesystem::temp_directory_path() : config_.temp_dir;

    ScopedTempFile temp;
    std::string error;
    if (!temp.Create(dir, "ipbeacon-push-", ".txt", &error) || !temp.Write(address, &error)) {
      LOG_CLIENT_ERROR("Push failed: cannot prepare temp file: {}", error);
      return false;
    }

    auto argv = BuildScpCommand(config_, temp.path().string());
    LOG_CLIENT_DEBUG("Running: {}", join_command(argv));

    util::ProcessResult result = util::RunProcess(argv, config_.timeout);
    if (!result.Succeeded()) {
      std::string output(util::Trim(result.output));
      if (output.empty()) {
        LOG_CLIENT_ERROR("Push of {} to {}:{} failed: scp {}", address, config_.destination, config_.remote_path,
                         result.Describe());
      } else {
        LOG_CLIENT_ERROR("Push of {} to {}:{} failed: scp {}: {}", address, config_.destination,
                         config_.remote_path, result.Describe(), util::EscapeForLog(output, 1024));
      }
      return false;
    }

    LOG_CLIENT_INFO("Pushed {} to {}:{}", address, config_.destination, config_.remote_path);
    return true;
  } catch (const std::exception& e) {
    LOG_CLIENT_ERROR("Push of {} failed: {}", address, e.what());
    return false;
  }
}

}  // namespace client
}  // namespace ipbeacon

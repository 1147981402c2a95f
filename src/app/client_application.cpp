// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/client_application.hpp"

#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <csignal>
#include <iostream>
#include <sstream>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace ipbeacon {
namespace app {

// Static instance for signal handling
ClientApplication* ClientApplication::instance_ = nullptr;

ClientApplication::ClientApplication(ClientOptions options) : options_(std::move(options)) {
  instance_ = this;
}

ClientApplication::~ClientApplication() {
  poller_.reset();
  if (directory_locked_) {
    util::UnlockDirectory(cache_path_.parent_path());
  }
  instance_ = nullptr;
}

ClientApplication* ClientApplication::instance() {
  return instance_;
}

std::string ClientApplication::GetStartupBanner() const {
  std::ostringstream out;
  out << GetFullVersionString() << " (client)\n"
      << "  Server:         " << options_.server << "\n"
      << "  Remote path:    " << options_.remote_path << "\n"
      << "  Check interval: " << options_.interval << " seconds" << (options_.once ? " (single run)" : "") << "\n"
      << "  Cache file:     " << cache_path_.string() << "\n";
  return out.str();
}

bool ClientApplication::init_cache() {
  if (options_.cache_file.empty()) {
    cache_path_ = client::DefaultCachePath();
    if (cache_path_.empty()) {
      LOG_ERROR("Cannot determine cache location; set HOME or use --cache-file");
      return false;
    }
  } else {
    cache_path_ = std::filesystem::absolute(options_.cache_file);
  }

  auto dir = cache_path_.parent_path();
  if (!util::ensure_directory(dir)) {
    LOG_ERROR("Failed to create cache directory: {}", dir.string());
    return false;
  }

  std::string lock_error;
  switch (util::LockDirectory(dir, &lock_error)) {
  case util::LockResult::Success:
    directory_locked_ = true;
    return true;
  case util::LockResult::ErrorWrite:
    LOG_ERROR("Cannot write lock file: {}", lock_error);
    return false;
  case util::LockResult::ErrorLock:
    LOG_ERROR("Cannot lock {} ({}): another ipbeacon client is probably running against it", dir.string(),
              lock_error);
    return false;
  }
  return false;
}

bool ClientApplication::initialize() {
  LOG_INFO("Initializing ipbeacon client...");

  if (!init_cache()) {
    return false;
  }

  // Print startup banner (std::cout for visibility regardless of log level)
  std::cout << GetStartupBanner() << std::flush;

  if (options_.disable_host_key_check) {
    LOG_WARN("SSH host key checking is DISABLED (--disable-host-key-check). "
             "Pushes are vulnerable to man-in-the-middle attacks.");
  }
  if (!options_.ssh_key.empty()) {
    std::error_code ec;
    if (!std::filesystem::exists(options_.ssh_key, ec)) {
      LOG_WARN("SSH key {} does not exist; scp will fail until it does", options_.ssh_key);
    }
  }

  auto services = options_.echo_services.empty() ? client::DefaultEchoServices() : options_.echo_services;
  for (const auto& service : services) {
    LOG_DEBUG("Echo service: {}", service.Url());
  }
  prober_ = std::make_unique<client::AddressProber>(std::move(services));

  client::PushConfig push;
  push.destination = options_.server;
  push.remote_path = options_.remote_path;
  push.identity_file = options_.ssh_key;
  push.strict_host_key_checking = !options_.disable_host_key_check;
  publisher_ = std::make_unique<client::ScpPublisher>(push);

  cache_ = std::make_unique<client::AddressCache>(cache_path_);

  client::PollerConfig poller_config;
  poller_config.interval = std::chrono::seconds(options_.interval);
  poller_config.once = options_.once;
  poller_ = std::make_unique<client::IpPoller>(*prober_, *publisher_, *cache_, poller_config);

  if (auto cached = cache_->Read()) {
    LOG_INFO("Last pushed address: {}", *cached);
  }

  return true;
}

int ClientApplication::run() {
  if (!poller_) {
    LOG_ERROR("Client not initialized");
    return 1;
  }

  setup_signal_handlers();
  if (shutdown_requested_) {
    poller_->RequestStop();
  }

  int exit_code = poller_->Run();

  if (shutdown_requested_) {
    LOG_INFO("Shutting down ipbeacon client...");
  }
  return exit_code;
}

void ClientApplication::request_shutdown() {
  shutdown_requested_ = true;
  if (poller_) {
    poller_->RequestStop();
  }
}

void ClientApplication::setup_signal_handlers() {
  std::signal(SIGINT, ClientApplication::signal_handler);
  std::signal(SIGTERM, ClientApplication::signal_handler);
  // Ignore SIGPIPE; RunProcess restores the default in the scp child
  std::signal(SIGPIPE, SIG_IGN);
}

void ClientApplication::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal, shutting down\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->request_shutdown();
  }
}

}  // namespace app
}  // namespace ipbeacon

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/server_application.hpp"

#include "util/logging.hpp"
#include "version.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace ipbeacon {
namespace app {

// Static instance for signal handling
ServerApplication* ServerApplication::instance_ = nullptr;

ServerApplication::ServerApplication(ServerOptions options) : options_(std::move(options)) {
  instance_ = this;
}

ServerApplication::~ServerApplication() {
  stop();
  instance_ = nullptr;
}

ServerApplication* ServerApplication::instance() {
  return instance_;
}

std::string ServerApplication::GetStartupBanner() const {
  std::ostringstream out;
  out << GetFullVersionString() << " (server)\n"
      << "  Listening on: " << options_.bind << ":" << port() << "\n"
      << "  IP file:      " << options_.ip_file << "\n"
      << "  Access your IP at: http://<server>:" << port() << "/ip\n";
  return out.str();
}

bool ServerApplication::start() {
  if (is_running()) {
    LOG_ERROR("Server already running");
    return false;
  }

  LOG_INFO("Starting ipbeacon server...");

  server::ServerConfig config;
  config.bind_address = options_.bind;
  config.port = options_.port;
  config.ip_file = options_.ip_file;
  server_ = std::make_unique<server::AddressServer>(config);

  server::StartResult result = server_->Start();
  if (result != server::StartResult::Success) {
    LOG_ERROR("{}", server_->last_error());
    server_.reset();
    return false;
  }

  setup_signal_handlers();

  std::cout << GetStartupBanner() << std::flush;
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void ServerApplication::stop() {
  if (!server_) {
    return;
  }
  LOG_INFO("Shutting down ipbeacon server...");
  server_->Stop();
  server_.reset();
}

void ServerApplication::wait_for_shutdown() {
  // Wait for shutdown signal
  while (is_running() && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  stop();
}

void ServerApplication::setup_signal_handlers() {
  std::signal(SIGINT, ServerApplication::signal_handler);
  std::signal(SIGTERM, ServerApplication::signal_handler);
  // Ignore SIGPIPE to prevent crashes when a client disconnects mid-write
  std::signal(SIGPIPE, SIG_IGN);
}

void ServerApplication::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal, shutting down\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace ipbeacon

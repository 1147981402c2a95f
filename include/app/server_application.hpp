// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/options.hpp"
#include "server/address_server.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace ipbeacon {
namespace app {

/**
 * ServerApplication - runs the AddressServer until SIGINT/SIGTERM
 *
 * The server runs on its own thread; the main thread only waits on the
 * shutdown flag and then stops the server.
 */
class ServerApplication {
public:
  explicit ServerApplication(ServerOptions options);
  ~ServerApplication();

  ServerApplication(const ServerApplication&) = delete;
  ServerApplication& operator=(const ServerApplication&) = delete;

  // Bind and start serving. Returns false (after logging why) on failure.
  bool start();
  void stop();

  // Block until a shutdown is requested, then stop
  void wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }
  bool is_running() const { return server_ && server_->IsRunning(); }
  uint16_t port() const { return server_ ? server_->port() : 0; }

  static ServerApplication* instance();

private:
  void setup_signal_handlers();
  static void signal_handler(int signal);
  std::string GetStartupBanner() const;

  ServerOptions options_;
  std::unique_ptr<server::AddressServer> server_;
  std::atomic<bool> shutdown_requested_{false};

  static ServerApplication* instance_;
};

}  // namespace app
}  // namespace ipbeacon

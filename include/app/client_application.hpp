// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/options.hpp"
#include "client/address_cache.hpp"
#include "client/address_prober.hpp"
#include "client/poller.hpp"
#include "client/push_transport.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace ipbeacon {
namespace app {

/**
 * ClientApplication - wires the poller together and owns its lifetime
 *
 * initialize(): resolve the cache path, lock the cache directory, build
 *               prober, publisher, cache and poller
 * run():        install signal handlers and run the poller; returns the
 *               process exit code
 *
 * Only one client may poll against a cache directory: the lock on
 * <cache dir>/.lock is held until the application is destroyed.
 */
class ClientApplication {
public:
  explicit ClientApplication(ClientOptions options);
  ~ClientApplication();

  ClientApplication(const ClientApplication&) = delete;
  ClientApplication& operator=(const ClientApplication&) = delete;

  bool initialize();
  int run();

  // Safe to call from a signal handler
  void request_shutdown();
  bool shutdown_requested() const { return shutdown_requested_; }

  const std::filesystem::path& cache_path() const { return cache_path_; }

  static ClientApplication* instance();

private:
  bool init_cache();
  void setup_signal_handlers();
  static void signal_handler(int signal);
  std::string GetStartupBanner() const;

  ClientOptions options_;
  std::filesystem::path cache_path_;
  bool directory_locked_{false};

  std::unique_ptr<client::AddressProber> prober_;
  std::unique_ptr<client::ScpPublisher> publisher_;
  std::unique_ptr<client::AddressCache> cache_;
  std::unique_ptr<client::IpPoller> poller_;

  std::atomic<bool> shutdown_requested_{false};

  static ClientApplication* instance_;
};

}  // namespace app
}  // namespace ipbeacon

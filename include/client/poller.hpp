// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 IpPoller - the client's polling loop

 One cycle:
   Probe   -> AddressSource::Probe()              (absent: cycle ends, nothing pushed)
   Compare -> AddressChanged(candidate, cache)    (unchanged: cycle ends)
   Push    -> AddressPublisher::Push(candidate)   (failure: cache left untouched)
   Cache   -> AddressCache::Write(candidate)

 The cache is written only after a confirmed push, so it always holds the
 last address the server is known to have. A crash between push and cache
 write causes one redundant push on the next cycle.

 Run() repeats cycles every interval until RequestStop(), or runs a single
 cycle when configured with once. RequestStop() only stores an atomic flag
 and is safe to call from a signal handler. The source sees the flag between
 echo services, so a stop during the probe waits for at most one exchange
 (ProbeTimeouts::total), and a push in flight runs to completion.
*/

#include "client/address_cache.hpp"
#include "client/address_source.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace ipbeacon {
namespace client {

constexpr int DEFAULT_POLL_INTERVAL_SEC = 300;
constexpr int MIN_POLL_INTERVAL_SEC = 1;
constexpr int MAX_POLL_INTERVAL_SEC = 86400;

// Sleep granularity; bounds how long a stop request can go unnoticed
constexpr std::chrono::milliseconds STOP_CHECK_INTERVAL{100};

enum class CycleResult {
  kNoAddress,          // no echo service produced a valid address
  kUnchanged,          // candidate equals the cached address, nothing to do
  kPushed,             // pushed and cached
  kPushFailed,         // push failed, cache untouched
  kCacheWriteFailed,   // pushed, but the cache could not be updated
  kError,              // unexpected exception inside the cycle
  kInterrupted,        // stop requested between steps, cycle discarded
};

const char* CycleResultToString(CycleResult result);

// kUnchanged and kPushed; everything else is a failed cycle
bool CycleSucceeded(CycleResult result);

struct PollerConfig {
  std::chrono::seconds interval{DEFAULT_POLL_INTERVAL_SEC};
  bool once{false};
};

class IpPoller {
public:
  IpPoller(AddressSource& source, AddressPublisher& publisher, AddressCache& cache, PollerConfig config = {});

  IpPoller(const IpPoller&) = delete;
  IpPoller& operator=(const IpPoller&) = delete;

  // Single probe/compare/push/cache pass. Does not catch exceptions.
  CycleResult RunCycle();

  // Loop until stopped (or one cycle if once). Returns the process exit
  // code: 0 for a clean stop or a successful single run, 1 otherwise.
  int Run();

  void RequestStop() { stop_requested_.store(true); }
  bool StopRequested() const { return stop_requested_.load(); }

  uint64_t cycles() const { return cycles_; }
  CycleResult last_result() const { return last_result_; }

private:
  // Sleep for duration in STOP_CHECK_INTERVAL ticks. Returns false if a stop
  // was requested before the full duration elapsed.
  bool SleepInterruptible(std::chrono::milliseconds duration);

  AddressSource& source_;
  AddressPublisher& publisher_;
  AddressCache& cache_;
  PollerConfig config_;

  std::atomic<bool> stop_requested_{false};
  uint64_t cycles_{0};
  CycleResult last_result_{CycleResult::kNoAddress};
};

}  // namespace client
}  // namespace ipbeacon

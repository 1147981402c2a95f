// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Token bucket rate limiter for log lines triggered by outside input

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ipbeacon {
namespace util {

/**
 * RateLimiter - per-key token bucket for log lines
 *
 * Each key (a log call site) starts with `burst` tokens that refill linearly
 * over `period`. The address server uses it for warnings caused by the
 * served file or by requests, both of which are controlled by other machines.
 *
 * Example: a client pushes garbage into the IP file and a monitoring probe
 * hits /ip every second. Without a limit that is 3600 warnings per hour;
 * with (200, 1h) the first 200 are logged and the rest trickle in at one
 * every 18 seconds, each reporting how many were dropped before it.
 */
class RateLimiter {
public:
  // A non-positive burst or period disables limiting
  RateLimiter(int burst, std::chrono::seconds period);

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // True if a message for key may be logged now. On true, *suppressed (if
  // given) receives the number of messages for key refused since the last
  // allowed one.
  bool Allow(const std::string& key, uint64_t* suppressed = nullptr);

  // Forget all buckets (tests)
  void Reset();

  // Limiter behind the _RL log macros: 200 messages per hour per call site
  static RateLimiter& ForLogging();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill;
    uint64_t suppressed{0};
  };

  const int burst_;
  const std::chrono::seconds period_;
  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace ipbeacon

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace ipbeacon {
namespace util {

RateLimiter::RateLimiter(int burst, std::chrono::seconds period) : burst_(burst), period_(period) {}

bool RateLimiter::Allow(const std::string& key, uint64_t* suppressed) {
  if (suppressed) {
    *suppressed = 0;
  }
  if (burst_ <= 0 || period_.count() <= 0) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = GetSteadyTime();

  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    // Full burst on first use
    Bucket bucket;
    bucket.tokens = static_cast<double>(burst_);
    bucket.last_refill = now;
    it = buckets_.emplace(key, bucket).first;
  }
  Bucket& bucket = it->second;

  const std::chrono::duration<double> elapsed = now - bucket.last_refill;
  if (elapsed.count() > 0) {
    const double per_second = static_cast<double>(burst_) / static_cast<double>(period_.count());
    bucket.tokens = std::min(bucket.tokens + per_second * elapsed.count(), static_cast<double>(burst_));
    bucket.last_refill = now;
  }

  if (bucket.tokens < 1.0) {
    ++bucket.suppressed;
    return false;
  }
  bucket.tokens -= 1.0;
  if (suppressed) {
    *suppressed = bucket.suppressed;
  }
  bucket.suppressed = 0;
  return true;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::ForLogging() {
  static RateLimiter limiter(200, std::chrono::hours(1));
  return limiter;
}

}  // namespace util
}  // namespace ipbeacon

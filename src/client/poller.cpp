// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/poller.hpp"

#include "client/change_detector.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <thread>

namespace ipbeacon {
namespace client {

const char* CycleResultToString(CycleResult result) {
  switch (result) {
  case CycleResult::kNoAddress:
    return "no-address";
  case CycleResult::kUnchanged:
    return "unchanged";
  case CycleResult::kPushed:
    return "pushed";
  case CycleResult::kPushFailed:
    return "push-failed";
  case CycleResult::kCacheWriteFailed:
    return "cache-write-failed";
  case CycleResult::kError:
    return "error";
  case CycleResult::kInterrupted:
    return "interrupted";
  }
  return "unknown";
}

bool CycleSucceeded(CycleResult result) {
  return result == CycleResult::kUnchanged || result == CycleResult::kPushed;
}

IpPoller::IpPoller(AddressSource& source, AddressPublisher& publisher, AddressCache& cache, PollerConfig config)
    : source_(source), publisher_(publisher), cache_(cache), config_(config) {}

CycleResult IpPoller::RunCycle() {
  auto candidate = source_.Probe([this]() { return StopRequested(); });
  if (StopRequested()) {
    return CycleResult::kInterrupted;
  }
  if (!candidate) {
    LOG_CLIENT_WARN("No public address available this cycle; nothing pushed");
    return CycleResult::kNoAddress;
  }

  auto cached = cache_.Read();
  if (!AddressChanged(*candidate, cached)) {
    LOG_CLIENT_INFO("Address unchanged: {}", *candidate);
    return CycleResult::kUnchanged;
  }

  LOG_CLIENT_INFO("Address changed: {} -> {}", cached.value_or("(none)"), *candidate);
  if (StopRequested()) {
    return CycleResult::kInterrupted;
  }

  if (!publisher_.Push(*candidate)) {
    LOG_CLIENT_ERROR("Push of {} failed; will retry next cycle", *candidate);
    return CycleResult::kPushFailed;
  }

  if (!cache_.Write(*candidate)) {
    LOG_CLIENT_ERROR("Pushed {} but could not update cache {}; it will be pushed again", *candidate,
                     cache_.path().string());
    return CycleResult::kCacheWriteFailed;
  }

  return CycleResult::kPushed;
}

int IpPoller::Run() {
  if (config_.once) {
    LOG_CLIENT_INFO("Running a single poll cycle");
  } else {
    LOG_CLIENT_INFO("Polling every {}s", config_.interval.count());
  }

  while (!StopRequested()) {
    CycleResult result;
    try {
      result = RunCycle();
    } catch (const std::exception& e) {
      LOG_CLIENT_ERROR("Unexpected error in poll cycle: {}", e.what());
      result = CycleResult::kError;
    }

    ++cycles_;
    last_result_ = result;
    LOG_CLIENT_DEBUG("Cycle {} finished: {}", cycles_, CycleResultToString(result));

    if (config_.once) {
      return CycleSucceeded(result) ? 0 : 1;
    }
    if (result == CycleResult::kInterrupted) {
      break;
    }
    SleepInterruptible(config_.interval);
  }

  LOG_CLIENT_INFO("Poller stopped after {} cycle(s)", cycles_);
  // A single run that never completed is a failure
  return config_.once ? 1 : 0;
}

bool IpPoller::SleepInterruptible(std::chrono::milliseconds duration) {
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!StopRequested()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(left, STOP_CHECK_INTERVAL));
  }
  return false;
}

}  // namespace client
}  // namespace ipbeacon

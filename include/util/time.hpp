// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ipbeacon {
namespace util {

// Current Unix time in seconds. Returns the mock time if one is set.
int64_t GetTime();

// Monotonic clock. Advances with mock time while mock time is set.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time for tests (0 disables mock time).
void SetMockTime(int64_t time);
int64_t GetMockTime();

// Sets mock time for the lifetime of the object and restores the previous
// value on destruction (tests).
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

// IMF-fixdate used in the HTTP Date header: "Sun, 06 Nov 1994 08:49:37 GMT"
std::string FormatHttpDate(int64_t unix_time);

}  // namespace util
}  // namespace ipbeacon

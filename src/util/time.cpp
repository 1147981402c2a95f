// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <array>
#include <atomic>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace ipbeacon {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time{0};

// Steady clock reference captured when mock time is first used, so that
// GetSteadyTime() keeps advancing monotonically as mock time moves forward.
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

namespace {

struct CivilTime {
  std::chrono::year_month_day ymd;
  std::chrono::hh_mm_ss<std::chrono::seconds> hms;
  std::chrono::weekday wd;
};

CivilTime ToCivil(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  return CivilTime{std::chrono::year_month_day{days}, std::chrono::hh_mm_ss{secs - days},
                   std::chrono::weekday{days}};
}

}  // namespace

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_steady_initialized) {
    g_real_steady_reference = std::chrono::steady_clock::now();
    g_mock_steady_reference = mock;
    g_steady_initialized = true;
  }
  return g_real_steady_reference + std::chrono::seconds(mock - g_mock_steady_reference);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the reference while mock time moves; drop it only when disabling.
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  const auto t = ToCivil(unix_time);

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(t.ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(t.ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(t.ymd.day()) << " "
      << std::setw(2) << t.hms.hours().count() << ":" << std::setw(2) << t.hms.minutes().count() << ":"
      << std::setw(2) << t.hms.seconds().count() << " UTC";
  return oss.str();
}

std::string FormatHttpDate(int64_t unix_time) {
  static constexpr std::array<const char*, 7> kDays = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr std::array<const char*, 12> kMonths = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const auto t = ToCivil(unix_time);

  std::ostringstream oss;
  oss << kDays[t.wd.c_encoding()] << ", " << std::setfill('0') << std::setw(2)
      << static_cast<unsigned>(t.ymd.day()) << " " << kMonths[static_cast<unsigned>(t.ymd.month()) - 1] << " "
      << std::setw(4) << static_cast<int>(t.ymd.year()) << " " << std::setw(2) << t.hms.hours().count() << ":"
      << std::setw(2) << t.hms.minutes().count() << ":" << std::setw(2) << t.hms.seconds().count() << " GMT";
  return oss.str();
}

}  // namespace util
}  // namespace ipbeacon

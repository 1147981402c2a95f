// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ipbeacon {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout both daemons.
 *
 * Components:
 * - "default": application lifecycle, files, configuration
 * - "client":  probing, change detection, pushes
 * - "http":    address server requests and socket errors
 *
 * Thread-safety: All methods are thread-safe. Initialization and logger
 * access are protected by a single mutex.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Multiple calls are safe; only the first call after startup (or after
  // Shutdown) performs initialization.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "ipbeacon.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component ("client", "http", "default").
  // Auto-initializes if not initialized. Unknown names return the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component.
  static void SetComponentLevel(const std::string& component, const std::string& level);

  // Returns true if the string names a spdlog level ("trace" ... "off").
  static bool IsValidLevel(const std::string& level);
};

}  // namespace util
}  // namespace ipbeacon

// Convenience macros for logging
#define LOG_TRACE(...) ipbeacon::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ipbeacon::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ipbeacon::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ipbeacon::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ipbeacon::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CLIENT_TRACE(...) ipbeacon::util::LogManager::GetLogger("client")->trace(__VA_ARGS__)
#define LOG_CLIENT_DEBUG(...) ipbeacon::util::LogManager::GetLogger("client")->debug(__VA_ARGS__)
#define LOG_CLIENT_INFO(...) ipbeacon::util::LogManager::GetLogger("client")->info(__VA_ARGS__)
#define LOG_CLIENT_WARN(...) ipbeacon::util::LogManager::GetLogger("client")->warn(__VA_ARGS__)
#define LOG_CLIENT_ERROR(...) ipbeacon::util::LogManager::GetLogger("client")->error(__VA_ARGS__)

#define LOG_HTTP_TRACE(...) ipbeacon::util::LogManager::GetLogger("http")->trace(__VA_ARGS__)
#define LOG_HTTP_DEBUG(...) ipbeacon::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_INFO(...) ipbeacon::util::LogManager::GetLogger("http")->info(__VA_ARGS__)
#define LOG_HTTP_WARN(...) ipbeacon::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)
#define LOG_HTTP_ERROR(...) ipbeacon::util::LogManager::GetLogger("http")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Limits log frequency per callsite for messages triggered by input we do not
// control: the served IP file (rewritten by a remote client) and inbound
// HTTP requests. A broken or hostile writer must not be able to fill the disk
// by making every request log a warning.
//
// Rate limit (token bucket, see RateLimiter::ForLogging): 200 messages per
// hour per call site. The first message let through after a quiet spell is
// preceded by a count of the ones dropped.

#include "util/rate_limiter.hpp"

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_RL_IMPL_(logger_expr, method, ...)                                                                         \
  do {                                                                                                                 \
    uint64_t rl_suppressed_ = 0;                                                                                       \
    if (ipbeacon::util::RateLimiter::ForLogging().Allow(CALLSITE_KEY_, &rl_suppressed_)) {                             \
      auto rl_logger_ = (logger_expr);                                                                                 \
      if (rl_suppressed_ > 0) {                                                                                        \
        rl_logger_->method("{} similar message(s) suppressed by rate limit", rl_suppressed_);                          \
      }                                                                                                                \
      rl_logger_->method(__VA_ARGS__);                                                                                 \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...) LOG_RL_IMPL_(ipbeacon::util::LogManager::GetLogger(), warn, __VA_ARGS__)
#define LOG_HTTP_WARN_RL(...) LOG_RL_IMPL_(ipbeacon::util::LogManager::GetLogger("http"), warn, __VA_ARGS__)
#define LOG_HTTP_ERROR_RL(...) LOG_RL_IMPL_(ipbeacon::util::LogManager::GetLogger("http"), error, __VA_ARGS__)

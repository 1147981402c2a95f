// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ipbeacon {
namespace util {

namespace {

constexpr std::array<const char*, 3> kComponents = {"default", "client", "http"};

std::mutex g_log_mutex;
bool g_initialized = false;
std::vector<spdlog::sink_ptr> g_sinks;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

// Unknown strings map to info rather than spdlog's "off" fallback.
spdlog::level::level_enum ParseLevel(const std::string& level) {
  if (!LogManager::IsValidLevel(level)) {
    return spdlog::level::info;
  }
  return spdlog::level::from_str(level);
}

// Caller must hold g_log_mutex.
void InitializeLocked(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  if (g_initialized) {
    return;
  }

  g_sinks.clear();
  g_loggers.clear();

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  g_sinks.push_back(console_sink);

  std::string file_error;
  if (log_to_file && !log_file_path.empty()) {
    try {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false);
      file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [thread %t] %v");
      g_sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  const auto level = ParseLevel(log_level);
  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, g_sinks.begin(), g_sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers.emplace(name, std::move(logger));
  }

  g_initialized = true;

  if (!file_error.empty()) {
    g_loggers.at("default")->error("Failed to open log file {}: {} (logging to console only)", log_file_path,
                                   file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    return;
  }

  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_sinks.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    InitializeLocked("info", false, "");
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers.at("default");
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    InitializeLocked(level, false, "");
    return;
  }

  const auto lvl = ParseLevel(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (!g_initialized) {
    InitializeLocked("info", false, "");
  }

  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(ParseLevel(level));
  }
}

bool LogManager::IsValidLevel(const std::string& level) {
  static const std::array<const char*, 7> kLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  for (const char* known : kLevels) {
    if (level == known) {
      return true;
    }
  }
  return false;
}

}  // namespace util
}  // namespace ipbeacon

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace ipbeacon::util;

// LogManager is process-wide. Initialize() is a no-op once initialized, so
// tests that need a fresh configuration call Shutdown() first, and every
// test leaves output switched off.

TEST_CASE("LogManager: GetLogger returns valid loggers", "[logging]") {
    LogManager::Initialize("debug", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Named component loggers") {
        auto client = LogManager::GetLogger("client");
        REQUIRE(client != nullptr);
        REQUIRE(client->name() == "client");

        auto http = LogManager::GetLogger("http");
        REQUIRE(http != nullptr);
        REQUIRE(http->name() == "http");
    }

    SECTION("Unknown component returns default logger") {
        auto unknown = LogManager::GetLogger("nonexistent");
        REQUIRE(unknown != nullptr);
        REQUIRE(unknown->name() == "default");
    }

    SECTION("Same logger returned for same component") {
        auto logger1 = LogManager::GetLogger("http");
        auto logger2 = LogManager::GetLogger("http");
        REQUIRE(logger1.get() == logger2.get());
    }

    LogManager::SetLogLevel("off");
}

TEST_CASE("LogManager: SetLogLevel changes all loggers", "[logging]") {
    LogManager::Initialize("info", false, "");

    LogManager::SetLogLevel("trace");
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("client")->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("http")->level() == spdlog::level::trace);

    LogManager::SetLogLevel("off");
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::off);
    REQUIRE(LogManager::GetLogger("http")->level() == spdlog::level::off);
}

TEST_CASE("LogManager: SetComponentLevel changes specific logger", "[logging]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("info");

    LogManager::SetComponentLevel("client", "trace");

    REQUIRE(LogManager::GetLogger("client")->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("http")->level() == spdlog::level::info);
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::info);

    SECTION("Unknown component is ignored") {
        LogManager::SetComponentLevel("nonexistent", "error");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::info);
    }

    LogManager::SetLogLevel("off");
}

TEST_CASE("LogManager: Log level validation", "[logging]") {
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        REQUIRE(LogManager::IsValidLevel(level));
    }
    REQUIRE_FALSE(LogManager::IsValidLevel(""));
    REQUIRE_FALSE(LogManager::IsValidLevel("INFO"));
    REQUIRE_FALSE(LogManager::IsValidLevel("verbose"));

    SECTION("Invalid level falls back to info") {
        LogManager::Initialize("info", false, "");
        LogManager::SetLogLevel("invalid_level");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::info);
        LogManager::SetLogLevel("off");
    }
}

TEST_CASE("LogManager: Logging macros work", "[logging]") {
    LogManager::Initialize("trace", false, "");
    // Macro code paths still execute with output off
    LogManager::SetLogLevel("off");

    SECTION("Default logger macros") {
        LOG_TRACE("Test trace message");
        LOG_DEBUG("Test debug message");
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");
    }

    SECTION("Client logger macros") {
        LOG_CLIENT_TRACE("Client trace");
        LOG_CLIENT_DEBUG("Client debug");
        LOG_CLIENT_INFO("Client info {}", "203.0.113.7");
        LOG_CLIENT_WARN("Client warn");
        LOG_CLIENT_ERROR("Client error");
    }

    SECTION("HTTP logger macros") {
        LOG_HTTP_TRACE("HTTP trace");
        LOG_HTTP_DEBUG("HTTP debug");
        LOG_HTTP_INFO("{} - - [{}] \"{}\" {} {}", "127.0.0.1", "now", "GET /ip HTTP/1.1", 200, 11);
        LOG_HTTP_WARN("HTTP warn");
        LOG_HTTP_ERROR("HTTP error");
    }

    SECTION("Rate-limited macros tolerate high volume") {
        for (int i = 0; i < 300; ++i) {
            LOG_WARN_RL("Rate limited warn {}", i);
            LOG_HTTP_WARN_RL("HTTP warn {}", i);
            LOG_HTTP_ERROR_RL("HTTP error {}", i);
        }
    }
}

TEST_CASE("LogManager: Thread safety", "[logging][threading]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("off");

    const int num_threads = 8;
    const int ops_per_thread = 100;
    std::atomic<int> success_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&success_count, ops_per_thread, t]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                auto logger = LogManager::GetLogger(t % 2 == 0 ? "client" : "http");
                if (logger != nullptr) {
                    logger->trace("Thread {} iteration {}", t, i);
                    success_count++;
                }
                if (i % 20 == 0) {
                    LogManager::SetComponentLevel("client", "off");
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(success_count == num_threads * ops_per_thread);
}

TEST_CASE("LogManager: File sink", "[logging]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "ipbeacon_logging_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const fs::path log_file = dir / "ipbeacon.log";

    LogManager::Shutdown();

    SECTION("Messages reach the log file") {
        LogManager::Initialize("info", true, log_file.string());
        LOG_CLIENT_INFO("cached address {}", "198.51.100.23");
        LOG_CLIENT_DEBUG("below threshold");
        LogManager::Shutdown();

        std::ifstream in(log_file);
        std::stringstream ss;
        ss << in.rdbuf();
        const std::string contents = ss.str();
        REQUIRE(contents.find("[client]") != std::string::npos);
        REQUIRE(contents.find("cached address 198.51.100.23") != std::string::npos);
        REQUIRE(contents.find("below threshold") == std::string::npos);
    }

    SECTION("Unopenable log file falls back to console") {
        // A regular file cannot be a parent directory
        std::ofstream(dir / "not_a_dir") << "x";
        const fs::path bad = dir / "not_a_dir" / "ipbeacon.log";
        LogManager::Initialize("off", true, bad.string());
        REQUIRE(LogManager::GetLogger() != nullptr);
        REQUIRE(LogManager::GetLogger("client")->level() == spdlog::level::off);
        LogManager::Shutdown();
    }

    LogManager::Initialize("off", false, "");
    fs::remove_all(dir);
}

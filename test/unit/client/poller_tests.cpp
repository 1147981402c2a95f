// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the polling loop with scripted collaborators

#include <catch2/catch_test_macros.hpp>
#include "client/poller.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ipbeacon::client;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Returns scripted answers in order, repeating the last one
class ScriptedSource : public AddressSource {
public:
    explicit ScriptedSource(std::vector<std::optional<std::string>> answers) : answers_(std::move(answers)) {}

    std::optional<std::string> Probe(const StopCheck& stop_requested) override {
        size_t index = std::min(calls_, answers_.size() - 1);
        ++calls_;
        if (on_probe) {
            on_probe(calls_);
        }
        saw_stop = stop_requested && stop_requested();
        if (throw_on_probe) {
            throw std::runtime_error("probe exploded");
        }
        return answers_[index];
    }

    size_t calls() const { return calls_; }

    std::function<void(size_t)> on_probe;
    bool throw_on_probe{false};
    bool saw_stop{false};

private:
    std::vector<std::optional<std::string>> answers_;
    size_t calls_{0};
};

class RecordingPublisher : public AddressPublisher {
public:
    bool Push(const std::string& address) override {
        attempts.push_back(address);
        return succeed;
    }

    std::vector<std::string> attempts;
    bool succeed{true};
};

struct PollerFixture {
    PollerFixture() : dir(fs::temp_directory_path() / "ipbeacon_poller_test"), cache(dir / "cached_ip.txt") {
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    ~PollerFixture() { fs::remove_all(dir); }

    fs::path dir;
    AddressCache cache;
};

PollerConfig once_config() {
    PollerConfig config;
    config.once = true;
    return config;
}

}  // namespace

TEST_CASE("CycleResult helpers", "[poller]") {
    CHECK(std::string(CycleResultToString(CycleResult::kPushed)) == "pushed");
    CHECK(std::string(CycleResultToString(CycleResult::kUnchanged)) == "unchanged");
    CHECK(std::string(CycleResultToString(CycleResult::kNoAddress)) == "no-address");
    CHECK(std::string(CycleResultToString(CycleResult::kPushFailed)) == "push-failed");
    CHECK(std::string(CycleResultToString(CycleResult::kCacheWriteFailed)) == "cache-write-failed");
    CHECK(std::string(CycleResultToString(CycleResult::kError)) == "error");
    CHECK(std::string(CycleResultToString(CycleResult::kInterrupted)) == "interrupted");

    CHECK(CycleSucceeded(CycleResult::kPushed));
    CHECK(CycleSucceeded(CycleResult::kUnchanged));
    CHECK_FALSE(CycleSucceeded(CycleResult::kNoAddress));
    CHECK_FALSE(CycleSucceeded(CycleResult::kPushFailed));
    CHECK_FALSE(CycleSucceeded(CycleResult::kCacheWriteFailed));
    CHECK_FALSE(CycleSucceeded(CycleResult::kError));
    CHECK_FALSE(CycleSucceeded(CycleResult::kInterrupted));
}

TEST_CASE("IpPoller: cycles", "[poller]") {
    PollerFixture fx;
    RecordingPublisher publisher;

    SECTION("First cycle pushes and caches, later cycles are idempotent") {
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache);

        CHECK(poller.RunCycle() == CycleResult::kPushed);
        CHECK(fx.cache.Read() == std::optional<std::string>("203.0.113.7"));

        CHECK(poller.RunCycle() == CycleResult::kUnchanged);
        CHECK(poller.RunCycle() == CycleResult::kUnchanged);
        REQUIRE(publisher.attempts.size() == 1);
        CHECK(publisher.attempts[0] == "203.0.113.7");
    }

    SECTION("Address change is pushed once") {
        ScriptedSource source({std::string("203.0.113.7"), std::string("203.0.113.7"), std::string("198.51.100.9")});
        IpPoller poller(source, publisher, fx.cache);

        CHECK(poller.RunCycle() == CycleResult::kPushed);
        CHECK(poller.RunCycle() == CycleResult::kUnchanged);
        CHECK(poller.RunCycle() == CycleResult::kPushed);
        CHECK(poller.RunCycle() == CycleResult::kUnchanged);
        REQUIRE(publisher.attempts.size() == 2);
        CHECK(publisher.attempts[1] == "198.51.100.9");
        CHECK(fx.cache.Read() == std::optional<std::string>("198.51.100.9"));
    }

    SECTION("Existing cache suppresses the first push") {
        REQUIRE(fx.cache.Write("203.0.113.7"));
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache);

        CHECK(poller.RunCycle() == CycleResult::kUnchanged);
        CHECK(publisher.attempts.empty());
    }

    SECTION("Corrupt cache forces a push") {
        std::ofstream(fx.cache.path()) << "garbage";
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache);

        CHECK(poller.RunCycle() == CycleResult::kPushed);
        CHECK(fx.cache.Read() == std::optional<std::string>("203.0.113.7"));
    }

    SECTION("Failed push leaves the cache alone and is retried") {
        REQUIRE(fx.cache.Write("203.0.113.7"));
        ScriptedSource source({std::string("198.51.100.9")});
        IpPoller poller(source, publisher, fx.cache);

        publisher.succeed = false;
        CHECK(poller.RunCycle() == CycleResult::kPushFailed);
        CHECK(fx.cache.Read() == std::optional<std::string>("203.0.113.7"));

        CHECK(poller.RunCycle() == CycleResult::kPushFailed);
        CHECK(publisher.attempts.size() == 2);

        publisher.succeed = true;
        CHECK(poller.RunCycle() == CycleResult::kPushed);
        CHECK(fx.cache.Read() == std::optional<std::string>("198.51.100.9"));
        CHECK(poller.RunCycle() == CycleResult::kUnchanged);
        CHECK(publisher.attempts.size() == 3);
    }

    SECTION("No address means nothing is pushed") {
        REQUIRE(fx.cache.Write("203.0.113.7"));
        ScriptedSource source({std::nullopt});
        IpPoller poller(source, publisher, fx.cache);

        CHECK(poller.RunCycle() == CycleResult::kNoAddress);
        CHECK(publisher.attempts.empty());
        CHECK(fx.cache.Read() == std::optional<std::string>("203.0.113.7"));
    }

    SECTION("Cache write failure after a good push") {
        std::ofstream(fx.dir / "blocker") << "x";
        AddressCache broken(fx.dir / "blocker" / "cached_ip.txt");
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, broken);

        CHECK(poller.RunCycle() == CycleResult::kCacheWriteFailed);
        CHECK(publisher.attempts.size() == 1);
        // Cache still empty, so the next cycle pushes again
        CHECK(poller.RunCycle() == CycleResult::kCacheWriteFailed);
        CHECK(publisher.attempts.size() == 2);
    }

    SECTION("Stop requested after the probe discards the cycle") {
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache);
        source.on_probe = [&poller](size_t) { poller.RequestStop(); };

        CHECK(poller.RunCycle() == CycleResult::kInterrupted);
        CHECK(publisher.attempts.empty());
        CHECK_FALSE(fx.cache.Read().has_value());
    }

    SECTION("Stop request reaches the source while it runs") {
        ScriptedSource source({std::nullopt});
        IpPoller poller(source, publisher, fx.cache);
        source.on_probe = [&poller](size_t) { poller.RequestStop(); };

        CHECK(poller.RunCycle() == CycleResult::kInterrupted);
        CHECK(source.saw_stop);
    }
}

TEST_CASE("IpPoller: single run exit codes", "[poller]") {
    PollerFixture fx;
    RecordingPublisher publisher;

    SECTION("Pushed") {
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache, once_config());
        CHECK(poller.Run() == 0);
        CHECK(poller.cycles() == 1);
        CHECK(poller.last_result() == CycleResult::kPushed);
    }

    SECTION("Unchanged") {
        REQUIRE(fx.cache.Write("203.0.113.7"));
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache, once_config());
        CHECK(poller.Run() == 0);
        CHECK(poller.last_result() == CycleResult::kUnchanged);
    }

    SECTION("No address") {
        ScriptedSource source({std::nullopt});
        IpPoller poller(source, publisher, fx.cache, once_config());
        CHECK(poller.Run() == 1);
        CHECK(poller.last_result() == CycleResult::kNoAddress);
    }

    SECTION("Push failed") {
        publisher.succeed = false;
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache, once_config());
        CHECK(poller.Run() == 1);
        CHECK(poller.last_result() == CycleResult::kPushFailed);
    }

    SECTION("Exception inside the cycle") {
        ScriptedSource source({std::string("203.0.113.7")});
        source.throw_on_probe = true;
        IpPoller poller(source, publisher, fx.cache, once_config());
        CHECK(poller.Run() == 1);
        CHECK(poller.last_result() == CycleResult::kError);
        CHECK(poller.cycles() == 1);
    }

    SECTION("Stop before the first cycle") {
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache, once_config());
        poller.RequestStop();
        CHECK(poller.Run() == 1);
        CHECK(poller.cycles() == 0);
        CHECK(source.calls() == 0);
    }

    SECTION("Interrupted single run") {
        ScriptedSource source({std::string("203.0.113.7")});
        IpPoller poller(source, publisher, fx.cache, once_config());
        source.on_probe = [&poller](size_t) { poller.RequestStop(); };
        CHECK(poller.Run() == 1);
        CHECK(poller.last_result() == CycleResult::kInterrupted);
        CHECK(publisher.attempts.empty());
    }
}

TEST_CASE("IpPoller: continuous mode", "[poller]") {
    PollerFixture fx;
    RecordingPublisher publisher;

    SECTION("Repeats cycles until stopped") {
        ScriptedSource source({std::string("203.0.113.7"), std::string("198.51.100.9")});
        PollerConfig config;
        config.interval = 1s;
        IpPoller poller(source, publisher, fx.cache, config);
        // Third probe requests a stop, so two full cycles complete
        source.on_probe = [&poller](size_t call) {
            if (call == 3) {
                poller.RequestStop();
            }
        };

        CHECK(poller.Run() == 0);
        CHECK(poller.cycles() == 3);
        CHECK(poller.last_result() == CycleResult::kInterrupted);
        REQUIRE(publisher.attempts.size() == 2);
        CHECK(publisher.attempts[0] == "203.0.113.7");
        CHECK(publisher.attempts[1] == "198.51.100.9");
    }

    SECTION("Failed cycles do not end the loop") {
        ScriptedSource source({std::nullopt, std::nullopt, std::string("203.0.113.7")});
        PollerConfig config;
        config.interval = 1s;
        IpPoller poller(source, publisher, fx.cache, config);
        source.on_probe = [&poller](size_t call) {
            if (call == 4) {
                poller.RequestStop();
            }
        };

        CHECK(poller.Run() == 0);
        CHECK(publisher.attempts.size() == 1);
        CHECK(fx.cache.Read() == std::optional<std::string>("203.0.113.7"));
    }

    SECTION("Stop during the sleep returns promptly") {
        ScriptedSource source({std::string("203.0.113.7")});
        PollerConfig config;
        config.interval = 3600s;
        IpPoller poller(source, publisher, fx.cache, config);

        const auto start = std::chrono::steady_clock::now();
        std::thread stopper([&poller]() {
            std::this_thread::sleep_for(200ms);
            poller.RequestStop();
        });
        int rc = poller.Run();
        stopper.join();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(rc == 0);
        CHECK(poller.cycles() == 1);
        CHECK(poller.last_result() == CycleResult::kPushed);
        CHECK(elapsed < 5s);
    }
}

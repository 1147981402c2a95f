// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for RunProcess

#include <catch2/catch_test_macros.hpp>
#include "util/subprocess.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include <sys/types.h>

using namespace ipbeacon::util;
using namespace std::chrono_literals;

namespace {

// True while pid exists and is not a zombie (Linux /proc)
bool process_running(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return false;
    }
    std::string line;
    std::getline(stat, line);
    size_t name_end = line.rfind(')');
    if (name_end == std::string::npos || name_end + 2 >= line.size()) {
        return false;
    }
    char state = line[name_end + 2];
    return state != 'Z' && state != 'X';
}

}  // namespace

TEST_CASE("RunProcess: exit status", "[subprocess]") {
    SECTION("Successful command") {
        auto result = RunProcess({"true"}, 5000ms);
        CHECK(result.started);
        CHECK_FALSE(result.timed_out);
        CHECK(result.exit_code == 0);
        CHECK(result.Succeeded());
        CHECK(result.Describe() == "exit status 0");
    }

    SECTION("Failing command") {
        auto result = RunProcess({"false"}, 5000ms);
        CHECK(result.started);
        CHECK(result.exit_code == 1);
        CHECK_FALSE(result.Succeeded());
        CHECK(result.Describe() == "exit status 1");
    }

    SECTION("Specific exit code") {
        auto result = RunProcess({"sh", "-c", "exit 42"}, 5000ms);
        CHECK(result.started);
        CHECK(result.exit_code == 42);
    }

    SECTION("Killed by a signal") {
        auto result = RunProcess({"sh", "-c", "kill -TERM $$"}, 5000ms);
        CHECK(result.started);
        CHECK(result.term_signal == 15);
        CHECK_FALSE(result.Succeeded());
        CHECK(result.Describe() == "killed by signal 15");
    }
}

TEST_CASE("RunProcess: output capture", "[subprocess]") {
    SECTION("stdout and stderr are combined") {
        auto result = RunProcess({"sh", "-c", "printf out; printf err 1>&2"}, 5000ms);
        REQUIRE(result.Succeeded());
        CHECK(result.output.find("out") != std::string::npos);
        CHECK(result.output.find("err") != std::string::npos);
    }

    SECTION("Arguments are passed without a shell") {
        auto result = RunProcess({"printf", "%s|", "a b", "$HOME", ";"}, 5000ms);
        REQUIRE(result.Succeeded());
        CHECK(result.output == "a b|$HOME|;|");
    }

    SECTION("Output is capped") {
        auto result = RunProcess({"sh", "-c", "i=0; while [ $i -lt 200 ]; do printf 0123456789; i=$((i+1)); done"},
                                 5000ms, 100);
        REQUIRE(result.Succeeded());
        CHECK(result.output.size() == 100);
    }

    SECTION("stdin is empty") {
        auto result = RunProcess({"cat"}, 5000ms);
        REQUIRE(result.Succeeded());
        CHECK(result.output.empty());
    }
}

TEST_CASE("RunProcess: start failures", "[subprocess]") {
    SECTION("Missing program") {
        auto result = RunProcess({"ipbeacon-no-such-program-xyz"}, 5000ms);
        CHECK_FALSE(result.started);
        CHECK_FALSE(result.Succeeded());
        CHECK_FALSE(result.error.empty());
        CHECK(result.Describe().rfind("failed to start: ", 0) == 0);
    }

    SECTION("Empty command") {
        auto result = RunProcess({}, 5000ms);
        CHECK_FALSE(result.started);
        CHECK(result.error == "empty command");
    }
}

TEST_CASE("RunProcess: timeout kills the child", "[subprocess]") {
    const auto start = std::chrono::steady_clock::now();
    auto result = RunProcess({"sh", "-c", "exec sleep 5"}, 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(result.started);
    CHECK(result.timed_out);
    CHECK_FALSE(result.Succeeded());
    CHECK(result.Describe() == "timed out");
    CHECK(elapsed < 4s);
}

TEST_CASE("RunProcess: timeout kills spawned processes too", "[subprocess]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "ipbeacon_subprocess_group_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    const std::string pidfile = (dir / "grandchild.pid").string();

    // Like scp waiting on ssh: the program blocks on a child of its own
    auto result = RunProcess({"sh", "-c", "sleep 30 & echo $! > \"$1\"; wait", "sh", pidfile}, 500ms);
    CHECK(result.timed_out);

    pid_t grandchild = 0;
    {
        std::ifstream in(pidfile);
        in >> grandchild;
    }
    REQUIRE(grandchild > 0);

    // The orphan is reaped by init; allow a moment for that
    bool running = process_running(grandchild);
    for (int i = 0; i < 50 && running; ++i) {
        std::this_thread::sleep_for(20ms);
        running = process_running(grandchild);
    }
    CHECK_FALSE(running);

    fs::remove_all(dir);
}

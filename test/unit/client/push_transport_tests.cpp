// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the scp push transport, using a fake scp script

#include <catch2/catch_test_macros.hpp>
#include "client/push_transport.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>

using namespace ipbeacon::client;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

class FakeScpFixture {
public:
    FakeScpFixture() : dir_(fs::temp_directory_path() / "ipbeacon_push_test") {
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "tmp");
        fs::create_directories(dir_ / "remote");
    }
    ~FakeScpFixture() { fs::remove_all(dir_); }

    // Script body runs after the source file (second to last argument) and
    // the full argument list are recorded.
    fs::path WriteScript(const std::string& body) {
        fs::path script = dir_ / "fake-scp";
        std::ofstream out(script, std::ios::trunc);
        out << "#!/bin/sh\n"
            << "prev=\"\"; last=\"\"\n"
            << "for a in \"$@\"; do prev=\"$last\"; last=\"$a\"; done\n"
            << "printf '%s\\n' \"$@\" > '" << (dir_ / "args").string() << "'\n"
            << "printf '%s' \"$prev\" > '" << (dir_ / "src").string() << "'\n"
            << body << "\n";
        out.close();
        fs::permissions(script, fs::perms::owner_all);
        return script;
    }

    PushConfig Config(const fs::path& script) const {
        PushConfig config;
        config.destination = "deploy@example.org";
        config.remote_path = (dir_ / "remote" / "myip.txt").string();
        config.scp_program = script.string();
        config.temp_dir = dir_ / "tmp";
        config.timeout = 5000ms;
        return config;
    }

    fs::path RecordedSource() const { return fs::path(slurp(dir_ / "src")); }
    std::string RecordedArgs() const { return slurp(dir_ / "args"); }
    fs::path RemoteFile() const { return dir_ / "remote" / "myip.txt"; }
    bool TempDirEmpty() const { return fs::is_empty(dir_ / "tmp"); }

private:
    fs::path dir_;
};

}  // namespace

TEST_CASE("BuildScpCommand", "[push]") {
    PushConfig config;
    config.destination = "deploy@example.org";

    SECTION("Defaults") {
        auto argv = BuildScpCommand(config, "/tmp/x.txt");
        std::vector<std::string> expected{"scp", "-q", "-B", "/tmp/x.txt", "deploy@example.org:/var/www/html/myip.txt"};
        CHECK(argv == expected);
    }

    SECTION("Identity file and relaxed host key checking") {
        config.identity_file = "/home/u/.ssh/id_ed25519";
        config.strict_host_key_checking = false;
        config.remote_path = "/srv/ip.txt";
        auto argv = BuildScpCommand(config, "/tmp/x.txt");
        std::vector<std::string> expected{"scp", "-q", "-B", "-i", "/home/u/.ssh/id_ed25519",
                                          "-o", "StrictHostKeyChecking=no", "/tmp/x.txt",
                                          "deploy@example.org:/srv/ip.txt"};
        CHECK(argv == expected);
    }

    SECTION("Strict checking adds no -o option") {
        auto argv = BuildScpCommand(config, "/tmp/x.txt");
        for (const auto& arg : argv) {
            CHECK(arg.find("StrictHostKeyChecking") == std::string::npos);
        }
    }
}

TEST_CASE("ScopedTempFile", "[push]") {
    const fs::path dir = fs::temp_directory_path() / "ipbeacon_tempfile_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    SECTION("Created with mode 0600 and removed on destruction") {
        fs::path path;
        {
            ScopedTempFile temp;
            std::string error;
            REQUIRE(temp.Create(dir, "ipbeacon-push-", ".txt", &error));
            path = temp.path();
            CHECK(path.parent_path() == dir);
            CHECK(path.filename().string().rfind("ipbeacon-push-", 0) == 0);
            CHECK(path.extension() == ".txt");

            struct stat st;
            REQUIRE(stat(path.c_str(), &st) == 0);
            CHECK((st.st_mode & 0777) == 0600);

            REQUIRE(temp.Write("203.0.113.7", &error));
            CHECK(slurp(path) == "203.0.113.7");
        }
        CHECK_FALSE(fs::exists(path));
    }

    SECTION("Removed even if never written") {
        fs::path path;
        {
            ScopedTempFile temp;
            REQUIRE(temp.Create(dir, "p-", ".txt"));
            path = temp.path();
        }
        CHECK_FALSE(fs::exists(path));
    }

    SECTION("Misuse is reported") {
        ScopedTempFile temp;
        std::string error;
        CHECK_FALSE(temp.Write("x", &error));
        CHECK(error == "temp file not open");

        REQUIRE(temp.Create(dir, "p-", ".txt"));
        CHECK_FALSE(temp.Create(dir, "p-", ".txt", &error));
        CHECK(error == "temp file already created");

        REQUIRE(temp.Write("x"));
        CHECK_FALSE(temp.Write("y", &error));
    }

    SECTION("Missing directory") {
        ScopedTempFile temp;
        std::string error;
        CHECK_FALSE(temp.Create(dir / "missing", "p-", ".txt", &error));
        CHECK(error.find("mkstemps") != std::string::npos);
        CHECK(temp.path().empty());
    }

    fs::remove_all(dir);
}

TEST_CASE("ScpPublisher: push through a fake scp", "[push]") {
    FakeScpFixture fx;

    SECTION("Successful push copies the address and cleans up") {
        auto script = fx.WriteScript("cp \"$prev\" \"${last#*:}\"");
        ScpPublisher publisher(fx.Config(script));

        REQUIRE(publisher.Push("203.0.113.7"));
        CHECK(slurp(fx.RemoteFile()) == "203.0.113.7");

        std::string args = fx.RecordedArgs();
        CHECK(args.rfind("-q\n-B\n", 0) == 0);
        CHECK(args.find("deploy@example.org:" + fx.RemoteFile().string()) != std::string::npos);

        CHECK_FALSE(fx.RecordedSource().empty());
        CHECK_FALSE(fs::exists(fx.RecordedSource()));
        CHECK(fx.TempDirEmpty());
    }

    SECTION("Options reach scp") {
        auto script = fx.WriteScript("exit 0");
        PushConfig config = fx.Config(script);
        config.identity_file = "/keys/id_test";
        config.strict_host_key_checking = false;
        ScpPublisher publisher(config);

        REQUIRE(publisher.Push("203.0.113.7"));
        std::string args = fx.RecordedArgs();
        CHECK(args.find("-i\n/keys/id_test\n") != std::string::npos);
        CHECK(args.find("-o\nStrictHostKeyChecking=no\n") != std::string::npos);
    }

    SECTION("Non-zero exit is a failure and the temp file is removed") {
        auto script = fx.WriteScript("echo 'Permission denied (publickey).' >&2\nexit 1");
        ScpPublisher publisher(fx.Config(script));

        CHECK_FALSE(publisher.Push("203.0.113.7"));
        CHECK_FALSE(fs::exists(fx.RemoteFile()));
        CHECK_FALSE(fs::exists(fx.RecordedSource()));
        CHECK(fx.TempDirEmpty());
    }

    SECTION("Timeout is a failure and the temp file is removed") {
        auto script = fx.WriteScript("exec sleep 5");
        PushConfig config = fx.Config(script);
        config.timeout = 300ms;
        ScpPublisher publisher(config);

        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(publisher.Push("203.0.113.7"));
        CHECK(std::chrono::steady_clock::now() - start < 4s);
        CHECK_FALSE(fs::exists(fx.RecordedSource()));
        CHECK(fx.TempDirEmpty());
    }

    SECTION("Missing scp program") {
        PushConfig config = fx.Config(fx.WriteScript("exit 0"));
        config.scp_program = "ipbeacon-no-such-scp";
        ScpPublisher publisher(config);
        CHECK_FALSE(publisher.Push("203.0.113.7"));
        CHECK(fx.TempDirEmpty());
    }

    SECTION("Invalid addresses are never handed to scp") {
        auto script = fx.WriteScript("cp \"$prev\" \"${last#*:}\"");
        ScpPublisher publisher(fx.Config(script));

        CHECK_FALSE(publisher.Push(""));
        CHECK_FALSE(publisher.Push("203.0.113.7; rm -rf /"));
        CHECK_FALSE(publisher.Push("<html>"));
        CHECK_FALSE(fs::exists(fx.RemoteFile()));
        CHECK(fx.RecordedArgs().empty());
    }

    SECTION("Unusable temp directory") {
        auto script = fx.WriteScript("exit 0");
        PushConfig config = fx.Config(script);
        config.temp_dir = config.temp_dir / "missing";
        ScpPublisher publisher(config);
        CHECK_FALSE(publisher.Push("203.0.113.7"));
        CHECK(fx.RecordedArgs().empty());
    }
}

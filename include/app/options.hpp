// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "client/address_prober.hpp"
#include "client/poller.hpp"
#include "client/push_transport.hpp"
#include "server/address_server.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ipbeacon {
namespace app {

// Command line and config file handling for both executables.
//
// Options are "--name=value" or "--name value"; flags take no value.
// "--conf=<file>" names a JSON object whose keys are the option names with
// '_' instead of '-'. File values are applied first, so the command line
// always wins. Parsing is pure: nothing is logged or printed.

struct ClientOptions {
  std::string server;  // user@host, required
  std::string remote_path{client::DEFAULT_REMOTE_PATH};
  int interval{client::DEFAULT_POLL_INTERVAL_SEC};
  std::string cache_file;  // empty = $HOME/.ipbeacon/cached_ip.txt
  std::string ssh_key;
  bool disable_host_key_check{false};
  bool once{false};
  std::string conf;
  std::string loglevel{"info"};
  std::string logfile;
  std::vector<client::EchoService> echo_services;  // empty = defaults
};

struct ServerOptions {
  uint16_t port{server::DEFAULT_PORT};
  std::string bind{server::DEFAULT_BIND_ADDRESS};
  std::string ip_file{server::DEFAULT_IP_FILE};
  std::string conf;
  std::string loglevel{"info"};
  std::string logfile;
};

enum class ParseStatus {
  Ok,
  Help,     // --help seen; print usage, exit 0
  Version,  // --version seen; print version, exit 0
  Error,    // error holds the diagnostic; exit 1
};

template <typename Options>
struct ParseResult {
  ParseStatus status{ParseStatus::Ok};
  Options options;
  std::string error;
};

// args excludes argv[0]
ParseResult<ClientOptions> ParseClientOptions(const std::vector<std::string>& args);
ParseResult<ServerOptions> ParseServerOptions(const std::vector<std::string>& args);

std::string ClientUsage(const std::string& program_name);
std::string ServerUsage(const std::string& program_name);

}  // namespace app
}  // namespace ipbeacon

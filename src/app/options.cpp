// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/options.hpp"

#include "client/poller.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <optional>
#include <sstream>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace ipbeacon {
namespace app {

namespace {

using json = nlohmann::json;

constexpr size_t MAX_CONFIG_FILE_SIZE = 64 * 1024;

enum class ValueKind {
  Flag,     // no value on the command line, boolean in the config file
  String,
  Integer,  // string on the command line, integer in the config file
};

struct OptionSpec {
  std::string_view name;
  ValueKind kind;
};

const std::vector<OptionSpec>& client_specs() {
  static const std::vector<OptionSpec> specs = {
      {"server", ValueKind::String},
      {"remote-path", ValueKind::String},
      {"interval", ValueKind::Integer},
      {"cache-file", ValueKind::String},
      {"ssh-key", ValueKind::String},
      {"disable-host-key-check", ValueKind::Flag},
      {"once", ValueKind::Flag},
      {"conf", ValueKind::String},
      {"loglevel", ValueKind::String},
      {"logfile", ValueKind::String},
      {"help", ValueKind::Flag},
      {"version", ValueKind::Flag},
  };
  return specs;
}

const std::vector<OptionSpec>& server_specs() {
  static const std::vector<OptionSpec> specs = {
      {"port", ValueKind::Integer},
      {"bind", ValueKind::String},
      {"ip-file", ValueKind::String},
      {"conf", ValueKind::String},
      {"loglevel", ValueKind::String},
      {"logfile", ValueKind::String},
      {"help", ValueKind::Flag},
      {"version", ValueKind::Flag},
  };
  return specs;
}

const OptionSpec* find_spec(const std::vector<OptionSpec>& specs, std::string_view name) {
  for (const auto& spec : specs) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

// name -> value; flags carry "true"
using OptionList = std::vector<std::pair<std::string, std::string>>;

std::optional<std::string> tokenize(const std::vector<std::string>& args, const std::vector<OptionSpec>& specs,
                                    OptionList& out) {
  for (size_t i = 0; i < args.size(); ++i) {
    std::string arg = args[i];
    if (arg == "-h") {
      arg = "--help";
    } else if (arg == "-v") {
      arg = "--version";
    }

    if (!arg.starts_with("--")) {
      return "Unexpected argument: " + arg;
    }

    std::string name = arg.substr(2);
    std::optional<std::string> value;
    auto eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }

    const OptionSpec* spec = find_spec(specs, name);
    if (!spec) {
      return "Unknown option: --" + name;
    }

    if (spec->kind == ValueKind::Flag) {
      if (value) {
        return "Option --" + name + " does not take a value";
      }
      out.emplace_back(name, "true");
      continue;
    }

    if (!value) {
      if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
        value = args[++i];
      } else {
        return "Option --" + name + " requires a value";
      }
    }
    out.emplace_back(name, *value);
  }
  return std::nullopt;
}

std::optional<std::string> require_value(const std::string& name, const std::string& value) {
  if (value.empty()) {
    return "--" + name + " requires a non-empty value";
  }
  return std::nullopt;
}

std::optional<std::string> parse_loglevel(const std::string& value, std::string& out) {
  if (!util::LogManager::IsValidLevel(value)) {
    return "Invalid --loglevel '" + value + "' (expected trace, debug, info, warn, error, critical or off)";
  }
  out = value;
  return std::nullopt;
}

std::optional<std::string> apply_client_option(ClientOptions& options, const std::string& name,
                                               const std::string& value) {
  if (name == "disable-host-key-check") {
    options.disable_host_key_check = value == "true";
    return std::nullopt;
  }
  if (name == "once") {
    options.once = value == "true";
    return std::nullopt;
  }

  if (auto err = require_value(name, value)) {
    return err;
  }

  if (name == "server") {
    options.server = value;
  } else if (name == "remote-path") {
    options.remote_path = value;
  } else if (name == "interval") {
    auto interval = util::SafeParseInt(value, client::MIN_POLL_INTERVAL_SEC, client::MAX_POLL_INTERVAL_SEC);
    if (!interval) {
      return "Invalid --interval '" + value + "' (expected " + std::to_string(client::MIN_POLL_INTERVAL_SEC) +
             ".." + std::to_string(client::MAX_POLL_INTERVAL_SEC) + " seconds)";
    }
    options.interval = static_cast<int>(*interval);
  } else if (name == "cache-file") {
    options.cache_file = value;
  } else if (name == "ssh-key") {
    options.ssh_key = value;
  } else if (name == "conf") {
    options.conf = value;
  } else if (name == "loglevel") {
    return parse_loglevel(value, options.loglevel);
  } else if (name == "logfile") {
    options.logfile = value;
  }
  return std::nullopt;
}

std::optional<std::string> apply_server_option(ServerOptions& options, const std::string& name,
                                               const std::string& value) {
  if (auto err = require_value(name, value)) {
    return err;
  }

  if (name == "port") {
    auto port = util::SafeParsePort(value);
    if (!port) {
      return "Invalid --port '" + value + "' (expected 0..65535)";
    }
    options.port = *port;
  } else if (name == "bind") {
    if (!util::IsValidIPv4(value)) {
      return "Invalid --bind '" + value + "' (expected an IPv4 address)";
    }
    options.bind = value;
  } else if (name == "ip-file") {
    options.ip_file = value;
  } else if (name == "conf") {
    options.conf = value;
  } else if (name == "loglevel") {
    return parse_loglevel(value, options.loglevel);
  } else if (name == "logfile") {
    options.logfile = value;
  }
  return std::nullopt;
}

std::optional<std::string> load_config_object(const std::string& path, json& out) {
  std::string content;
  std::string error;
  if (util::read_file_string(path, content, MAX_CONFIG_FILE_SIZE, &error) != util::ReadResult::Success) {
    return "Cannot read config file " + path + ": " + error;
  }
  try {
    out = json::parse(content);
  } catch (const json::parse_error& e) {
    return "Invalid JSON in config file " + path + ": " + e.what();
  }
  if (!out.is_object()) {
    return "Config file " + path + " must contain a JSON object";
  }
  return std::nullopt;
}

// Convert one config file entry to the command-line form of its option
std::optional<std::string> config_value(const std::string& path, const std::string& key, const OptionSpec& spec,
                                        const json& value, std::string& out) {
  switch (spec.kind) {
  case ValueKind::Flag:
    if (!value.is_boolean()) {
      return "Config key '" + key + "' in " + path + " must be a boolean";
    }
    out = value.get<bool>() ? "true" : "false";
    return std::nullopt;
  case ValueKind::Integer:
    if (!value.is_number_integer()) {
      return "Config key '" + key + "' in " + path + " must be an integer";
    }
    out = value.is_number_unsigned() ? std::to_string(value.get<uint64_t>()) : std::to_string(value.get<int64_t>());
    return std::nullopt;
  case ValueKind::String:
    if (!value.is_string()) {
      return "Config key '" + key + "' in " + path + " must be a string";
    }
    out = value.get<std::string>();
    return std::nullopt;
  }
  return "Config key '" + key + "' has an unsupported type";
}

std::optional<std::string> parse_echo_services(const std::string& path, const json& value,
                                               std::vector<client::EchoService>& out) {
  if (!value.is_array() || value.empty()) {
    return "Config key 'echo_services' in " + path + " must be a non-empty array of URLs";
  }
  std::vector<client::EchoService> services;
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      return "Config key 'echo_services' in " + path + " must contain only strings";
    }
    auto url = entry.get<std::string>();
    auto service = client::EchoService::FromUrl(url);
    if (!service) {
      return "Invalid echo service URL '" + url + "' in " + path + " (expected http[s]://host[:port]/path)";
    }
    services.push_back(std::move(*service));
  }
  out = std::move(services);
  return std::nullopt;
}

// Apply every key of a config object through apply(name, value). Keys that
// only make sense on the command line (conf, help, version) are rejected.
template <typename Apply, typename Extra>
std::optional<std::string> apply_config_file(const std::string& path, const std::vector<OptionSpec>& specs,
                                             Apply apply, Extra extra) {
  json config;
  if (auto err = load_config_object(path, config)) {
    return err;
  }

  for (auto it = config.begin(); it != config.end(); ++it) {
    const std::string& key = it.key();
    if (auto handled = extra(key, it.value())) {
      if (!handled->empty()) {
        return handled;
      }
      continue;
    }

    std::string name = key;
    for (char& c : name) {
      if (c == '_') {
        c = '-';
      }
    }
    const OptionSpec* spec = find_spec(specs, name);
    if (!spec || name == "conf" || name == "help" || name == "version") {
      return "Unknown key '" + key + "' in config file " + path;
    }

    std::string value;
    if (auto err = config_value(path, key, *spec, it.value(), value)) {
      return err;
    }
    if (auto err = apply(name, value)) {
      return "Config file " + path + ": " + *err;
    }
  }
  return std::nullopt;
}

// Handles help/version and locates --conf. Returns false if parsing is done.
template <typename Options>
bool pre_scan(const OptionList& parsed, ParseResult<Options>& result, std::string& conf) {
  for (const auto& [name, value] : parsed) {
    if (name == "help") {
      result.status = ParseStatus::Help;
      return false;
    }
    if (name == "version") {
      result.status = ParseStatus::Version;
      return false;
    }
    if (name == "conf") {
      if (value.empty()) {
        result.status = ParseStatus::Error;
        result.error = "--conf requires a non-empty value";
        return false;
      }
      conf = value;
    }
  }
  return true;
}

template <typename Options>
ParseResult<Options> fail(ParseResult<Options> result, const std::string& error) {
  result.status = ParseStatus::Error;
  result.error = error;
  return result;
}

}  // namespace

ParseResult<ClientOptions> ParseClientOptions(const std::vector<std::string>& args) {
  ParseResult<ClientOptions> result;
  ClientOptions& options = result.options;

  OptionList parsed;
  if (auto err = tokenize(args, client_specs(), parsed)) {
    return fail(std::move(result), *err);
  }

  std::string conf;
  if (!pre_scan(parsed, result, conf)) {
    return result;
  }

  if (!conf.empty()) {
    auto apply = [&](const std::string& name, const std::string& value) {
      return apply_client_option(options, name, value);
    };
    auto extra = [&](const std::string& key, const json& value) -> std::optional<std::string> {
      if (key != "echo_services") {
        return std::nullopt;
      }
      auto err = parse_echo_services(conf, value, options.echo_services);
      return err ? err : std::optional<std::string>(std::string());
    };
    if (auto err = apply_config_file(conf, client_specs(), apply, extra)) {
      return fail(std::move(result), *err);
    }
  }

  for (const auto& [name, value] : parsed) {
    if (auto err = apply_client_option(options, name, value)) {
      return fail(std::move(result), *err);
    }
  }

  if (options.server.empty()) {
    return fail(std::move(result), "--server is required (user@host)");
  }
  // The destination becomes an scp argument: it must not look like an option
  // or carry its own remote path.
  if (options.server.front() == '-' || options.server.find(':') != std::string::npos ||
      options.server.find_first_of(" \t\r\n") != std::string::npos) {
    return fail(std::move(result), "Invalid --server '" + options.server + "' (expected user@host)");
  }

  return result;
}

ParseResult<ServerOptions> ParseServerOptions(const std::vector<std::string>& args) {
  ParseResult<ServerOptions> result;
  ServerOptions& options = result.options;

  OptionList parsed;
  if (auto err = tokenize(args, server_specs(), parsed)) {
    return fail(std::move(result), *err);
  }

  std::string conf;
  if (!pre_scan(parsed, result, conf)) {
    return result;
  }

  if (!conf.empty()) {
    auto apply = [&](const std::string& name, const std::string& value) {
      return apply_server_option(options, name, value);
    };
    auto no_extra = [](const std::string&, const json&) -> std::optional<std::string> { return std::nullopt; };
    if (auto err = apply_config_file(conf, server_specs(), apply, no_extra)) {
      return fail(std::move(result), *err);
    }
  }

  for (const auto& [name, value] : parsed) {
    if (auto err = apply_server_option(options, name, value)) {
      return fail(std::move(result), *err);
    }
  }

  return result;
}

std::string ClientUsage(const std::string& program_name) {
  std::ostringstream out;
  out << "ipbeacon client - push this host's public IP address to a server\n\n"
      << "Usage: " << program_name << " --server=<user@host> [options]\n\n"
      << "Options:\n"
      << "  --server=<user@host>       Destination for scp (required)\n"
      << "  --remote-path=<path>       Remote IP file (default: /var/www/html/myip.txt)\n"
      << "  --interval=<seconds>       Poll interval, 1..86400 (default: 300)\n"
      << "  --cache-file=<path>        Local cache (default: ~/.ipbeacon/cached_ip.txt)\n"
      << "  --ssh-key=<path>           Private key passed to scp -i\n"
      << "  --disable-host-key-check   Skip SSH host key verification (not recommended)\n"
      << "  --once                     Run a single poll cycle and exit\n"
      << "  --conf=<file>              JSON config file (command line overrides it)\n"
      << "  --loglevel=<level>         trace, debug, info, warn, error, critical, off (default: info)\n"
      << "  --logfile=<path>           Also write the log to this file\n"
      << "  --version                  Show version information\n"
      << "  --help                     Show this help message\n";
  return out.str();
}

std::string ServerUsage(const std::string& program_name) {
  std::ostringstream out;
  out << "ipbeacon server - serve the last pushed IP address over HTTP\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  --port=<n>           Port to listen on, 0 for any (default: 8080)\n"
      << "  --bind=<ipv4>        Address to bind to (default: 0.0.0.0)\n"
      << "  --ip-file=<path>     IP file to serve (default: /var/www/html/myip.txt)\n"
      << "  --conf=<file>        JSON config file (command line overrides it)\n"
      << "  --loglevel=<level>   trace, debug, info, warn, error, critical, off (default: info)\n"
      << "  --logfile=<path>     Also write the log to this file\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n";
  return out.str();
}

}  // namespace app
}  // namespace ipbeacon

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "client/address_source.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ipbeacon {
namespace client {

// Largest response we accept from an echo service (head + body). The body
// itself is capped at MAX_ECHO_BODY_SIZE.
constexpr size_t MAX_ECHO_RESPONSE_SIZE = 12 * 1024;
constexpr size_t MAX_ECHO_BODY_SIZE = 4 * 1024;

// An external service that answers a plain GET with the caller's address
struct EchoService {
  std::string name;  // for logs, usually the host
  std::string host;
  uint16_t port{80};
  std::string path{"/"};
  bool tls{false};  // https: certificate and host name are verified

  // "http[s]://host[:port][/path]"; name is set to the host
  static std::optional<EchoService> FromUrl(std::string_view url);
  std::string Url() const;
};

// ifconfig.me, api.ipify.org, icanhazip.com, checkip.amazonaws.com (in
// order), all over https
std::vector<EchoService> DefaultEchoServices();

struct ProbeTimeouts {
  std::chrono::milliseconds connect{5000};  // DNS resolution + TCP connect
  std::chrono::milliseconds total{10000};   // whole exchange
};

struct HttpGetResult {
  bool ok{false};  // a complete, well-formed response was received
  int status{0};
  std::string body;
  std::string error;  // transport or parse failure when !ok
};

// Single HTTP/1.1 GET over IPv4 with connect and total deadlines. Blocks the
// caller; uses a temporary io_context internally. Never throws.
//
// For tls services the peer certificate is checked against the system trust
// store (OpenSSL default paths, so SSL_CERT_FILE and SSL_CERT_DIR apply) and
// the service host name. There is no fallback to plain HTTP.
HttpGetResult HttpGet(const EchoService& service, const ProbeTimeouts& timeouts);

/**
 * AddressProber - asks echo services for our public IPv4 address
 *
 * Services are tried in order; the first one that returns a 2xx response
 * whose trimmed body is a valid IPv4 address wins. Failures are logged and
 * the next service is tried. No retries within one Probe() call.
 * stop_requested is checked before each service, so a stop waits for at
 * most the exchange in flight.
 */
class AddressProber : public AddressSource {
public:
  explicit AddressProber(std::vector<EchoService> services = DefaultEchoServices(), ProbeTimeouts timeouts = {});

  std::optional<std::string> Probe(const StopCheck& stop_requested = {}) override;

  const std::vector<EchoService>& services() const { return services_; }

private:
  std::vector<EchoService> services_;
  ProbeTimeouts timeouts_;
};

}  // namespace client
}  // namespace ipbeacon

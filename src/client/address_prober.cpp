// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/address_prober.hpp"

#include "network/http_message.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"

#include <array>
#include <functional>
#include <utility>

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace ipbeacon {
namespace client {

namespace {

using tcp = asio::ip::tcp;
using TlsStream = asio::ssl::stream<tcp::socket>;

uint16_t default_port(bool tls) {
  return tls ? 443 : 80;
}

std::string build_request(const EchoService& service) {
  std::string host = service.host;
  if (service.port != default_port(service.tls)) {
    host += ":" + std::to_string(service.port);
  }
  std::string request;
  request += "GET " + service.path + " HTTP/1.1\r\n";
  request += "Host: " + host + "\r\n";
  request += "User-Agent: " + GetUserAgent() + "\r\n";
  request += "Accept: text/plain\r\n";
  request += "Connection: close\r\n";
  request += "\r\n";
  return request;
}

// True once the response is complete by its own framing (Content-Length or
// the final chunk). Responses without either end at EOF.
bool response_complete(const std::string& raw) {
  if (network::FindHeadEnd(raw) == std::string::npos) {
    return false;
  }
  auto response = network::ParseHttpResponse(raw);
  if (!response) {
    return false;
  }
  return response->GetHeader("Content-Length").has_value() || response->GetHeader("Transfer-Encoding").has_value();
}

// Many servers end a TLS response by closing without close_notify
bool end_of_stream(const asio::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

template <typename Handler>
void start_session(tcp::socket&, Handler&& handler) {
  handler(asio::error_code());
}

template <typename Handler>
void start_session(TlsStream& stream, Handler&& handler) {
  stream.async_handshake(asio::ssl::stream_base::client, std::forward<Handler>(handler));
}

// Resolve, connect, start the session (TLS handshake if any), send the
// request and collect the raw response into raw. Returns true when the
// response ended by its own framing or by EOF; otherwise error says why.
template <typename Stream>
bool exchange(asio::io_context& io, Stream& stream, const EchoService& service, const ProbeTimeouts& timeouts,
              std::string& raw, std::string& error) {
  tcp::resolver resolver(io);

  // Two deadlines: one for resolve+connect, one for the whole exchange
  asio::steady_timer connect_deadline(io, timeouts.connect);
  asio::steady_timer total_deadline(io, timeouts.total);

  const std::string request = build_request(service);
  std::array<char, 1024> buf{};

  bool connected = false;
  bool finished = false;
  bool complete = false;

  auto finish = [&](const std::string& why) {
    if (finished) {
      return;
    }
    finished = true;
    error = why;
    connect_deadline.cancel();
    total_deadline.cancel();
    resolver.cancel();
    asio::error_code ignored;
    stream.lowest_layer().close(ignored);
  };

  connect_deadline.async_wait([&](const asio::error_code& ec) {
    if (!ec && !connected) {
      finish("connect timed out");
    }
  });
  total_deadline.async_wait([&](const asio::error_code& ec) {
    if (!ec) {
      finish("timed out");
    }
  });

  std::function<void()> read_some = [&]() {
    stream.async_read_some(asio::buffer(buf), [&](const asio::error_code& ec, std::size_t len) {
      if (finished) {
        return;
      }
      raw.append(buf.data(), len);
      if (raw.size() > MAX_ECHO_RESPONSE_SIZE) {
        finish("response too large");
        return;
      }
      if (end_of_stream(ec)) {
        complete = true;
        finish("");
        return;
      }
      if (ec) {
        finish("read: " + ec.message());
        return;
      }
      if (response_complete(raw)) {
        complete = true;
        finish("");
        return;
      }
      read_some();
    });
  };

  auto send_request = [&]() {
    asio::async_write(stream, asio::buffer(request), [&](const asio::error_code& write_ec, std::size_t) {
      if (finished) {
        return;
      }
      if (write_ec) {
        finish("write: " + write_ec.message());
        return;
      }
      read_some();
    });
  };

  resolver.async_resolve(
      tcp::v4(), service.host, std::to_string(service.port),
      [&](const asio::error_code& ec, tcp::resolver::results_type endpoints) {
        if (finished) {
          return;
        }
        if (ec) {
          finish("resolve: " + ec.message());
          return;
        }
        asio::async_connect(stream.lowest_layer(), endpoints,
                            [&](const asio::error_code& connect_ec, const tcp::endpoint&) {
                              if (finished) {
                                return;
                              }
                              if (connect_ec) {
                                finish("connect: " + connect_ec.message());
                                return;
                              }
                              connected = true;
                              connect_deadline.cancel();
                              start_session(stream, [&](const asio::error_code& session_ec) {
                                if (finished) {
                                  return;
                                }
                                if (session_ec) {
                                  finish("handshake: " + session_ec.message());
                                  return;
                                }
                                send_request();
                              });
                            });
      });

  io.run();

  if (!complete && error.empty()) {
    error = "connection closed";
  }
  return complete;
}

// Peer verification against the system trust store plus SNI. Throws
// asio::system_error if the trust store cannot be loaded.
void configure_tls(asio::ssl::context& ctx, TlsStream& stream, const std::string& host) {
  ctx.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                  asio::ssl::context::no_sslv3 | asio::ssl::context::no_tlsv1 | asio::ssl::context::no_tlsv1_1);
  ctx.set_default_verify_paths();

  stream.set_verify_mode(asio::ssl::verify_peer);
  stream.set_verify_callback(asio::ssl::host_name_verification(host));

  // SNI carries host names only, never address literals
  asio::error_code ec;
  asio::ip::make_address(host, ec);
  if (ec && !SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
    throw asio::system_error(asio::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
                             "SNI");
  }
}

}  // namespace

std::optional<EchoService> EchoService::FromUrl(std::string_view url) {
  auto parsed = network::ParseHttpUrl(url);
  if (!parsed) {
    return std::nullopt;
  }
  EchoService service;
  service.name = parsed->host;
  service.host = parsed->host;
  service.port = parsed->port;
  service.path = parsed->path;
  service.tls = parsed->tls;
  return service;
}

std::string EchoService::Url() const {
  network::HttpUrl url;
  url.tls = tls;
  url.host = host;
  url.port = port;
  url.path = path;
  return url.ToString();
}

std::vector<EchoService> DefaultEchoServices() {
  return {
      {"ifconfig.me", "ifconfig.me", 443, "/ip", true},
      {"api.ipify.org", "api.ipify.org", 443, "/", true},
      {"icanhazip.com", "icanhazip.com", 443, "/", true},
      {"checkip.amazonaws.com", "checkip.amazonaws.com", 443, "/", true},
  };
}

HttpGetResult HttpGet(const EchoService& service, const ProbeTimeouts& timeouts) {
  HttpGetResult result;

  try {
    asio::io_context io;
    std::string raw;
    std::string error;
    bool complete = false;

    if (service.tls) {
      asio::ssl::context ctx(asio::ssl::context::tls_client);
      TlsStream stream(io, ctx);
      configure_tls(ctx, stream, service.host);
      complete = exchange(io, stream, service, timeouts, raw, error);
    } else {
      tcp::socket socket(io);
      complete = exchange(io, socket, service, timeouts, raw, error);
    }

    if (!complete) {
      result.error = error;
      return result;
    }

    auto response = network::ParseHttpResponse(raw);
    if (!response) {
      result.error = "malformed HTTP response";
      return result;
    }
    if (response->body.size() > MAX_ECHO_BODY_SIZE) {
      result.error = "response body too large";
      return result;
    }

    result.ok = true;
    result.status = response->status;
    result.body = std::move(response->body);
    return result;
  } catch (const std::exception& e) {
    result.error = e.what();
    return result;
  }
}

AddressProber::AddressProber(std::vector<EchoService> services, ProbeTimeouts timeouts)
    : services_(std::move(services)), timeouts_(timeouts) {}

std::optional<std::string> AddressProber::Probe(const StopCheck& stop_requested) {
  for (const auto& service : services_) {
    if (stop_requested && stop_requested()) {
      LOG_CLIENT_DEBUG("Probe abandoned before {}: stop requested", service.name);
      return std::nullopt;
    }
    auto fetch = HttpGet(service, timeouts_);
    if (!fetch.ok) {
      LOG_CLIENT_WARN("Echo service {} failed: {}", service.name, fetch.error);
      continue;
    }
    if (fetch.status < 200 || fetch.status > 299) {
      LOG_CLIENT_WARN("Echo service {} returned HTTP {}", service.name, fetch.status);
      continue;
    }

    std::string_view candidate = util::Trim(fetch.body);
    if (candidate.empty()) {
      LOG_CLIENT_WARN("Echo service {} returned an empty body", service.name);
      continue;
    }
    if (!util::IsValidIPv4(candidate)) {
      LOG_CLIENT_WARN("Echo service {} returned an invalid address: '{}'", service.name,
                      util::EscapeForLog(candidate));
      continue;
    }
    if (auto reason = util::NonRoutableReason(candidate)) {
      LOG_CLIENT_WARN("Echo service {} returned {} address {}; the service may be seeing a proxy", service.name,
                      *reason, candidate);
    }

    LOG_CLIENT_DEBUG("Echo service {} reports {}", service.name, candidate);
    return std::string(candidate);
  }

  LOG_CLIENT_WARN("Could not determine public address: all {} echo services failed", services_.size());
  return std::nullopt;
}

}  // namespace client
}  // namespace ipbeacon

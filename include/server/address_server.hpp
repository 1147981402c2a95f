// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AddressServer - serves the last pushed address over HTTP

 Routes (query strings ignored):
   GET /, GET /ip   contents of the IP file, revalidated on every request
                    200 address | 503 file missing | 500 unreadable or invalid
   GET /health      200 "OK", never touches the filesystem
   anything else    404

 HEAD mirrors GET without a body; other methods get 501; malformed or
 oversized requests get 400. One request per connection.

 Threading: one io_context run by a dedicated server thread. Each
 connection is an asynchronous Session with a read deadline. The only state
 shared between sessions is the immutable configuration.
*/

#include "network/http_message.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include <asio.hpp>

namespace ipbeacon {
namespace server {

constexpr const char* DEFAULT_IP_FILE = "/var/www/html/myip.txt";
constexpr const char* DEFAULT_BIND_ADDRESS = "0.0.0.0";
constexpr uint16_t DEFAULT_PORT = 8080;

// Request head limit (request line + headers)
constexpr size_t MAX_REQUEST_HEAD_SIZE = 8 * 1024;

// How long a closing connection waits for the client to hang up
constexpr std::chrono::milliseconds LINGER_TIMEOUT{1000};

// The IP file holds one address; anything larger is rejected unread
constexpr size_t MAX_IP_FILE_SIZE = 256;

struct ServerConfig {
  std::string bind_address{DEFAULT_BIND_ADDRESS};
  uint16_t port{DEFAULT_PORT};  // 0 = ephemeral
  std::filesystem::path ip_file{DEFAULT_IP_FILE};
  std::chrono::milliseconds read_timeout{10000};
};

enum class StartResult {
  Success,
  InvalidAddress,    // bind address is not a valid IPv4 address
  PermissionDenied,  // EACCES binding a privileged port
  AddressInUse,      // EADDRINUSE
  Error,             // any other socket error
};

class AddressServer {
public:
  using RouteHandler = std::function<network::HttpResponse(const network::HttpRequest&)>;

  explicit AddressServer(ServerConfig config);
  ~AddressServer();

  AddressServer(const AddressServer&) = delete;
  AddressServer& operator=(const AddressServer&) = delete;

  // Bind, listen and start the server thread. On failure last_error()
  // holds a human-readable diagnostic.
  StartResult Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Actual listening port (resolves port 0), 0 when not running
  uint16_t port() const { return port_; }
  const std::string& last_error() const { return last_error_; }
  const ServerConfig& config() const { return config_; }

  // Route a parsed request. Adds the common headers. Never throws.
  network::HttpResponse HandleRequest(const network::HttpRequest& request) const;

  // Response for a request that could not be parsed
  network::HttpResponse BadRequest() const;

private:
  class Session;

  void RegisterHandlers();
  void PrepareIpFileDirectory() const;
  void StartAccept();
  void HandleAccept(const asio::error_code& ec, asio::ip::tcp::socket socket);

  network::HttpResponse HandleIp(const network::HttpRequest& request) const;
  network::HttpResponse HandleHealth(const network::HttpRequest& request) const;

  // Connection, Server and Date headers
  void AddCommonHeaders(network::HttpResponse& response) const;

  const ServerConfig config_;
  std::map<std::string, RouteHandler> handlers_;

  asio::io_context io_context_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  uint16_t port_{0};
  std::string last_error_;
};

}  // namespace server
}  // namespace ipbeacon

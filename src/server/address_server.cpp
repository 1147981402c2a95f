// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "server/address_server.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"

#include <array>

namespace ipbeacon {
namespace server {

using network::HttpRequest;
using network::HttpResponse;

// ============================================================================
// Session
// ============================================================================

class AddressServer::Session : public std::enable_shared_from_this<AddressServer::Session> {
public:
  Session(const AddressServer& server, asio::ip::tcp::socket socket)
      : server_(server), socket_(std::move(socket)), deadline_(socket_.get_executor()) {}

  void Start() {
    asio::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    remote_ = ec ? "unknown" : remote.address().to_string();

    deadline_.expires_after(server_.config_.read_timeout);
    deadline_.async_wait([self = shared_from_this()](const asio::error_code& wait_ec) {
      if (!wait_ec && !self->responded_) {
        LOG_HTTP_DEBUG("{}: read timed out", self->remote_);
        self->Close();
      }
    });

    ReadSome();
  }

private:
  void ReadSome() {
    socket_.async_read_some(asio::buffer(chunk_),
                            [self = shared_from_this()](const asio::error_code& ec, std::size_t len) {
                              self->OnRead(ec, len);
                            });
  }

  void OnRead(const asio::error_code& ec, std::size_t len) {
    if (responded_) {
      return;
    }
    buffer_.append(chunk_.data(), len);

    size_t head_end = network::FindHeadEnd(buffer_);
    if (head_end == std::string::npos) {
      if (buffer_.size() > MAX_REQUEST_HEAD_SIZE) {
        Respond(server_.BadRequest(), "-", true);
        return;
      }
      if (ec) {
        // Peer went away (or timed out) before sending a full request
        if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
          LOG_HTTP_DEBUG("{}: read error: {}", remote_, ec.message());
        }
        Close();
        return;
      }
      ReadSome();
      return;
    }

    if (head_end > MAX_REQUEST_HEAD_SIZE) {
      Respond(server_.BadRequest(), "-", true);
      return;
    }

    std::string_view head(buffer_.data(), head_end);
    auto request = network::ParseHttpRequest(head);
    if (!request) {
      std::string_view first_line = head.substr(0, head.find_first_of("\r\n"));
      Respond(server_.BadRequest(), util::EscapeForLog(first_line, 256), true);
      return;
    }

    HttpResponse response = server_.HandleRequest(*request);
    Respond(response, util::EscapeForLog(request->request_line, 256), request->method != "HEAD");
  }

  void Respond(const HttpResponse& response, const std::string& request_line, bool include_body) {
    responded_ = true;
    deadline_.cancel();

    // Common log style: client - - [time] "request" status bytes
    LOG_HTTP_INFO("{} - - [{}] \"{}\" {} {}", remote_, util::FormatTime(util::GetTime()), request_line,
                  response.status, include_body ? response.body.size() : 0);

    out_ = response.Serialize(include_body);
    asio::async_write(socket_, asio::buffer(out_), [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
      if (ec) {
        LOG_HTTP_DEBUG("{}: write error: {}", self->remote_, ec.message());
        self->Close();
        return;
      }
      self->Linger();
    });
  }

  // Half-close and discard whatever the client still sends until it closes
  // its side. Closing with unread input would reset the connection and can
  // destroy the response before the client reads it.
  void Linger() {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);

    deadline_.expires_after(LINGER_TIMEOUT);
    deadline_.async_wait([self = shared_from_this()](const asio::error_code& wait_ec) {
      if (!wait_ec) {
        self->Close();
      }
    });
    Drain();
  }

  void Drain() {
    socket_.async_read_some(asio::buffer(chunk_), [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
      if (ec) {
        self->Close();
        return;
      }
      self->Drain();
    });
  }

  void Close() {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    deadline_.cancel();
  }

  const AddressServer& server_;
  asio::ip::tcp::socket socket_;
  asio::steady_timer deadline_;
  std::array<char, 1024> chunk_{};
  std::string buffer_;
  std::string out_;
  std::string remote_;
  bool responded_{false};
};

// ============================================================================
// AddressServer
// ============================================================================

AddressServer::AddressServer(ServerConfig config) : config_(std::move(config)) {
  RegisterHandlers();
}

AddressServer::~AddressServer() {
  Stop();
}

void AddressServer::RegisterHandlers() {
  handlers_["/"] = [this](const auto& r) { return HandleIp(r); };
  handlers_["/ip"] = [this](const auto& r) { return HandleIp(r); };
  handlers_["/health"] = [this](const auto& r) { return HandleHealth(r); };
}

void AddressServer::PrepareIpFileDirectory() const {
  auto parent = config_.ip_file.parent_path();
  if (parent.empty()) {
    return;
  }
  if (!util::ensure_directory(parent)) {
    // Not fatal: the file will be missing and /ip reports 503
    LOG_HTTP_WARN("Could not create directory {} for the IP file", parent.string());
  }
}

StartResult AddressServer::Start() {
  if (running_) {
    return StartResult::Success;
  }
  last_error_.clear();

  if (!util::IsValidIPv4(config_.bind_address)) {
    last_error_ = "Invalid bind address: " + config_.bind_address;
    return StartResult::InvalidAddress;
  }

  asio::error_code ec;
  auto address = asio::ip::make_address_v4(config_.bind_address, ec);
  if (ec) {
    last_error_ = "Invalid bind address: " + config_.bind_address;
    return StartResult::InvalidAddress;
  }

  PrepareIpFileDirectory();

  using tcp = asio::ip::tcp;
  auto acceptor = std::make_unique<tcp::acceptor>(io_context_);
  tcp::endpoint endpoint(address, config_.port);

  auto fail = [&](const char* step, const asio::error_code& err) {
    asio::error_code ignored;
    acceptor->close(ignored);
    if (err == asio::error::access_denied) {
      last_error_ = "Permission denied. Port " + std::to_string(config_.port) + " may require root privileges.";
      return StartResult::PermissionDenied;
    }
    if (err == asio::error::address_in_use) {
      last_error_ = "Cannot bind to " + config_.bind_address + ":" + std::to_string(config_.port) + ": " +
                    err.message();
      return StartResult::AddressInUse;
    }
    last_error_ = std::string("Error starting server (") + step + "): " + err.message();
    return StartResult::Error;
  };

  acceptor->open(endpoint.protocol(), ec);
  if (ec) {
    return fail("open", ec);
  }
  acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  if (ec) {
    return fail("setsockopt", ec);
  }
  acceptor->bind(endpoint, ec);
  if (ec) {
    return fail("bind", ec);
  }
  acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    return fail("listen", ec);
  }

  // Record the actual bound port (handles ephemeral port 0)
  auto local = acceptor->local_endpoint(ec);
  port_ = ec ? config_.port : local.port();

  acceptor_ = std::move(acceptor);
  io_context_.restart();
  StartAccept();

  running_ = true;
  server_thread_ = std::thread([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      LOG_HTTP_ERROR("Server thread exception: {}", e.what());
    }
  });

  LOG_HTTP_INFO("Listening on {}:{}", config_.bind_address, port_);
  return StartResult::Success;
}

void AddressServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Close the acceptor on the io thread, then let the loop wind down
  asio::post(io_context_, [this]() {
    if (acceptor_) {
      asio::error_code ec;
      acceptor_->close(ec);
    }
  });
  io_context_.stop();

  if (server_thread_.joinable()) {
    server_thread_.join();
  }
  acceptor_.reset();
  port_ = 0;

  LOG_HTTP_INFO("Server stopped");
}

void AddressServer::StartAccept() {
  if (!acceptor_)
    return;

  acceptor_->async_accept(
      [this](const asio::error_code& ec, asio::ip::tcp::socket socket) { HandleAccept(ec, std::move(socket)); });
}

void AddressServer::HandleAccept(const asio::error_code& ec, asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != asio::error::operation_aborted) {
      LOG_HTTP_WARN_RL("Accept error: {}", ec.message());
      StartAccept();
    }
    return;
  }

  try {
    std::make_shared<Session>(*this, std::move(socket))->Start();
  } catch (const std::exception& e) {
    LOG_HTTP_ERROR_RL("Failed to start session: {}", e.what());
  }

  StartAccept();
}

HttpResponse AddressServer::HandleRequest(const HttpRequest& request) const {
  HttpResponse response;
  try {
    if (request.method != "GET" && request.method != "HEAD") {
      response = HttpResponse::Text(501, "Not Implemented");
    } else {
      auto it = handlers_.find(request.path);
      if (it == handlers_.end()) {
        response = HttpResponse::Text(404, "Not Found");
      } else {
        response = it->second(request);
      }
    }
  } catch (const std::exception& e) {
    LOG_HTTP_ERROR_RL("Error handling {}: {}", util::EscapeForLog(request.request_line, 256), e.what());
    response = HttpResponse::Text(500, "Internal Server Error");
  }
  AddCommonHeaders(response);
  return response;
}

HttpResponse AddressServer::BadRequest() const {
  HttpResponse response = HttpResponse::Text(400, "Bad Request");
  AddCommonHeaders(response);
  return response;
}

HttpResponse AddressServer::HandleIp(const HttpRequest&) const {
  std::string content;
  std::string error;
  switch (util::read_file_string(config_.ip_file, content, MAX_IP_FILE_SIZE, &error)) {
  case util::ReadResult::NotFound:
    return HttpResponse::Text(503, "IP address not available");
  case util::ReadResult::Error:
    LOG_HTTP_ERROR_RL("Error reading IP file {}: {}", config_.ip_file.string(), error);
    return HttpResponse::Text(500, "Internal Server Error");
  case util::ReadResult::Success:
    break;
  }

  std::string_view address = util::Trim(content);
  if (!util::IsValidIPv4(address)) {
    // Never echo file content back to the client
    LOG_HTTP_WARN_RL("Invalid IP address in file {}: '{}'", config_.ip_file.string(), util::EscapeForLog(content));
    return HttpResponse::Text(500, "Invalid IP address format");
  }

  HttpResponse response = HttpResponse::Text(200, std::string(address));
  response.SetHeader("Access-Control-Allow-Origin", "*");
  return response;
}

HttpResponse AddressServer::HandleHealth(const HttpRequest&) const {
  return HttpResponse::Text(200, "OK");
}

void AddressServer::AddCommonHeaders(HttpResponse& response) const {
  response.SetHeader("Server", GetUserAgent());
  response.SetHeader("Date", util::FormatHttpDate(util::GetTime()));
  response.SetHeader("Connection", "close");
}

}  // namespace server
}  // namespace ipbeacon

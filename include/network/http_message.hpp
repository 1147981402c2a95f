// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipbeacon {
namespace network {

// Minimal HTTP/1.x message handling for the two ends of this project:
// the address server parses requests and writes responses, the prober
// writes requests and parses responses. One request per connection,
// no keep-alive, no pipelining.

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method;        // "GET"
  std::string target;        // "/ip?cb=1"
  std::string path;          // "/ip" (target without query)
  std::string version;       // "HTTP/1.1"
  std::string request_line;  // "GET /ip?cb=1 HTTP/1.1" (for access logs)
  HttpHeaders headers;

  // Case-insensitive header lookup (first match)
  std::optional<std::string> GetHeader(std::string_view name) const;
};

// Parse a request head: request line plus header lines, up to and including
// the blank line. Accepts CRLF or bare LF line endings. Returns nullopt for
// anything malformed (bad request line, non-origin-form target, header line
// without a colon, version other than HTTP/1.x).
std::optional<HttpRequest> ParseHttpRequest(std::string_view head);

struct HttpResponse {
  int status{200};
  HttpHeaders headers;
  std::string body;

  // Replace (or add) a header, matched case-insensitively
  void SetHeader(const std::string& name, const std::string& value);
  std::optional<std::string> GetHeader(std::string_view name) const;

  // Status line, headers (Content-Length is always emitted from body.size()),
  // blank line, then the body unless include_body is false (HEAD).
  std::string Serialize(bool include_body = true) const;

  // text/plain response with the given body
  static HttpResponse Text(int status, std::string body);
};

// "OK", "Not Found", ...; "Unknown" for codes this project never sends
const char* ReasonPhrase(int status);

// Parse a complete response as read from a connection closed by the server.
// Honors Content-Length (extra bytes are dropped, missing bytes make the
// response invalid) and decodes Transfer-Encoding: chunked.
std::optional<HttpResponse> ParseHttpResponse(std::string_view raw);

// Returns the offset just past the blank line ending the head, or npos if
// the head is not complete yet.
std::size_t FindHeadEnd(std::string_view data);

struct HttpUrl {
  bool tls{false};  // https
  std::string host;
  uint16_t port{80};
  std::string path{"/"};

  // Default ports (80, 443) are omitted
  std::string ToString() const;
};

// "http://host[:port][/path]" or "https://...". Without a port, 80 or 443
// is implied by the scheme. Other schemes and userinfo are rejected.
std::optional<HttpUrl> ParseHttpUrl(std::string_view url);

}  // namespace network
}  // namespace ipbeacon

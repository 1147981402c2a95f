// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/http_message.hpp"

#include "util/string_parsing.hpp"

#include <charconv>

namespace ipbeacon {
namespace network {

namespace {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    char cb = b[i];
    if (ca >= 'A' && ca <= 'Z')
      ca = static_cast<char>(ca - 'A' + 'a');
    if (cb >= 'A' && cb <= 'Z')
      cb = static_cast<char>(cb - 'A' + 'a');
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> find_header(const HttpHeaders& headers, std::string_view name) {
  for (const auto& [key, value] : headers) {
    if (iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

// Next line from data starting at pos, without its terminator. Advances pos
// past the terminator. Returns false if no terminator is found.
bool next_line(std::string_view data, size_t& pos, std::string_view& line) {
  size_t nl = data.find('\n', pos);
  if (nl == std::string_view::npos) {
    return false;
  }
  size_t end = nl;
  if (end > pos && data[end - 1] == '\r') {
    --end;
  }
  line = data.substr(pos, end - pos);
  pos = nl + 1;
  return true;
}

bool is_token_char(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
  case '!':
  case '#':
  case '$':
  case '%':
  case '&':
  case '\'':
  case '*':
  case '+':
  case '-':
  case '.':
  case '^':
  case '_':
  case '`':
  case '|':
  case '~':
    return true;
  default:
    return false;
  }
}

bool is_token(std::string_view s) {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (!is_token_char(c)) {
      return false;
    }
  }
  return true;
}

// Parse header lines until the blank line. pos starts after the first line.
bool parse_headers(std::string_view head, size_t& pos, HttpHeaders& headers) {
  std::string_view line;
  while (next_line(head, pos, line)) {
    if (line.empty()) {
      return true;
    }
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      return false;
    }
    std::string_view name = line.substr(0, colon);
    if (!is_token(name)) {
      return false;  // also rejects obsolete line folding
    }
    std::string_view value = util::Trim(line.substr(colon + 1));
    headers.emplace_back(std::string(name), std::string(value));
  }
  // Head without a terminating blank line
  return false;
}

bool decode_chunked(std::string_view data, std::string& out) {
  size_t pos = 0;
  while (true) {
    std::string_view size_line;
    if (!next_line(data, pos, size_line)) {
      return false;
    }
    size_t semi = size_line.find(';');
    std::string_view hex = util::Trim(size_line.substr(0, semi));
    if (hex.empty()) {
      return false;
    }
    size_t chunk_size = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), chunk_size, 16);
    if (ec != std::errc() || ptr != hex.data() + hex.size()) {
      return false;
    }
    if (chunk_size == 0) {
      return true;  // trailers, if any, are ignored
    }
    if (data.size() - pos < chunk_size) {
      return false;
    }
    out.append(data.substr(pos, chunk_size));
    pos += chunk_size;
    // Chunk data is followed by CRLF
    if (pos < data.size() && data[pos] == '\r') {
      ++pos;
    }
    if (pos >= data.size() || data[pos] != '\n') {
      return false;
    }
    ++pos;
  }
}

}  // namespace

std::optional<std::string> HttpRequest::GetHeader(std::string_view name) const {
  return find_header(headers, name);
}

std::size_t FindHeadEnd(std::string_view data) {
  size_t crlf = data.find("\r\n\r\n");
  size_t lf = data.find("\n\n");
  if (crlf == std::string_view::npos && lf == std::string_view::npos) {
    return std::string_view::npos;
  }
  if (lf == std::string_view::npos || (crlf != std::string_view::npos && crlf < lf)) {
    return crlf + 4;
  }
  return lf + 2;
}

std::optional<HttpRequest> ParseHttpRequest(std::string_view head) {
  HttpRequest request;
  size_t pos = 0;

  std::string_view line;
  if (!next_line(head, pos, line)) {
    return std::nullopt;
  }

  // METHOD SP request-target SP HTTP-version
  size_t sp1 = line.find(' ');
  if (sp1 == std::string_view::npos) {
    return std::nullopt;
  }
  size_t sp2 = line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos || line.find(' ', sp2 + 1) != std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view method = line.substr(0, sp1);
  std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  std::string_view version = line.substr(sp2 + 1);

  if (!is_token(method)) {
    return std::nullopt;
  }
  // Origin-form only
  if (target.empty() || target.front() != '/') {
    return std::nullopt;
  }
  for (char c : target) {
    if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) {
      return std::nullopt;
    }
  }
  if (version != "HTTP/1.0" && version != "HTTP/1.1") {
    return std::nullopt;
  }

  request.method = std::string(method);
  request.target = std::string(target);
  request.path = std::string(target.substr(0, target.find_first_of("?#")));
  request.version = std::string(version);
  request.request_line = std::string(line);

  if (!parse_headers(head, pos, request.headers)) {
    return std::nullopt;
  }
  return request;
}

void HttpResponse::SetHeader(const std::string& name, const std::string& value) {
  for (auto& [key, existing] : headers) {
    if (iequals(key, name)) {
      existing = value;
      return;
    }
  }
  headers.emplace_back(name, value);
}

std::optional<std::string> HttpResponse::GetHeader(std::string_view name) const {
  return find_header(headers, name);
}

std::string HttpResponse::Serialize(bool include_body) const {
  std::string out;
  out.reserve(128 + body.size());
  out += "HTTP/1.1 ";
  out += std::to_string(status);
  out += ' ';
  out += ReasonPhrase(status);
  out += "\r\n";
  for (const auto& [key, value] : headers) {
    if (iequals(key, "Content-Length")) {
      continue;
    }
    out += key;
    out += ": ";
    out += value;
    out += "\r\n";
  }
  out += "Content-Length: ";
  out += std::to_string(body.size());
  out += "\r\n\r\n";
  if (include_body) {
    out += body;
  }
  return out;
}

HttpResponse HttpResponse::Text(int status, std::string body) {
  HttpResponse response;
  response.status = status;
  response.SetHeader("Content-Type", "text/plain");
  response.body = std::move(body);
  return response;
}

const char* ReasonPhrase(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 204:
    return "No Content";
  case 301:
    return "Moved Permanently";
  case 302:
    return "Found";
  case 400:
    return "Bad Request";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 408:
    return "Request Timeout";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  case 501:
    return "Not Implemented";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

std::optional<HttpResponse> ParseHttpResponse(std::string_view raw) {
  size_t head_end = FindHeadEnd(raw);
  if (head_end == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view head = raw.substr(0, head_end);
  std::string_view body = raw.substr(head_end);

  size_t pos = 0;
  std::string_view line;
  if (!next_line(head, pos, line)) {
    return std::nullopt;
  }

  // HTTP-version SP 3DIGIT [SP reason-phrase]
  if (!line.starts_with("HTTP/1.") || line.size() < 12 || line[8] != ' ') {
    return std::nullopt;
  }
  std::string_view code = line.substr(9, 3);
  if (line.size() > 12 && line[12] != ' ') {
    return std::nullopt;
  }
  auto status = util::SafeParseInt(code, 100, 599);
  if (!status) {
    return std::nullopt;
  }

  HttpResponse response;
  response.status = static_cast<int>(*status);
  if (!parse_headers(head, pos, response.headers)) {
    return std::nullopt;
  }

  auto transfer_encoding = response.GetHeader("Transfer-Encoding");
  if (transfer_encoding && util::ToLowerASCII(*transfer_encoding).find("chunked") != std::string::npos) {
    if (!decode_chunked(body, response.body)) {
      return std::nullopt;
    }
    return response;
  }

  auto content_length = response.GetHeader("Content-Length");
  if (content_length) {
    auto length = util::SafeParseInt(*content_length, 0, INT64_MAX);
    if (!length) {
      return std::nullopt;
    }
    if (body.size() < static_cast<uint64_t>(*length)) {
      return std::nullopt;  // truncated
    }
    body = body.substr(0, static_cast<size_t>(*length));
  }
  response.body = std::string(body);
  return response;
}

std::string HttpUrl::ToString() const {
  std::string out = (tls ? "https://" : "http://") + host;
  if (port != (tls ? 443 : 80)) {
    out += ":" + std::to_string(port);
  }
  out += path;
  return out;
}

std::optional<HttpUrl> ParseHttpUrl(std::string_view url) {
  constexpr std::string_view kHttp = "http://";
  constexpr std::string_view kHttps = "https://";

  HttpUrl result;
  std::string_view rest;
  if (url.size() > kHttp.size() && util::ToLowerASCII(url.substr(0, kHttp.size())) == kHttp) {
    rest = url.substr(kHttp.size());
  } else if (url.size() > kHttps.size() && util::ToLowerASCII(url.substr(0, kHttps.size())) == kHttps) {
    rest = url.substr(kHttps.size());
    result.tls = true;
    result.port = 443;
  } else {
    return std::nullopt;
  }

  size_t slash = rest.find('/');
  std::string_view authority = rest.substr(0, slash);
  std::string_view path = slash == std::string_view::npos ? std::string_view("/") : rest.substr(slash);

  if (authority.empty() || authority.find('@') != std::string_view::npos) {
    return std::nullopt;
  }

  size_t colon = authority.find(':');
  std::string_view host = authority.substr(0, colon);
  if (colon != std::string_view::npos) {
    auto port = util::SafeParsePort(authority.substr(colon + 1));
    if (!port || *port == 0) {
      return std::nullopt;
    }
    result.port = *port;
  }
  if (host.empty()) {
    return std::nullopt;
  }
  for (char c : host) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '.';
    if (!ok) {
      return std::nullopt;
    }
  }
  for (char c : path) {
    if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) {
      return std::nullopt;
    }
  }

  result.host = std::string(host);
  result.path = std::string(path.substr(0, path.find('#')));
  if (result.path.empty()) {
    result.path = "/";
  }
  return result;
}

}  // namespace network
}  // namespace ipbeacon

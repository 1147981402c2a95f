// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <charconv>
#include <cstdio>

namespace ipbeacon {
namespace util {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

}  // namespace

std::optional<int64_t> SafeParseInt(std::string_view str, int64_t min_value, int64_t max_value) {
  if (str.empty() || str.front() == '+') {
    return std::nullopt;
  }

  int64_t value = 0;
  const char* first = str.data();
  const char* last = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  if (value < min_value || value > max_value) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(std::string_view str) {
  auto value = SafeParseInt(str, 0, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::string_view Trim(std::string_view str) {
  while (!str.empty() && IsSpace(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && IsSpace(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

std::string ToLowerASCII(std::string_view str) {
  std::string out(str);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

std::string EscapeForLog(std::string_view str, std::size_t max_len) {
  std::string out;
  const bool truncated = str.size() > max_len;
  if (truncated) {
    str = str.substr(0, max_len);
  }

  out.reserve(str.size());
  for (unsigned char c : str) {
    if (c >= 0x20 && c < 0x7f && c != '\\') {
      out.push_back(static_cast<char>(c));
    } else if (c == '\\') {
      out += "\\\\";
    } else {
      char buf[5];
      snprintf(buf, sizeof(buf), "\\x%02x", c);
      out += buf;
    }
  }

  if (truncated) {
    out += "...";
  }
  return out;
}

}  // namespace util
}  // namespace ipbeacon

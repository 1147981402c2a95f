// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ipbeacon {
namespace util {

// Strict decimal integer parse. Rejects empty input, whitespace, a leading
// '+', trailing characters and values outside [min_value, max_value].
std::optional<int64_t> SafeParseInt(std::string_view str, int64_t min_value, int64_t max_value);

// Port number 0..65535 (0 = ephemeral)
std::optional<uint16_t> SafeParsePort(std::string_view str);

// Strip leading/trailing ASCII whitespace (space, \t, \r, \n, \v, \f)
std::string_view Trim(std::string_view str);

// Lowercase ASCII copy (header names)
std::string ToLowerASCII(std::string_view str);

// Printable rendering of untrusted bytes for log lines: non-printable bytes
// become \xNN and the result is cut at max_len with a "..." marker.
std::string EscapeForLog(std::string_view str, std::size_t max_len = 64);

}  // namespace util
}  // namespace ipbeacon

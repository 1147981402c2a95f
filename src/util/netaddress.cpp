#include "util/netaddress.hpp"

namespace ipbeacon {
namespace util {

std::optional<std::array<uint8_t, 4>> ParseIPv4(std::string_view address) {
  // Longest valid form is "255.255.255.255"
  if (address.empty() || address.size() > 15) {
    return std::nullopt;
  }

  std::array<uint8_t, 4> bytes{};
  size_t octet = 0;
  size_t pos = 0;

  while (true) {
    if (octet >= 4) {
      return std::nullopt;
    }

    size_t start = pos;
    unsigned value = 0;
    while (pos < address.size() && address[pos] >= '0' && address[pos] <= '9') {
      value = value * 10 + static_cast<unsigned>(address[pos] - '0');
      if (value > 255) {
        return std::nullopt;
      }
      ++pos;
    }

    size_t digits = pos - start;
    if (digits == 0) {
      return std::nullopt;  // empty octet or non-digit
    }
    if (digits > 1 && address[start] == '0') {
      return std::nullopt;  // leading zero
    }
    bytes[octet++] = static_cast<uint8_t>(value);

    if (pos == address.size()) {
      break;
    }
    if (address[pos] != '.') {
      return std::nullopt;
    }
    ++pos;
    if (pos == address.size()) {
      return std::nullopt;  // trailing dot
    }
  }

  if (octet != 4) {
    return std::nullopt;
  }
  return bytes;
}

bool IsValidIPv4(std::string_view address) {
  return ParseIPv4(address).has_value();
}

namespace {

struct SpecialRange {
  uint8_t prefix[4];
  int bits;
  const char* reason;
};

// Special-purpose IPv4 ranges that are never a host's public address
constexpr SpecialRange kSpecialRanges[] = {
    {{0, 0, 0, 0}, 8, "\"this network\" (RFC 1122)"},
    {{10, 0, 0, 0}, 8, "private (RFC 1918)"},
    {{100, 64, 0, 0}, 10, "shared CGNAT (RFC 6598)"},
    {{127, 0, 0, 0}, 8, "loopback (RFC 1122)"},
    {{169, 254, 0, 0}, 16, "link-local (RFC 3927)"},
    {{172, 16, 0, 0}, 12, "private (RFC 1918)"},
    {{192, 0, 0, 0}, 24, "IETF protocol assignments (RFC 6890)"},
    {{192, 0, 2, 0}, 24, "documentation (RFC 5737)"},
    {{192, 168, 0, 0}, 16, "private (RFC 1918)"},
    {{198, 18, 0, 0}, 15, "benchmarking (RFC 2544)"},
    {{198, 51, 100, 0}, 24, "documentation (RFC 5737)"},
    {{203, 0, 113, 0}, 24, "documentation (RFC 5737)"},
    {{224, 0, 0, 0}, 4, "multicast (RFC 5771)"},
    {{240, 0, 0, 0}, 4, "reserved (RFC 1112)"},  // includes 255.255.255.255
};

uint32_t to_uint32(const uint8_t b[4]) {
  return (uint32_t{b[0]} << 24) | (uint32_t{b[1]} << 16) | (uint32_t{b[2]} << 8) | uint32_t{b[3]};
}

}  // namespace

std::optional<std::string_view> NonRoutableReason(std::string_view address) {
  auto bytes = ParseIPv4(address);
  if (!bytes) {
    return std::nullopt;
  }
  const uint32_t value = to_uint32(bytes->data());
  for (const auto& range : kSpecialRanges) {
    const uint32_t mask = ~uint32_t{0} << (32 - range.bits);
    if ((value & mask) == to_uint32(range.prefix)) {
      return std::string_view(range.reason);
    }
  }
  return std::nullopt;
}

bool IsRoutableIPv4(std::string_view address) {
  return IsValidIPv4(address) && !NonRoutableReason(address);
}

}  // namespace util
}  // namespace ipbeacon

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate IPv4 address strings coming from echo services, the local cache
   and the served IP file before anything trusts them
 - Classify addresses that are syntactically valid but not publicly routable

 Key functions:
 - ParseIPv4: strict dotted-quad parse
 - IsValidIPv4: Quick check if address string is valid
 - NonRoutableReason / IsRoutableIPv4: special-purpose range lookup
*/

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ipbeacon {
namespace util {

/**
 * Parse a strict IPv4 dotted-quad string
 *
 * Accepted: exactly four '.'-separated decimal octets, each 0..255, each
 * either "0" or a number without leading zeros.
 *
 * Rejected (non-exhaustive):
 * - "" / "1.2.3" / "1.2.3.4.5" / "1..2.3"     wrong shape
 * - "256.1.1.1"                               octet out of range
 * - "01.2.3.4"                                leading zero (octal ambiguity in inet_aton)
 * - " 1.2.3.4" / "1.2.3.4\n"                  whitespace (callers trim first)
 * - "+1.2.3.4" / "0x1.2.3.4" / "1.2.3.4/24"   anything that is not a digit or '.'
 * - "::ffff:1.2.3.4"                          IPv6 forms are not accepted
 *
 * @return the four octets in network order, or std::nullopt if invalid
 */
std::optional<std::array<uint8_t, 4>> ParseIPv4(std::string_view address);

/**
 * Check if a string is a valid IPv4 address (see ParseIPv4)
 */
bool IsValidIPv4(std::string_view address);

/**
 * Why a valid address is not publicly routable, as a short label such as
 * "private (RFC 1918)" or "shared CGNAT (RFC 6598)". Used to explain a
 * probe result that reflects a proxy or carrier NAT rather than our own
 * public address.
 *
 * @return the label of the special-purpose range containing the address, or
 *         std::nullopt if it is publicly routable or not a valid address
 */
std::optional<std::string_view> NonRoutableReason(std::string_view address);

// Valid and outside every special-purpose range
bool IsRoutableIPv4(std::string_view address);

}  // namespace util
}  // namespace ipbeacon

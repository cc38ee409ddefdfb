#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings coming back from DNS or from
   peers' self-reported addresses
 - Format and parse "host:port" / "[v6]:port" text forms

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPAddress: Quick check if address string is valid
 - FormatHostPort / ParseHostPort: text form used in logs, CLI and cache files
*/

#include <cstdint>
#include <optional>
#include <string>

namespace meshwalk {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4), so that the same peer
 * seen through a v4 and a dual-stack socket compares equal.
 *
 * Hostnames are rejected (only numeric IPs accepted).
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "dispersy1.tribler.org" -> std::nullopt
 *   "" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Check if a string is a valid numeric IP address
 */
bool IsValidIPAddress(const std::string& address);

/**
 * Format host and port; IPv6 literals are bracketed ("[::1]:6421")
 */
std::string FormatHostPort(const std::string& host, uint16_t port);

/**
 * Parse "host:port" or "[IPv6]:port"
 *
 * The host part may be a hostname; IP literals are normalized. Unbracketed
 * IPv6 ("::1:80") is rejected as ambiguous.
 *
 * @return true if successfully parsed, false otherwise
 */
bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port);

} // namespace util
} // namespace meshwalk

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace meshwalk {
namespace network {

/**
 * Address - (host, port) value type
 *
 * Host is an IP literal or a hostname. Two addresses are equal iff host and
 * port are equal; no resolution or normalization happens here (callers
 * normalize IP literals with util::ValidateAndNormalizeIP before building
 * one).
 */
struct Address {
  std::string host;
  uint16_t port{0};

  Address() = default;
  Address(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

  bool empty() const { return host.empty() && port == 0; }

  // "host:port", or "[v6]:port" for IPv6 literals
  std::string ToString() const;

  // Inverse of ToString(); std::nullopt if malformed
  static std::optional<Address> FromString(const std::string &str);

  bool operator==(const Address &other) const {
    return port == other.port && host == other.host;
  }
  bool operator!=(const Address &other) const { return !(*this == other); }
  bool operator<(const Address &other) const {
    if (host != other.host)
      return host < other.host;
    return port < other.port;
  }
};

} // namespace network
} // namespace meshwalk

template <> struct std::hash<meshwalk::network::Address> {
  size_t operator()(const meshwalk::network::Address &addr) const noexcept {
    size_t h = std::hash<std::string>{}(addr.host);
    return h ^ (static_cast<size_t>(addr.port) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/address.hpp"
#include "util/netaddress.hpp"

namespace meshwalk {
namespace network {

std::string Address::ToString() const {
  return util::FormatHostPort(host, port);
}

std::optional<Address> Address::FromString(const std::string &str) {
  std::string host;
  uint16_t port = 0;
  if (!util::ParseHostPort(str, host, port)) {
    return std::nullopt;
  }
  return Address(std::move(host), port);
}

} // namespace network
} // namespace meshwalk

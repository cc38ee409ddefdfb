// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// NAT classification implementation

#include "network/connection_types.hpp"

namespace meshwalk {
namespace network {

std::string ConnectionTypeAsString(ConnectionType conn_type) {
  switch (conn_type) {
  case ConnectionType::PUBLIC:
    return "public";
  case ConnectionType::SYMMETRIC_NAT:
    return "symmetric-NAT";
  case ConnectionType::UNKNOWN:
  default:
    return "unknown";
  }
}

ConnectionType ConnectionTypeFromString(const std::string &str) {
  if (str == "public")
    return ConnectionType::PUBLIC;
  if (str == "symmetric-NAT")
    return ConnectionType::SYMMETRIC_NAT;
  return ConnectionType::UNKNOWN;
}

} // namespace network
} // namespace meshwalk

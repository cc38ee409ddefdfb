// Copyright (c) 2025 The Unicity Foundation
// NAT classification of remote peers

#pragma once

#include <string>

namespace meshwalk {
namespace network {

/**
 * How a peer's internet-visible address behaves.
 * This is what the peer reports about itself in introduction requests; we
 * cannot verify it, only use it to decide how far to trust its port.
 */
enum class ConnectionType {
  /**
   * Nothing known yet. Port values are taken at face value.
   */
  UNKNOWN,

  /**
   * The peer's self-reported WAN address equals the address we observe, so
   * it is directly reachable.
   */
  PUBLIC,

  /**
   * The peer's outbound source port changes per destination. Its port is
   * useless for identity, so several observed addresses sharing one WAN IP
   * are the same peer.
   */
  SYMMETRIC_NAT,
};

/**
 * Convert ConnectionType enum to its wire/text form
 * ("unknown", "public", "symmetric-NAT")
 */
std::string ConnectionTypeAsString(ConnectionType conn_type);

/**
 * Parse the text form; anything unrecognised is UNKNOWN
 */
ConnectionType ConnectionTypeFromString(const std::string &str);

} // namespace network
} // namespace meshwalk

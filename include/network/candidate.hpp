// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Candidate — one remote peer as seen by the overlay

 Identity
 - address: observed source address of its most recent message
 - lan_address / wan_address: what the peer reports about itself
 - connection_type: the peer's self-reported NAT classification

 Activity
 - Tracked per community: one peer can be a candidate in many communities,
   and what happened in one says nothing about the others
 - Each event carries a wall-clock timestamp (seconds, for lifetimes) and a
   per-community sequence number (for ordering; several events may share
   the same timestamp)
 - Activity is written only by CandidateRegistry, which owns the sequence
   counter for its community

 Bootstrap candidates
 - Built from resolved bootstrap hosts; never introduced to other peers and
   never timed out
*/

#include "network/address.hpp"
#include "network/connection_types.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace meshwalk {
namespace network {

/**
 * Per-community interaction record. Timestamps are 0 when unset.
 */
struct CandidateActivity {
  double last_stumble{0};       // Peer contacted us unsolicited
  double last_walk{0};          // We sent it an introduction request
  double last_walk_response{0}; // It answered our request
  double last_intro{0};         // Another peer introduced it to us
  double walk_deadline{0};      // Response expected before this (0 = none pending)

  uint64_t stumble_seq{0};
  uint64_t walk_seq{0};
  uint64_t walk_response_seq{0};
  uint64_t intro_seq{0};

  bool empty() const {
    return stumble_seq == 0 && walk_seq == 0 && walk_response_seq == 0 &&
           intro_seq == 0;
  }

  // Field-wise maximum (used when folding duplicate candidates)
  void merge(const CandidateActivity &other);
};

/**
 * Walk category of a candidate in one community
 */
enum class CandidateCategory {
  WALK,    // Answered one of our walks recently
  STUMBLE, // Contacted us recently
  INTRO,   // Was introduced to us recently
  NONE,    // Nothing recent (or a bootstrap candidate)
};

std::string CandidateCategoryAsString(CandidateCategory category);

class Candidate {
public:
  Candidate(Address address, bool is_bootstrap, Address lan_address,
            Address wan_address, ConnectionType connection_type);

  const Address &address() const { return address_; }
  const Address &lan_address() const { return lan_address_; }
  const Address &wan_address() const { return wan_address_; }
  ConnectionType connection_type() const { return connection_type_; }
  bool is_bootstrap() const { return is_bootstrap_; }

  void set_lan_address(const Address &address) { lan_address_ = address; }
  void set_wan_address(const Address &address) { wan_address_ = address; }
  void set_connection_type(ConnectionType type) { connection_type_ = type; }

  // Activity in COMMUNITY, or nullptr if there never was any
  const CandidateActivity *activity(const std::string &community) const;

  // Creates an empty record on first use
  CandidateActivity &mutable_activity(const std::string &community);

  void erase_activity(const std::string &community);

  std::string ToString() const;

private:
  Address address_;
  bool is_bootstrap_;
  Address lan_address_;
  Address wan_address_;
  ConnectionType connection_type_;

  std::map<std::string, CandidateActivity> activity_;
};

using CandidatePtr = std::shared_ptr<Candidate>;

/**
 * Candidate for a resolved bootstrap host: lan = wan = address, unknown NAT
 */
CandidatePtr MakeBootstrapCandidate(const Address &address);

} // namespace network
} // namespace meshwalk

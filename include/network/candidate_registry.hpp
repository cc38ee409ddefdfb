// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 CandidateRegistry — the known peers of one overlay community

 Purpose
 - Own the candidates of one community, keyed by observed address
 - Record protocol events (stumble / walk / walk_response / intro)
 - Decide whom to introduce to a requesting peer
 - Decide whom to walk to next

 Ordering
 - Every event gets the next value of a per-registry sequence counter.
   Introductions are ordered by sequence, never by wall clock, so events
   recorded with the same timestamp still have a strict order, and traffic
   in one community never reorders another.

 Introduction policy
 - PLAIN: recency = latest stumble, walk or walk-response. A requester is
   offered the candidates strictly older than itself, newest first; on
   first contact there is nothing older and the list is empty.
 - TRACKER: recency = latest stumble or walk-response (our own walk proves
   nothing about the peer). The list is the older candidates newest first,
   followed by the newer ones newest first, so any other active candidate
   is eventually offered.
 - Both policies skip the requester, bootstrap candidates and candidates
   without activity here.

 Walk selection
 - Categories: WALK (answered a walk within 57.5s), STUMBLE (contacted us
   within 57.5s), INTRO (introduced within 27.5s), NONE
 - A category is picked with weights 49.75 / 24.875 / 24.875 / 0.5
   (walk / stumble / intro / bootstrap); an empty pick falls back through
   walk, stumble, intro, bootstrap
 - Within a category the candidate walked longest ago wins

 Threading
 - Not internally synchronized; owned by the io_context thread
*/

#include "network/candidate.hpp"
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace meshwalk {
namespace network {

enum class CommunityPolicy {
  PLAIN,
  TRACKER,
};

class CandidateRegistry {
public:
  explicit CandidateRegistry(std::string community_id,
                             CommunityPolicy policy = CommunityPolicy::PLAIN);

  const std::string &community_id() const { return community_id_; }
  CommunityPolicy policy() const { return policy_; }

  /**
   * Register a candidate under ADDRESS.
   * An existing candidate at ADDRESS is returned instead, with its lan/wan
   * addresses and connection type refreshed; its activity is kept.
   */
  CandidatePtr create_candidate(const Address &address, bool is_bootstrap,
                                const Address &lan_address,
                                const Address &wan_address,
                                ConnectionType connection_type);

  CandidatePtr get(const Address &address) const;
  bool remove(const Address &address);
  std::vector<CandidatePtr> candidates() const;
  size_t size() const { return candidates_.size(); }

  /**
   * Fold candidates that are the same physical peer as REFERENCE into it.
   *
   * Peers sharing REFERENCE's WAN IP are folded when any of them (or the
   * reference) is behind a symmetric NAT, or when they also report the same
   * LAN address. Activity of folded entries is merged field-wise (latest
   * wins) into the reference and the entries are removed.
   *
   * @return number of candidates folded
   */
  size_t filter_duplicate(const CandidatePtr &reference);

  // Event hooks. Each registers the candidate here if needed (an already
  // registered candidate at the same address takes precedence) and returns
  // the registered instance. Throw std::invalid_argument on null.
  CandidatePtr stumble(const CandidatePtr &candidate, double now);
  CandidatePtr walk(const CandidatePtr &candidate, double now, double timeout);
  CandidatePtr walk_response(const CandidatePtr &candidate, double now);
  CandidatePtr intro(const CandidatePtr &candidate, double now);

  /**
   * Introduction targets for REQUESTER, best first. Recomputed on every
   * call; an empty list means there is no one to introduce.
   */
  std::vector<CandidatePtr>
  yield_introduce_candidates(const CandidatePtr &requester) const;

  // First of yield_introduce_candidates(), or nullptr
  CandidatePtr introduce_candidate(const CandidatePtr &requester) const;

  CandidateCategory category(const Candidate &candidate, double now) const;
  bool is_eligible_for_walk(const Candidate &candidate, double now) const;

  // Next walk target, or nullptr if nothing is eligible
  CandidatePtr select_walk_candidate(double now);

  /**
   * Drop non-bootstrap candidates that have gone stale (category NONE) and
   * are not awaiting a walk response.
   * @return number removed
   */
  size_t cleanup(double now);

  // Deterministic walk selection for tests
  void seed(uint32_t value) { rng_.seed(value); }

private:
  CandidatePtr adopt(const CandidatePtr &candidate);
  uint64_t next_sequence() { return ++sequence_; }

  // Policy-dependent ordering key; 0 means "no activity here"
  uint64_t recency(const Candidate &candidate) const;

  std::string community_id_;
  CommunityPolicy policy_;
  std::map<Address, CandidatePtr> candidates_;
  uint64_t sequence_{0};
  std::mt19937 rng_;
};

} // namespace network
} // namespace meshwalk

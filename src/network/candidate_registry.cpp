// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/candidate_registry.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace meshwalk {
namespace network {

namespace {

void RequireCandidate(const CandidatePtr &candidate, const char *where) {
  if (!candidate) {
    throw std::invalid_argument(std::string(where) + ": null candidate");
  }
}

} // anonymous namespace

CandidateRegistry::CandidateRegistry(std::string community_id, CommunityPolicy policy)
    : community_id_(std::move(community_id)), policy_(policy),
      rng_(std::random_device{}()) {}

CandidatePtr CandidateRegistry::create_candidate(const Address &address,
                                                 bool is_bootstrap,
                                                 const Address &lan_address,
                                                 const Address &wan_address,
                                                 ConnectionType connection_type) {
  auto it = candidates_.find(address);
  if (it != candidates_.end()) {
    CandidatePtr &existing = it->second;
    existing->set_lan_address(lan_address);
    existing->set_wan_address(wan_address);
    existing->set_connection_type(connection_type);
    return existing;
  }

  auto candidate = std::make_shared<Candidate>(address, is_bootstrap, lan_address,
                                               wan_address, connection_type);
  candidates_.emplace(address, candidate);
  LOG_NET_TRACE("[{}] new candidate {}", community_id_, candidate->ToString());
  return candidate;
}

CandidatePtr CandidateRegistry::get(const Address &address) const {
  auto it = candidates_.find(address);
  return it == candidates_.end() ? nullptr : it->second;
}

bool CandidateRegistry::remove(const Address &address) {
  auto it = candidates_.find(address);
  if (it == candidates_.end()) {
    return false;
  }
  it->second->erase_activity(community_id_);
  candidates_.erase(it);
  return true;
}

std::vector<CandidatePtr> CandidateRegistry::candidates() const {
  std::vector<CandidatePtr> result;
  result.reserve(candidates_.size());
  for (const auto &[_, candidate] : candidates_) {
    result.push_back(candidate);
  }
  return result;
}

CandidatePtr CandidateRegistry::adopt(const CandidatePtr &candidate) {
  auto [it, inserted] = candidates_.emplace(candidate->address(), candidate);
  if (inserted) {
    LOG_NET_TRACE("[{}] adopted candidate {}", community_id_, candidate->ToString());
  }
  return it->second;
}

size_t CandidateRegistry::filter_duplicate(const CandidatePtr &reference) {
  RequireCandidate(reference, "filter_duplicate");
  CandidatePtr ref = adopt(reference);

  const std::string &wan_host = ref->wan_address().host;
  if (wan_host.empty()) {
    return 0;
  }

  const bool ref_symmetric = ref->connection_type() == ConnectionType::SYMMETRIC_NAT;
  std::vector<CandidatePtr> group;
  for (const auto &[address, candidate] : candidates_) {
    if (candidate == ref || candidate->wan_address().host != wan_host)
      continue;
    // A shared WAN IP alone is not enough: several distinct peers can sit
    // behind one cone NAT. Each pair needs a symmetric NAT on one side or
    // a matching LAN address.
    if (!ref_symmetric && candidate->connection_type() != ConnectionType::SYMMETRIC_NAT &&
        candidate->lan_address() != ref->lan_address())
      continue;
    group.push_back(candidate);
  }

  size_t folded = 0;
  for (const auto &candidate : group) {
    if (const CandidateActivity *activity = candidate->activity(community_id_)) {
      ref->mutable_activity(community_id_).merge(*activity);
    }
    LOG_NET_DEBUG("[{}] folding duplicate {} into {}", community_id_,
                  candidate->ToString(), ref->ToString());
    remove(candidate->address());
    ++folded;
  }
  return folded;
}

CandidatePtr CandidateRegistry::stumble(const CandidatePtr &candidate, double now) {
  RequireCandidate(candidate, "stumble");
  CandidatePtr c = adopt(candidate);
  CandidateActivity &activity = c->mutable_activity(community_id_);
  activity.last_stumble = now;
  activity.stumble_seq = next_sequence();
  return c;
}

CandidatePtr CandidateRegistry::walk(const CandidatePtr &candidate, double now,
                                     double timeout) {
  RequireCandidate(candidate, "walk");
  CandidatePtr c = adopt(candidate);
  CandidateActivity &activity = c->mutable_activity(community_id_);
  activity.last_walk = now;
  activity.walk_deadline = now + timeout;
  activity.walk_seq = next_sequence();
  return c;
}

CandidatePtr CandidateRegistry::walk_response(const CandidatePtr &candidate,
                                              double now) {
  RequireCandidate(candidate, "walk_response");
  CandidatePtr c = adopt(candidate);
  CandidateActivity &activity = c->mutable_activity(community_id_);
  activity.last_walk_response = now;
  activity.walk_deadline = 0;
  activity.walk_response_seq = next_sequence();
  return c;
}

CandidatePtr CandidateRegistry::intro(const CandidatePtr &candidate, double now) {
  RequireCandidate(candidate, "intro");
  CandidatePtr c = adopt(candidate);
  CandidateActivity &activity = c->mutable_activity(community_id_);
  activity.last_intro = now;
  activity.intro_seq = next_sequence();
  return c;
}

uint64_t CandidateRegistry::recency(const Candidate &candidate) const {
  const CandidateActivity *activity = candidate.activity(community_id_);
  if (!activity) {
    return 0;
  }
  uint64_t seen = std::max(activity->stumble_seq, activity->walk_response_seq);
  if (policy_ == CommunityPolicy::TRACKER) {
    return seen;
  }
  return std::max(seen, activity->walk_seq);
}

std::vector<CandidatePtr>
CandidateRegistry::yield_introduce_candidates(const CandidatePtr &requester) const {
  RequireCandidate(requester, "yield_introduce_candidates");

  CandidatePtr registered = get(requester->address());
  const uint64_t requester_recency = recency(registered ? *registered : *requester);

  std::vector<std::pair<uint64_t, CandidatePtr>> older;
  std::vector<std::pair<uint64_t, CandidatePtr>> newer;
  for (const auto &[address, candidate] : candidates_) {
    if (address == requester->address() || candidate->is_bootstrap())
      continue;
    uint64_t r = recency(*candidate);
    if (r == 0)
      continue;
    if (r < requester_recency) {
      older.emplace_back(r, candidate);
    } else {
      newer.emplace_back(r, candidate);
    }
  }

  auto newest_first = [](const auto &a, const auto &b) { return a.first > b.first; };
  std::sort(older.begin(), older.end(), newest_first);

  std::vector<CandidatePtr> result;
  result.reserve(older.size() + newer.size());
  for (auto &entry : older) {
    result.push_back(std::move(entry.second));
  }

  if (policy_ == CommunityPolicy::TRACKER) {
    std::sort(newer.begin(), newer.end(), newest_first);
    for (auto &entry : newer) {
      result.push_back(std::move(entry.second));
    }
  }
  return result;
}

CandidatePtr CandidateRegistry::introduce_candidate(const CandidatePtr &requester) const {
  auto list = yield_introduce_candidates(requester);
  return list.empty() ? nullptr : list.front();
}

CandidateCategory CandidateRegistry::category(const Candidate &candidate,
                                              double now) const {
  if (candidate.is_bootstrap()) {
    return CandidateCategory::NONE;
  }
  const CandidateActivity *activity = candidate.activity(community_id_);
  if (!activity) {
    return CandidateCategory::NONE;
  }
  if (activity->walk_response_seq != 0 &&
      now < activity->last_walk_response + protocol::CANDIDATE_WALK_LIFETIME) {
    return CandidateCategory::WALK;
  }
  if (activity->stumble_seq != 0 &&
      now < activity->last_stumble + protocol::CANDIDATE_STUMBLE_LIFETIME) {
    return CandidateCategory::STUMBLE;
  }
  if (activity->intro_seq != 0 &&
      now < activity->last_intro + protocol::CANDIDATE_INTRO_LIFETIME) {
    return CandidateCategory::INTRO;
  }
  return CandidateCategory::NONE;
}

bool CandidateRegistry::is_eligible_for_walk(const Candidate &candidate,
                                             double now) const {
  const CandidateActivity *activity = candidate.activity(community_id_);
  const bool never_walked = !activity || activity->walk_seq == 0;
  const double last_walk = activity ? activity->last_walk : 0;

  if (candidate.is_bootstrap()) {
    return never_walked ||
           last_walk + protocol::CANDIDATE_ELIGIBLE_BOOTSTRAP_DELAY <= now;
  }
  if (category(candidate, now) == CandidateCategory::NONE) {
    return false;
  }
  return never_walked || last_walk + protocol::CANDIDATE_ELIGIBLE_DELAY <= now;
}

CandidatePtr CandidateRegistry::select_walk_candidate(double now) {
  // Index order is also the fallback order
  enum { WALK = 0, STUMBLE, INTRO, BOOTSTRAP, NUM_SLOTS };
  std::array<CandidatePtr, NUM_SLOTS> best;
  std::array<double, NUM_SLOTS> best_walk{};

  for (const auto &[address, candidate] : candidates_) {
    if (!is_eligible_for_walk(*candidate, now))
      continue;

    int slot = BOOTSTRAP;
    if (!candidate->is_bootstrap()) {
      switch (category(*candidate, now)) {
      case CandidateCategory::WALK:
        slot = WALK;
        break;
      case CandidateCategory::STUMBLE:
        slot = STUMBLE;
        break;
      case CandidateCategory::INTRO:
        slot = INTRO;
        break;
      case CandidateCategory::NONE:
        continue;
      }
    }

    const CandidateActivity *activity = candidate->activity(community_id_);
    double last_walk = activity ? activity->last_walk : 0;
    if (!best[slot] || last_walk < best_walk[slot]) {
      best[slot] = candidate;
      best_walk[slot] = last_walk;
    }
  }

  std::uniform_int_distribution<uint32_t> dist(0, protocol::walk_weight::TOTAL - 1);
  const uint32_t roll = dist(rng_);
  int chosen = BOOTSTRAP;
  if (roll < protocol::walk_weight::WALK) {
    chosen = WALK;
  } else if (roll < protocol::walk_weight::WALK + protocol::walk_weight::STUMBLE) {
    chosen = STUMBLE;
  } else if (roll < protocol::walk_weight::WALK + protocol::walk_weight::STUMBLE +
                        protocol::walk_weight::INTRO) {
    chosen = INTRO;
  }

  if (best[chosen]) {
    return best[chosen];
  }
  for (int slot = 0; slot < NUM_SLOTS; ++slot) {
    if (best[slot]) {
      return best[slot];
    }
  }
  return nullptr;
}

size_t CandidateRegistry::cleanup(double now) {
  std::vector<Address> stale;
  for (const auto &[address, candidate] : candidates_) {
    if (candidate->is_bootstrap())
      continue;
    if (category(*candidate, now) != CandidateCategory::NONE)
      continue;
    const CandidateActivity *activity = candidate->activity(community_id_);
    if (activity && activity->walk_deadline > now)
      continue;
    stale.push_back(address);
  }

  for (const auto &address : stale) {
    remove(address);
  }
  if (!stale.empty()) {
    LOG_NET_DEBUG("[{}] removed {} stale candidates, {} remain", community_id_,
                  stale.size(), candidates_.size());
  }
  return stale.size();
}

} // namespace network
} // namespace meshwalk

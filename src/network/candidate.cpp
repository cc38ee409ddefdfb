// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/candidate.hpp"
#include <algorithm>

namespace meshwalk {
namespace network {

void CandidateActivity::merge(const CandidateActivity &other) {
  last_stumble = std::max(last_stumble, other.last_stumble);
  last_walk = std::max(last_walk, other.last_walk);
  last_walk_response = std::max(last_walk_response, other.last_walk_response);
  last_intro = std::max(last_intro, other.last_intro);
  walk_deadline = std::max(walk_deadline, other.walk_deadline);
  stumble_seq = std::max(stumble_seq, other.stumble_seq);
  walk_seq = std::max(walk_seq, other.walk_seq);
  walk_response_seq = std::max(walk_response_seq, other.walk_response_seq);
  intro_seq = std::max(intro_seq, other.intro_seq);
}

std::string CandidateCategoryAsString(CandidateCategory category) {
  switch (category) {
  case CandidateCategory::WALK:
    return "walk";
  case CandidateCategory::STUMBLE:
    return "stumble";
  case CandidateCategory::INTRO:
    return "intro";
  case CandidateCategory::NONE:
  default:
    return "none";
  }
}

Candidate::Candidate(Address address, bool is_bootstrap, Address lan_address,
                     Address wan_address, ConnectionType connection_type)
    : address_(std::move(address)), is_bootstrap_(is_bootstrap),
      lan_address_(std::move(lan_address)), wan_address_(std::move(wan_address)),
      connection_type_(connection_type) {}

const CandidateActivity *Candidate::activity(const std::string &community) const {
  auto it = activity_.find(community);
  return it == activity_.end() ? nullptr : &it->second;
}

CandidateActivity &Candidate::mutable_activity(const std::string &community) {
  return activity_[community];
}

void Candidate::erase_activity(const std::string &community) {
  activity_.erase(community);
}

std::string Candidate::ToString() const {
  std::string out = (is_bootstrap_ ? "B" : "") + std::string("{") +
                    address_.ToString();
  if (lan_address_ != address_ || wan_address_ != address_) {
    out += " lan=" + lan_address_.ToString() + " wan=" + wan_address_.ToString();
  }
  if (connection_type_ != ConnectionType::UNKNOWN) {
    out += " " + ConnectionTypeAsString(connection_type_);
  }
  out += "}";
  return out;
}

CandidatePtr MakeBootstrapCandidate(const Address &address) {
  return std::make_shared<Candidate>(address, true, address, address,
                                     ConnectionType::UNKNOWN);
}

} // namespace network
} // namespace meshwalk

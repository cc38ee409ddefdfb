// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/walker.hpp"
#include "crypto/digest.hpp"
#include "crypto/ec_crypto.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <stdexcept>

namespace meshwalk {
namespace network {

Walker::Walker(boost::asio::io_context &io_context, const crypto::Crypto &crypto,
               crypto::KeyPtr key, BootstrapResolver *bootstrap, SendFunction send,
               const Config &config)
    : io_context_(io_context), crypto_(crypto), key_(std::move(key)),
      bootstrap_(bootstrap), send_(std::move(send)), config_(config) {
  if (!key_ || !key_->has_private_key()) {
    throw std::invalid_argument("Walker requires a private signing key");
  }
  if (!send_) {
    throw std::invalid_argument("Walker requires a send function");
  }
  walk_timer_ = std::make_unique<boost::asio::steady_timer>(io_context_);
}

Walker::~Walker() { stop(); }

void Walker::add_community(std::shared_ptr<CandidateRegistry> registry) {
  if (!registry) {
    throw std::invalid_argument("add_community: null registry");
  }
  const std::string id = registry->community_id();
  communities_[id] = std::move(registry);
  LOG_WALK_DEBUG("Walking community {}", id);
}

bool Walker::remove_community(const std::string &community_id) {
  for (auto it = outstanding_.begin(); it != outstanding_.end();) {
    if (it->first.first == community_id) {
      it = outstanding_.erase(it);
    } else {
      ++it;
    }
  }
  return communities_.erase(community_id) > 0;
}

std::shared_ptr<CandidateRegistry> Walker::community(const std::string &community_id) const {
  auto it = communities_.find(community_id);
  return it == communities_.end() ? nullptr : it->second;
}

void Walker::start() {
  if (running_.exchange(true)) {
    return;
  }
  LOG_WALK_INFO("Walker started ({} communities, interval {}ms)",
                communities_.size(), config_.walk_interval.count());
  schedule_next_step();
}

void Walker::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  if (walk_timer_) {
    (void)walk_timer_->cancel();
  }
  LOG_WALK_INFO("Walker stopped");
}

void Walker::schedule_next_step() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  walk_timer_->expires_after(config_.walk_interval);
  // A queued handler may outlive the walker; it checks LIFETIME first
  walk_timer_->async_wait([this, lifetime = std::weak_ptr<void>(lifetime_)](
                              const boost::system::error_code &ec) {
    if (ec || lifetime.expired()) {
      return;
    }
    if (running_.load(std::memory_order_acquire)) {
      take_step(util::GetTimeSeconds());
      schedule_next_step();
    }
  });
}

bool Walker::seed_bootstrap(CandidateRegistry &registry) {
  if (!bootstrap_) {
    return false;
  }
  auto seeds = bootstrap_->candidates();
  for (const auto &seed : seeds) {
    registry.create_candidate(seed->address(), true, seed->lan_address(),
                              seed->wan_address(), seed->connection_type());
  }
  return !seeds.empty();
}

message::SignedMessage Walker::sign(const std::vector<uint8_t> &payload) const {
  message::SignedMessage msg;
  msg.payload = payload;
  msg.signature = crypto_.create_signature(*key_, crypto::Sha1Digest(payload));
  return msg;
}

crypto::SignatureCheck Walker::verify(const crypto::ECKey &key,
                                      const message::SignedMessage &msg) const {
  return crypto_.verify_signature(key, crypto::Sha1Digest(msg.payload), msg.signature);
}

size_t Walker::take_step(double now) {
  size_t sent = 0;
  for (const auto &[id, registry] : communities_) {
    try {
      CandidatePtr target = registry->select_walk_candidate(now);
      if (!target && seed_bootstrap(*registry)) {
        target = registry->select_walk_candidate(now);
      }
      if (!target) {
        LOG_WALK_DEBUG("[{}] no candidate eligible for a walk", id);
        continue;
      }

      const CandidateCategory category = registry->category(*target, now);
      target = registry->walk(target, now, config_.walk_timeout);

      message::IntroductionRequest request;
      request.community_id = id;
      request.destination = target->address();
      request.source_lan = config_.lan_address;
      request.source_wan = config_.wan_address;
      request.connection_type = config_.connection_type;
      request.advice = true;
      request.identifier = next_identifier_++;
      if (next_identifier_ == 0)
        next_identifier_ = 1;

      message::SignedMessage msg = sign(request.serialize());
      outstanding_[{id, target->address()}] = request.identifier;
      send_(target->address(), msg);
      ++sent;

      LOG_WALK_TRACE("[{}] walked to {} {} (request {})", id,
                     target->is_bootstrap() ? "bootstrap"
                                            : CandidateCategoryAsString(category),
                     target->ToString(), request.identifier);
    } catch (const std::exception &e) {
      LOG_WALK_ERROR("[{}] walk step failed: {}", id, e.what());
    }
  }
  return sent;
}

std::optional<message::SignedMessage>
Walker::on_introduction_request(const std::string &community_id,
                                const crypto::ECKey &sender_key,
                                const message::SignedMessage &msg,
                                const Address &source) {
  auto registry = community(community_id);
  if (!registry) {
    LOG_WALK_DEBUG("Introduction request for unknown community {} from {}",
                   community_id, source.ToString());
    return std::nullopt;
  }

  crypto::SignatureCheck check = verify(sender_key, msg);
  if (check != crypto::SignatureCheck::kValid) {
    LOG_WALK_WARN("[{}] rejected introduction request from {}: signature {}",
                  community_id, source.ToString(), crypto::SignatureCheckName(check));
    return std::nullopt;
  }

  message::IntroductionRequest request;
  if (!request.deserialize(msg.payload.data(), msg.payload.size()) ||
      request.community_id != community_id) {
    LOG_WALK_WARN("[{}] malformed introduction request from {}", community_id,
                  source.ToString());
    return std::nullopt;
  }

  try {
    const double now = util::GetTimeSeconds();
    CandidatePtr requester = registry->create_candidate(
        source, false, request.source_lan, request.source_wan, request.connection_type);
    registry->filter_duplicate(requester);
    requester = registry->stumble(requester, now);

    CandidatePtr introduced =
        request.advice ? registry->introduce_candidate(requester) : nullptr;

    message::IntroductionResponse response;
    response.community_id = community_id;
    response.destination = source;
    response.source_lan = config_.lan_address;
    response.source_wan = config_.wan_address;
    response.connection_type = config_.connection_type;
    response.identifier = request.identifier;
    if (introduced) {
      response.lan_introduction = introduced->lan_address();
      response.wan_introduction = introduced->wan_address();
    }

    LOG_WALK_DEBUG("[{}] introduction request from {}, introducing {}", community_id,
                   requester->ToString(), introduced ? introduced->ToString() : "nobody");
    return sign(response.serialize());
  } catch (const std::exception &e) {
    LOG_WALK_ERROR("[{}] failed to answer introduction request from {}: {}",
                   community_id, source.ToString(), e.what());
    return std::nullopt;
  }
}

bool Walker::on_introduction_response(const std::string &community_id,
                                      const crypto::ECKey &sender_key,
                                      const message::SignedMessage &msg,
                                      const Address &source) {
  auto registry = community(community_id);
  if (!registry) {
    LOG_WALK_DEBUG("Introduction response for unknown community {} from {}",
                   community_id, source.ToString());
    return false;
  }

  crypto::SignatureCheck check = verify(sender_key, msg);
  if (check != crypto::SignatureCheck::kValid) {
    LOG_WALK_WARN("[{}] rejected introduction response from {}: signature {}",
                  community_id, source.ToString(), crypto::SignatureCheckName(check));
    return false;
  }

  message::IntroductionResponse response;
  if (!response.deserialize(msg.payload.data(), msg.payload.size()) ||
      response.community_id != community_id) {
    LOG_WALK_WARN("[{}] malformed introduction response from {}", community_id,
                  source.ToString());
    return false;
  }

  auto pending = outstanding_.find({community_id, source});
  if (pending == outstanding_.end() || pending->second != response.identifier) {
    LOG_WALK_DEBUG("[{}] unsolicited introduction response from {}", community_id,
                   source.ToString());
    return false;
  }
  outstanding_.erase(pending);

  try {
    const double now = util::GetTimeSeconds();
    CandidatePtr responder = registry->get(source);
    if (!responder || !responder->is_bootstrap()) {
      responder = registry->create_candidate(source, false, response.source_lan,
                                             response.source_wan,
                                             response.connection_type);
    }
    registry->walk_response(responder, now);

    if (response.has_introduction()) {
      // Behind the same NAT as us: only the LAN address is reachable
      const bool same_nat = !config_.wan_address.host.empty() &&
                            response.wan_introduction.host == config_.wan_address.host;
      Address target = same_nat ? response.lan_introduction : response.wan_introduction;
      if (target.empty()) {
        target = response.lan_introduction;
      }

      if (target != config_.lan_address && target != config_.wan_address &&
          !target.host.empty() && target.port != 0) {
        CandidatePtr introduced = registry->get(target);
        if (!introduced) {
          introduced = registry->create_candidate(target, false, response.lan_introduction,
                                                  response.wan_introduction,
                                                  ConnectionType::UNKNOWN);
        }
        registry->intro(introduced, now);
        LOG_WALK_DEBUG("[{}] {} introduced {}", community_id, responder->ToString(),
                       introduced->ToString());
      }
    }
    return true;
  } catch (const std::exception &e) {
    LOG_WALK_ERROR("[{}] failed to apply introduction response from {}: {}",
                   community_id, source.ToString(), e.what());
    return false;
  }
}

} // namespace network
} // namespace meshwalk

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Walker — periodic driver of the introduction protocol

 Every walk_interval, for each community:
   1. select_walk_candidate() (seeding bootstrap candidates if empty)
   2. walk() the target and send it a signed INTRODUCTION-REQUEST

 Incoming traffic (handed over by the transport layer):
   - INTRODUCTION-REQUEST: verify, register/refresh the requester, stumble
     it, and answer with a signed INTRODUCTION-RESPONSE naming
     introduce_candidate(requester), if any
   - INTRODUCTION-RESPONSE: verify, match it to our outstanding request,
     walk_response() the responder and intro() the introduced peer

 Signatures cover SHA-1 of the payload.

 Threading: single-threaded, runs on the io_context thread.
*/

#include "crypto/crypto.hpp"
#include "network/address.hpp"
#include "network/bootstrap_resolver.hpp"
#include "network/candidate_registry.hpp"
#include "network/message.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace meshwalk {
namespace network {

class Walker {
public:
  struct Config {
    std::chrono::milliseconds walk_interval{5000};
    double walk_timeout{protocol::DEFAULT_WALK_TIMEOUT};

    // Our own view of ourselves, reported in every message
    Address lan_address;
    Address wan_address;
    ConnectionType connection_type{ConnectionType::UNKNOWN};
    Config() noexcept;
  };

  // Hands a signed packet to the transport
  using SendFunction =
      std::function<void(const Address &destination, const message::SignedMessage &msg)>;

  // BOOTSTRAP may be null (no bootstrap seeding)
  Walker(boost::asio::io_context &io_context, const crypto::Crypto &crypto,
         crypto::KeyPtr key, BootstrapResolver *bootstrap, SendFunction send,
         const Config &config = Config{});
  ~Walker();

  Walker(const Walker &) = delete;
  Walker &operator=(const Walker &) = delete;

  void add_community(std::shared_ptr<CandidateRegistry> registry);
  bool remove_community(const std::string &community_id);
  std::shared_ptr<CandidateRegistry> community(const std::string &community_id) const;
  size_t community_count() const { return communities_.size(); }

  // Periodic stepping on the io_context (idempotent)
  void start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  /**
   * One walk in every community.
   * @return number of introduction requests sent
   */
  size_t take_step(double now);

  /**
   * Handle a request from SOURCE signed by SENDER_KEY.
   * @return signed response to send back to SOURCE, or std::nullopt if the
   *         request was rejected
   */
  std::optional<message::SignedMessage>
  on_introduction_request(const std::string &community_id,
                          const crypto::ECKey &sender_key,
                          const message::SignedMessage &msg, const Address &source);

  /**
   * Handle a response from SOURCE signed by SENDER_KEY.
   * @return true if the response matched an outstanding request and was applied
   */
  bool on_introduction_response(const std::string &community_id,
                                const crypto::ECKey &sender_key,
                                const message::SignedMessage &msg,
                                const Address &source);

  message::SignedMessage sign(const std::vector<uint8_t> &payload) const;
  crypto::SignatureCheck verify(const crypto::ECKey &key,
                                const message::SignedMessage &msg) const;

  const Config &config() const { return config_; }

private:
  void schedule_next_step();
  bool seed_bootstrap(CandidateRegistry &registry);

  boost::asio::io_context &io_context_;
  const crypto::Crypto &crypto_;
  crypto::KeyPtr key_;
  BootstrapResolver *bootstrap_;
  SendFunction send_;
  Config config_;

  std::map<std::string, std::shared_ptr<CandidateRegistry>> communities_;

  // Requests awaiting a response, keyed by (community, walk target)
  std::map<std::pair<std::string, Address>, uint16_t> outstanding_;
  uint16_t next_identifier_{1};

  std::unique_ptr<boost::asio::steady_timer> walk_timer_;
  std::atomic<bool> running_{false};

  // Expires with the walker; timer handlers hold a weak reference
  std::shared_ptr<void> lifetime_{std::make_shared<int>(0)};
};

inline Walker::Config::Config() noexcept = default;

} // namespace network
} // namespace meshwalk

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 BootstrapResolver — turns well-known bootstrap hostnames into candidates

 Purpose
 - Hold a fixed list of (hostname, port) seeds
 - Resolve them asynchronously; each success becomes a bootstrap Candidate
 - Retry on a timer until every seed is resolved
 - Persist resolutions (bootstrap.json) so a node can start without DNS

 Resolution rounds
 - resolve() looks up every still-unresolved seed concurrently through a
   HostLookup strategy. Lookups fail independently; the completion handler
   runs once, after the last lookup of the round, with true iff at least one
   seed is resolved (including earlier rounds)
 - Hostnames that resolve to the same IP and port share one Candidate, so an
   attacker has to subvert both seed domains to control bootstrapping

 Threading
 - All state is guarded by one mutex; every query returns a copy
 - Lookup callbacks may arrive on resolver threads
 - Completion handlers run without the lock held, possibly before resolve()
   returns when there is nothing to look up

 Lifetime
 - Created through Create(); pending timers and lookups hold a reference.
   Call stop() before releasing the resolver.
*/

#include "network/candidate.hpp"
#include "network/host_lookup.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meshwalk {
namespace network {

/**
 * Configured seed (hostname or IP literal, port)
 */
struct SeedAddress {
  std::string host;
  uint16_t port{0};

  bool operator==(const SeedAddress &other) const {
    return port == other.port && host == other.host;
  }
  bool operator<(const SeedAddress &other) const {
    if (host != other.host)
      return host < other.host;
    return port < other.port;
  }
};

class BootstrapResolver : public std::enable_shared_from_this<BootstrapResolver> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  struct Config {
    std::chrono::milliseconds lookup_timeout{10000};
    std::chrono::milliseconds retry_interval{300000};
    Config() noexcept;
  };

  using CompletionHandler = std::function<void(bool success)>;

  // LOOKUP defaults to AsioHostLookup on IO_CONTEXT
  static std::shared_ptr<BootstrapResolver>
  Create(boost::asio::io_context &io_context, std::vector<SeedAddress> addresses,
         std::shared_ptr<HostLookup> lookup = nullptr, const Config &config = Config{});

  BootstrapResolver(PrivateTag, boost::asio::io_context &io_context,
                    std::vector<SeedAddress> addresses,
                    std::shared_ptr<HostLookup> lookup, const Config &config);

  BootstrapResolver(const BootstrapResolver &) = delete;
  BootstrapResolver &operator=(const BootstrapResolver &) = delete;

  // Process-wide switch; when off no lookups are issued (used by tests and
  // --nobootstrap)
  static void SetEnabled(bool enabled);
  static bool IsEnabled();

  /**
   * Read "host port" lines. '#' comments and blank lines are skipped;
   * malformed lines are skipped with a warning. Unreadable file -> empty.
   */
  static std::vector<SeedAddress> LoadAddressesFromFile(const std::string &path);

  // Compiled-in seeds: dispersy{1..8} on tribler.org and st.tudelft.nl
  static std::vector<SeedAddress> GetDefaultAddresses();

  // Configured seeds, in configuration order
  std::vector<SeedAddress> addresses() const;

  bool are_resolved() const;

  // Snapshot of resolved candidates, one per distinct (ip, port)
  std::vector<CandidatePtr> candidates() const;

  // (resolved, total)
  std::pair<size_t, size_t> progress() const;

  // Per configured seed: its resolved address, or std::nullopt
  std::vector<std::pair<SeedAddress, std::optional<Address>>> resolutions() const;

  // Forget all resolutions; the seed list is unchanged
  void reset();

  void resolve(CompletionHandler on_complete);

  /**
   * Run one round to completion by driving the io_context on the calling
   * thread. Not for use from inside an io_context handler.
   */
  bool resolve_blocking();

  /**
   * Retry every INTERVAL until all seeds resolve; the next round is armed
   * only after the previous one completes. No-op if already running or if
   * resolution is disabled.
   */
  void resolve_until_success(std::chrono::milliseconds interval,
                             bool run_immediately = false);
  void resolve_until_success() {
    resolve_until_success(config_.retry_interval, false);
  }

  // Cancel the retry timer (idempotent); resolutions are kept
  void stop();

  bool is_retrying() const;

  // Persist resolutions as JSON (atomic write)
  bool save_cache(const std::string &path) const;

  // Install cached resolutions for configured seeds; returns count installed
  size_t load_cache(const std::string &path);

private:
  struct Round {
    size_t outstanding{0};
    CompletionHandler handler;
  };

  void on_lookup_done(const std::shared_ptr<Round> &round, const SeedAddress &seed,
                      std::optional<std::string> ip);

  // Requires mutex_ held
  bool any_resolved_locked() const;
  void install_locked(const SeedAddress &seed, const std::string &ip);
  void schedule_tick_locked(std::chrono::milliseconds delay);

  void on_tick();

  static std::atomic<bool> enabled_;

  boost::asio::io_context &io_context_;
  std::shared_ptr<HostLookup> lookup_;
  Config config_;

  mutable std::mutex mutex_;
  std::vector<SeedAddress> order_;
  std::map<SeedAddress, CandidatePtr> resolved_; // nullptr = unresolved

  boost::asio::steady_timer timer_;
  bool retrying_{false};
  std::chrono::milliseconds retry_interval_{0};
};

inline BootstrapResolver::Config::Config() noexcept = default;

} // namespace network
} // namespace meshwalk

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/bootstrap_resolver.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>

namespace meshwalk {
namespace network {

std::atomic<bool> BootstrapResolver::enabled_{true};

std::shared_ptr<BootstrapResolver>
BootstrapResolver::Create(boost::asio::io_context &io_context,
                          std::vector<SeedAddress> addresses,
                          std::shared_ptr<HostLookup> lookup, const Config &config) {
  if (!lookup) {
    lookup = std::make_shared<AsioHostLookup>(io_context, config.lookup_timeout);
  }
  return std::make_shared<BootstrapResolver>(PrivateTag{}, io_context,
                                             std::move(addresses),
                                             std::move(lookup), config);
}

BootstrapResolver::BootstrapResolver(PrivateTag, boost::asio::io_context &io_context,
                                     std::vector<SeedAddress> addresses,
                                     std::shared_ptr<HostLookup> lookup,
                                     const Config &config)
    : io_context_(io_context), lookup_(std::move(lookup)), config_(config),
      timer_(io_context) {
  for (auto &seed : addresses) {
    if (resolved_.emplace(seed, nullptr).second) {
      order_.push_back(std::move(seed));
    }
  }
}

void BootstrapResolver::SetEnabled(bool enabled) {
  enabled_.store(enabled, std::memory_order_release);
}

bool BootstrapResolver::IsEnabled() {
  return enabled_.load(std::memory_order_acquire);
}

std::vector<SeedAddress> BootstrapResolver::LoadAddressesFromFile(const std::string &path) {
  std::vector<SeedAddress> addresses;

  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_BOOT_DEBUG("No bootstrap file at {}", path);
    return addresses;
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    std::string trimmed = util::TrimWhitespace(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue;

    auto fields = util::SplitWhitespace(trimmed);
    if (fields.size() != 2) {
      LOG_BOOT_WARN("{}:{}: expected 'host port', skipping", path, line_number);
      continue;
    }
    if (!util::IsValidUtf8(fields[0]) || fields[0].size() > 255) {
      LOG_BOOT_WARN("{}:{}: invalid host name, skipping", path, line_number);
      continue;
    }
    auto port = util::SafeParsePort(fields[1]);
    if (!port) {
      LOG_BOOT_WARN("{}:{}: invalid port '{}', skipping", path, line_number, fields[1]);
      continue;
    }
    addresses.push_back(SeedAddress{fields[0], *port});
  }

  LOG_BOOT_DEBUG("Loaded {} bootstrap addresses from {}", addresses.size(), path);
  return addresses;
}

std::vector<SeedAddress> BootstrapResolver::GetDefaultAddresses() {
  // Some of these names point at the same machines; they resolve to a
  // single candidate each
  std::vector<SeedAddress> addresses;
  for (const char *domain : {"tribler.org", "st.tudelft.nl"}) {
    for (int i = 1; i <= 8; ++i) {
      addresses.push_back(SeedAddress{"dispersy" + std::to_string(i) + "." + domain,
                                      static_cast<uint16_t>(6420 + i)});
    }
  }
  return addresses;
}

std::vector<SeedAddress> BootstrapResolver::addresses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_;
}

bool BootstrapResolver::are_resolved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[seed, candidate] : resolved_) {
    if (!candidate)
      return false;
  }
  return true;
}

std::vector<CandidatePtr> BootstrapResolver::candidates() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CandidatePtr> result;
  std::set<const Candidate *> seen;
  for (const auto &seed : order_) {
    const CandidatePtr &candidate = resolved_.at(seed);
    if (candidate && seen.insert(candidate.get()).second) {
      result.push_back(candidate);
    }
  }
  return result;
}

std::pair<size_t, size_t> BootstrapResolver::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t resolved = 0;
  for (const auto &[seed, candidate] : resolved_) {
    if (candidate)
      ++resolved;
  }
  return {resolved, resolved_.size()};
}

std::vector<std::pair<SeedAddress, std::optional<Address>>>
BootstrapResolver::resolutions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<SeedAddress, std::optional<Address>>> result;
  result.reserve(order_.size());
  for (const auto &seed : order_) {
    const CandidatePtr &candidate = resolved_.at(seed);
    if (candidate) {
      result.emplace_back(seed, candidate->address());
    } else {
      result.emplace_back(seed, std::nullopt);
    }
  }
  return result;
}

void BootstrapResolver::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &[seed, candidate] : resolved_) {
    candidate.reset();
  }
}

bool BootstrapResolver::any_resolved_locked() const {
  for (const auto &[seed, candidate] : resolved_) {
    if (candidate)
      return true;
  }
  return false;
}

void BootstrapResolver::install_locked(const SeedAddress &seed, const std::string &ip) {
  Address address(ip, seed.port);
  for (const auto &[other_seed, candidate] : resolved_) {
    if (candidate && candidate->address() == address) {
      resolved_[seed] = candidate;
      return;
    }
  }
  resolved_[seed] = MakeBootstrapCandidate(address);
}

void BootstrapResolver::resolve(CompletionHandler on_complete) {
  if (!IsEnabled()) {
    LOG_BOOT_DEBUG("Bootstrap resolution disabled");
    if (on_complete)
      on_complete(false);
    return;
  }

  auto round = std::make_shared<Round>();
  round->handler = std::move(on_complete);

  std::vector<SeedAddress> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &seed : order_) {
      if (!resolved_[seed])
        pending.push_back(seed);
    }
    // Set before the first lookup: a lookup may complete synchronously
    round->outstanding = pending.size();
  }

  if (pending.empty()) {
    if (round->handler)
      round->handler(true);
    return;
  }

  LOG_BOOT_DEBUG("Resolving {} bootstrap addresses", pending.size());
  auto self = shared_from_this();
  for (const auto &seed : pending) {
    try {
      lookup_->lookup(seed.host, seed.port,
                      [self, round, seed](std::optional<std::string> ip) {
                        self->on_lookup_done(round, seed, std::move(ip));
                      });
    } catch (const std::exception &e) {
      LOG_BOOT_INFO("Lookup of {} failed to start: {}",
                    util::FormatHostPort(seed.host, seed.port), e.what());
      on_lookup_done(round, seed, std::nullopt);
    }
  }
}

void BootstrapResolver::on_lookup_done(const std::shared_ptr<Round> &round,
                                       const SeedAddress &seed,
                                       std::optional<std::string> ip) {
  bool finished = false;
  bool success = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = util::FormatHostPort(seed.host, seed.port);
    std::optional<std::string> normalized;
    if (ip) {
      normalized = util::ValidateAndNormalizeIP(*ip);
    }
    if (normalized) {
      install_locked(seed, *normalized);
      LOG_BOOT_DEBUG("Resolved {} into {}", name, resolved_[seed]->ToString());
    } else {
      LOG_BOOT_INFO("Could not resolve bootstrap candidate: {}", name);
    }

    if (round->outstanding > 0 && --round->outstanding == 0) {
      finished = true;
      success = any_resolved_locked();
    }
  }

  if (finished && round->handler) {
    round->handler(success);
  }
}

bool BootstrapResolver::resolve_blocking() {
  std::atomic<bool> done{false};
  bool result = false;
  resolve([&](bool success) {
    result = success;
    done.store(true, std::memory_order_release);
  });

  while (!done.load(std::memory_order_acquire)) {
    if (io_context_.stopped()) {
      io_context_.restart();
    }
    io_context_.run_one_for(std::chrono::milliseconds(100));
  }
  return result;
}

void BootstrapResolver::resolve_until_success(std::chrono::milliseconds interval,
                                              bool run_immediately) {
  if (!IsEnabled()) {
    LOG_BOOT_DEBUG("Bootstrap resolution disabled, not starting retry timer");
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (retrying_) {
    return;
  }
  retrying_ = true;
  retry_interval_ = interval;
  schedule_tick_locked(run_immediately ? std::chrono::milliseconds(0) : interval);
}

void BootstrapResolver::schedule_tick_locked(std::chrono::milliseconds delay) {
  timer_.expires_after(delay);
  timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec) {
    if (ec)
      return;
    self->on_tick();
  });
}

void BootstrapResolver::on_tick() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!retrying_) {
      return;
    }
    if (!IsEnabled()) {
      LOG_BOOT_DEBUG("Bootstrap resolution disabled, retry timer stopped");
      retrying_ = false;
      return;
    }
    bool all_resolved = true;
    for (const auto &[seed, candidate] : resolved_) {
      if (!candidate) {
        all_resolved = false;
        break;
      }
    }
    if (all_resolved) {
      LOG_BOOT_DEBUG("All bootstrap addresses resolved, retry timer stopped");
      retrying_ = false;
      return;
    }
  }

  LOG_BOOT_INFO("Resolving bootstrap addresses");
  auto self = shared_from_this();
  resolve([self](bool) {
    std::lock_guard<std::mutex> lock(self->mutex_);
    if (!self->retrying_)
      return;
    self->schedule_tick_locked(self->retry_interval_);
  });
}

void BootstrapResolver::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  retrying_ = false;
  (void)timer_.cancel();
}

bool BootstrapResolver::is_retrying() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retrying_;
}

bool BootstrapResolver::save_cache(const std::string &path) const {
  using json = nlohmann::json;

  try {
    json entries = json::array();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto &seed : order_) {
        const CandidatePtr &candidate = resolved_.at(seed);
        if (!candidate)
          continue;
        json entry;
        entry["host"] = seed.host;
        entry["port"] = seed.port;
        entry["ip"] = candidate->address().host;
        entries.push_back(entry);
      }
    }

    if (entries.empty()) {
      LOG_BOOT_DEBUG("No bootstrap resolutions to save");
      return true; // Not an error
    }

    json root;
    root["version"] = 1;
    root["entries"] = entries;

    if (!util::atomic_write_file(path, root.dump(2), 0644)) {
      LOG_BOOT_ERROR("Failed to save bootstrap cache to {}", path);
      return false;
    }

    LOG_BOOT_DEBUG("Saved {} bootstrap resolutions to {}", entries.size(), path);
    return true;

  } catch (const json::exception &e) {
    LOG_BOOT_ERROR("Exception during save_cache: {}", e.what());
    return false;
  }
}

size_t BootstrapResolver::load_cache(const std::string &path) {
  using json = nlohmann::json;

  auto data = util::read_file_string(path);
  if (!data) {
    LOG_BOOT_DEBUG("No bootstrap cache at {}", path);
    return 0;
  }

  json root;
  try {
    root = json::parse(*data);
  } catch (const json::parse_error &e) {
    LOG_BOOT_WARN("Failed to parse bootstrap cache {}: {}", path, e.what());
    return 0;
  }

  if (!root.is_object() || root.value("version", 0) != 1 || !root.contains("entries") ||
      !root["entries"].is_array()) {
    LOG_BOOT_WARN("Invalid bootstrap cache format/version in {}", path);
    return 0;
  }

  size_t installed = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : root["entries"]) {
    if (!entry.is_object() || !entry.contains("host") || !entry.contains("port") ||
        !entry.contains("ip")) {
      LOG_BOOT_WARN("Skipping malformed bootstrap cache entry");
      continue;
    }
    if (!entry["host"].is_string() || !entry["port"].is_number_unsigned() ||
        !entry["ip"].is_string()) {
      LOG_BOOT_WARN("Skipping bootstrap cache entry with invalid field types");
      continue;
    }
    uint64_t port = entry["port"].get<uint64_t>();
    if (port == 0 || port > 65535) {
      LOG_BOOT_WARN("Skipping bootstrap cache entry with invalid port");
      continue;
    }
    auto ip = util::ValidateAndNormalizeIP(entry["ip"].get<std::string>());
    if (!ip) {
      LOG_BOOT_WARN("Skipping bootstrap cache entry with invalid IP");
      continue;
    }

    SeedAddress seed{entry["host"].get<std::string>(), static_cast<uint16_t>(port)};
    auto it = resolved_.find(seed);
    if (it == resolved_.end() || it->second) {
      continue; // Not configured, or already resolved
    }
    install_locked(seed, *ip);
    ++installed;
  }

  LOG_BOOT_INFO("Loaded {} bootstrap resolutions from {}", installed, path);
  return installed;
}

} // namespace network
} // namespace meshwalk

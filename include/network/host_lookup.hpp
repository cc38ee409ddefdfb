// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace meshwalk {
namespace network {

/**
 * HostLookup - name resolution strategy used by BootstrapResolver
 *
 * lookup() must invoke CALLBACK exactly once, with a normalized IP literal
 * or std::nullopt on failure. The callback may run on any thread, and may
 * run before lookup() returns.
 */
class HostLookup {
public:
  using Callback = std::function<void(std::optional<std::string> ip)>;

  virtual ~HostLookup() = default;
  virtual void lookup(const std::string &host, uint16_t port, Callback callback) = 0;
};

/**
 * DNS lookup through boost::asio's resolver, bounded by a timeout.
 * IPv4 results are preferred.
 */
class AsioHostLookup : public HostLookup {
public:
  AsioHostLookup(boost::asio::io_context &io_context,
                 std::chrono::milliseconds timeout);

  void lookup(const std::string &host, uint16_t port, Callback callback) override;

private:
  boost::asio::io_context &io_context_;
  std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace meshwalk

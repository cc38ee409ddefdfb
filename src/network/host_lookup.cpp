// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/host_lookup.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <atomic>
#include <memory>

namespace meshwalk {
namespace network {

namespace {

// One in-flight lookup; whichever of resolve/timeout finishes first wins
struct PendingLookup {
  explicit PendingLookup(boost::asio::io_context &io)
      : resolver(io), timer(io) {}

  boost::asio::ip::udp::resolver resolver;
  boost::asio::steady_timer timer;
  std::atomic<bool> done{false};
  HostLookup::Callback callback;

  void finish(std::optional<std::string> ip) {
    if (done.exchange(true))
      return;
    (void)timer.cancel();
    resolver.cancel();
    callback(std::move(ip));
  }
};

} // anonymous namespace

AsioHostLookup::AsioHostLookup(boost::asio::io_context &io_context,
                               std::chrono::milliseconds timeout)
    : io_context_(io_context), timeout_(timeout) {}

void AsioHostLookup::lookup(const std::string &host, uint16_t port,
                            Callback callback) {
  auto pending = std::make_shared<PendingLookup>(io_context_);
  pending->callback = std::move(callback);

  pending->timer.expires_after(timeout_);
  pending->timer.async_wait([pending, host](const boost::system::error_code &ec) {
    if (ec)
      return;
    LOG_BOOT_DEBUG("DNS lookup for {} timed out", host);
    pending->finish(std::nullopt);
  });

  pending->resolver.async_resolve(
      host, std::to_string(port),
      [pending, host](const boost::system::error_code &ec,
                      boost::asio::ip::udp::resolver::results_type results) {
        if (ec) {
          LOG_BOOT_DEBUG("DNS lookup for {} failed: {}", host, ec.message());
          pending->finish(std::nullopt);
          return;
        }

        std::optional<std::string> chosen;
        for (const auto &entry : results) {
          auto ip = util::ValidateAndNormalizeIP(entry.endpoint().address().to_string());
          if (!ip)
            continue;
          if (entry.endpoint().address().is_v4()) {
            chosen = ip;
            break;
          }
          if (!chosen)
            chosen = ip;
        }
        pending->finish(std::move(chosen));
      });
}

} // namespace network
} // namespace meshwalk

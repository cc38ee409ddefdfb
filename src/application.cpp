// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "crypto/digest.hpp"
#include "network/bootstrap_resolver.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <nlohmann/json.hpp>

namespace meshwalk {
namespace app {

Application::Application(const ToolConfig &config, std::ostream &out, std::ostream &err)
    : config_(config), out_(out), err_(err) {}

const std::vector<std::string> &Application::Commands() {
  static const std::vector<std::string> commands = {"curves", "keygen", "pubkey",
                                                    "sign",   "verify", "resolve"};
  return commands;
}

int Application::run() {
  try {
    if (config_.command == "curves")
      return cmd_curves();
    if (config_.command == "keygen")
      return cmd_keygen();
    if (config_.command == "pubkey")
      return cmd_pubkey();
    if (config_.command == "sign")
      return cmd_sign();
    if (config_.command == "verify")
      return cmd_verify();
    if (config_.command == "resolve")
      return cmd_resolve();

    err_ << "Unknown command: " << config_.command << std::endl;
    return 1;
  } catch (const crypto::UnsupportedCurve &e) {
    err_ << "Error: " << e.what() << " (see 'meshwalk curves')" << std::endl;
    return 1;
  } catch (const std::exception &e) {
    LOG_APP_ERROR("{} failed: {}", config_.command, e.what());
    err_ << "Error: " << e.what() << std::endl;
    return 1;
  }
}

bool Application::require_params(size_t count, const char *usage) {
  if (config_.params.size() != count) {
    err_ << "Usage: meshwalk " << usage << std::endl;
    return false;
  }
  return true;
}

crypto::KeyPtr Application::load_key(bool allow_public) {
  if (config_.key_file.empty()) {
    throw std::runtime_error("--key=<file> is required");
  }
  auto pem = util::read_file_string(config_.key_file);
  if (!pem) {
    throw std::runtime_error("cannot read key file " + config_.key_file);
  }
  if (allow_public && crypto_.is_valid_public_pem(*pem)) {
    return crypto_.key_from_public_pem(*pem);
  }
  return crypto_.key_from_private_pem(*pem);
}

int Application::cmd_curves() {
  for (const auto &level : crypto_.security_levels()) {
    out_ << level << "\n";
  }
  out_ << std::flush;
  return 0;
}

int Application::cmd_keygen() {
  if (!require_params(0, "keygen [--level=<level>] [--out=<file>]"))
    return 1;

  crypto::KeyPtr key = crypto_.generate_key(config_.level);
  const std::string pem = crypto_.key_to_pem(*key);
  LOG_APP_INFO("Generated {} key on {}", key->security_level(), key->curve_name());

  if (config_.out_file.empty()) {
    out_ << pem << std::flush;
    return 0;
  }
  if (!util::atomic_write_file(config_.out_file, pem, 0600)) {
    err_ << "Error: cannot write " << config_.out_file << std::endl;
    return 1;
  }
  out_ << "Wrote " << key->security_level() << " key to " << config_.out_file
       << std::endl;
  return 0;
}

int Application::cmd_pubkey() {
  if (!require_params(0, "pubkey --key=<file>"))
    return 1;
  crypto::KeyPtr key = load_key(true);
  out_ << crypto_.key_to_pem(*crypto_.key_to_public(*key)) << std::flush;
  return 0;
}

int Application::cmd_sign() {
  if (!require_params(1, "sign --key=<file> <message>"))
    return 1;
  crypto::KeyPtr key = load_key(false);
  crypto::Bytes signature =
      crypto_.create_signature(*key, crypto::Sha1Digest(config_.params[0]));
  out_ << util::HexStr(signature) << std::endl;
  return 0;
}

int Application::cmd_verify() {
  if (!require_params(2, "verify --key=<file> <message> <hex-signature>"))
    return 1;
  crypto::KeyPtr key = load_key(true);

  auto signature = util::ParseHex(config_.params[1]);
  if (!signature) {
    err_ << "Error: signature is not valid hex" << std::endl;
    return 1;
  }

  crypto::SignatureCheck check =
      crypto_.verify_signature(*key, crypto::Sha1Digest(config_.params[0]), *signature);
  if (check == crypto::SignatureCheck::kValid) {
    out_ << "valid" << std::endl;
    return 0;
  }
  out_ << "invalid (" << crypto::SignatureCheckName(check) << ")" << std::endl;
  return 1;
}

int Application::cmd_resolve() {
  if (!require_params(0, "resolve [--bootstrap-file=<file>] [--json] [--timeout=<s>]"))
    return 1;

  std::vector<network::SeedAddress> seeds =
      config_.bootstrap_file.empty()
          ? network::BootstrapResolver::GetDefaultAddresses()
          : network::BootstrapResolver::LoadAddressesFromFile(config_.bootstrap_file);

  network::BootstrapResolver::Config resolver_config;
  resolver_config.lookup_timeout = std::chrono::milliseconds(
      static_cast<int64_t>(config_.timeout_seconds * 1000.0));

  boost::asio::io_context io_context;
  auto resolver = network::BootstrapResolver::Create(io_context, seeds, nullptr,
                                                     resolver_config);

  const std::string cache_path = (config_.datadir / "bootstrap.json").string();
  size_t cached = resolver->load_cache(cache_path);
  if (cached > 0) {
    LOG_APP_INFO("Loaded {} cached bootstrap resolutions", cached);
  }

  bool success = resolver->resolve_blocking();
  if (success && !resolver->save_cache(cache_path)) {
    LOG_APP_ERROR("Failed to write bootstrap cache {}", cache_path);
  }

  auto [resolved, total] = resolver->progress();
  auto resolutions = resolver->resolutions();

  if (config_.json) {
    nlohmann::json result;
    result["resolved"] = resolved;
    result["total"] = total;
    result["candidates"] = resolver->candidates().size();
    result["seeds"] = nlohmann::json::array();
    for (const auto &[seed, address] : resolutions) {
      nlohmann::json entry;
      entry["host"] = seed.host;
      entry["port"] = seed.port;
      if (address) {
        entry["address"] = address->ToString();
      } else {
        entry["address"] = nullptr;
      }
      result["seeds"].push_back(std::move(entry));
    }
    out_ << result.dump(2) << std::endl;
  } else {
    for (const auto &[seed, address] : resolutions) {
      out_ << util::FormatHostPort(seed.host, seed.port) << " -> "
           << (address ? address->ToString() : "unresolved") << "\n";
    }
    out_ << resolved << "/" << total << " resolved" << std::endl;
  }

  return resolved > 0 || total == 0 ? 0 : 1;
}

} // namespace app
} // namespace meshwalk

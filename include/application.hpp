// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/ec_crypto.hpp"
#include "util/files.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace meshwalk {
namespace app {

// Tool configuration (filled in by main from the command line)
struct ToolConfig {
  // Data directory (debug.log, bootstrap.json)
  std::filesystem::path datadir;

  // Command and its positional parameters
  std::string command;
  std::vector<std::string> params;

  // keygen
  std::string level = "medium";
  std::string out_file;

  // pubkey / sign / verify
  std::string key_file;

  // resolve
  std::string bootstrap_file;
  bool json = false;
  double timeout_seconds = 10.0;

  ToolConfig() : datadir(util::get_default_datadir()) {}
};

// Application - runs one command of the meshwalk tool
// Normal output goes to OUT, diagnostics to ERR; run() returns the exit code
class Application {
public:
  explicit Application(const ToolConfig &config, std::ostream &out = std::cout,
                       std::ostream &err = std::cerr);

  int run();

  static const std::vector<std::string> &Commands();

private:
  int cmd_curves();
  int cmd_keygen();
  int cmd_pubkey();
  int cmd_sign();
  int cmd_verify();
  int cmd_resolve();

  // Reads --key; accepts a private or (when ALLOW_PUBLIC) a public PEM
  crypto::KeyPtr load_key(bool allow_public);

  bool require_params(size_t count, const char *usage);

  ToolConfig config_;
  std::ostream &out_;
  std::ostream &err_;
  crypto::ECCrypto crypto_;
};

} // namespace app
} // namespace meshwalk

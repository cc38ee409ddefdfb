// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "network/bootstrap_resolver.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <command> [arguments]\n"
      << "\n"
      << "Commands:\n"
      << "  curves                          List supported security levels\n"
      << "  keygen [--level=<l>] [--out=<f>]\n"
      << "                                  Generate a key (default level: medium)\n"
      << "  pubkey --key=<file>             Print the public key of a PEM key file\n"
      << "  sign --key=<file> <message>     Sign SHA-1(message), print hex signature\n"
      << "  verify --key=<file> <message> <hex-signature>\n"
      << "                                  Exit 0 if the signature is valid\n"
      << "  resolve [--bootstrap-file=<f>] [--json] [--timeout=<s>]\n"
      << "                                  Resolve the bootstrap seeds\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.meshwalk)\n"
      << "  --nobootstrap        Disable bootstrap DNS lookups\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, bootstrap, walker, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=bootstrap,crypto\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    meshwalk::app::ToolConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << meshwalk::GetFullVersionString() << std::endl;
        std::cout << meshwalk::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg == "--nobootstrap") {
        meshwalk::network::BootstrapResolver::SetEnabled(false);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=bootstrap,crypto
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.find("--level=") == 0) {
        config.level = arg.substr(8);
      } else if (arg.find("--out=") == 0) {
        config.out_file = arg.substr(6);
      } else if (arg.find("--key=") == 0) {
        config.key_file = arg.substr(6);
      } else if (arg.find("--bootstrap-file=") == 0) {
        config.bootstrap_file = arg.substr(17);
      } else if (arg == "--json") {
        config.json = true;
      } else if (arg.find("--timeout=") == 0) {
        auto timeout_opt = meshwalk::util::SafeParseDouble(arg.substr(10), 0.1, 300.0);
        if (!timeout_opt) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 0.1 and 300" << std::endl;
          return 1;
        }
        config.timeout_seconds = *timeout_opt;
      } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      } else if (config.command.empty()) {
        config.command = arg;
      } else {
        config.params.push_back(arg);
      }
    }

    const auto &commands = meshwalk::app::Application::Commands();
    if (config.command.empty() ||
        std::find(commands.begin(), commands.end(), config.command) == commands.end()) {
      if (!config.command.empty()) {
        std::cerr << "Unknown command: " << config.command << std::endl;
      }
      print_usage(argv[0]);
      return 1;
    }

    // Ensure datadir exists before initializing file logger
    if (!meshwalk::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory " << config.datadir << std::endl;
      return 1;
    }
    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    meshwalk::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        meshwalk::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        meshwalk::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        meshwalk::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;
    {
      meshwalk::app::Application app(config);
      exit_code = app.run();
    }

    // Shutdown logging AFTER app is fully destroyed
    meshwalk::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    meshwalk::util::LogManager::Shutdown();
    return 1;
  }
}

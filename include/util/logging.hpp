// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace meshwalk {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component, all sharing the same sinks. Components:
 *   default, network, bootstrap, walker, crypto, app
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "meshwalk.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "bootstrap", "crypto")
   *
   * Auto-initializes if not initialized. Unknown names get the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (see Components())
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  // Names of all component loggers
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace meshwalk

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  meshwalk::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  meshwalk::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  meshwalk::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  meshwalk::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  meshwalk::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  meshwalk::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  meshwalk::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  meshwalk::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  meshwalk::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  meshwalk::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_BOOT_TRACE(...)                                                    \
  meshwalk::util::LogManager::GetLogger("bootstrap")->trace(__VA_ARGS__)
#define LOG_BOOT_DEBUG(...)                                                    \
  meshwalk::util::LogManager::GetLogger("bootstrap")->debug(__VA_ARGS__)
#define LOG_BOOT_INFO(...)                                                     \
  meshwalk::util::LogManager::GetLogger("bootstrap")->info(__VA_ARGS__)
#define LOG_BOOT_WARN(...)                                                     \
  meshwalk::util::LogManager::GetLogger("bootstrap")->warn(__VA_ARGS__)
#define LOG_BOOT_ERROR(...)                                                    \
  meshwalk::util::LogManager::GetLogger("bootstrap")->error(__VA_ARGS__)

#define LOG_WALK_TRACE(...)                                                    \
  meshwalk::util::LogManager::GetLogger("walker")->trace(__VA_ARGS__)
#define LOG_WALK_DEBUG(...)                                                    \
  meshwalk::util::LogManager::GetLogger("walker")->debug(__VA_ARGS__)
#define LOG_WALK_INFO(...)                                                     \
  meshwalk::util::LogManager::GetLogger("walker")->info(__VA_ARGS__)
#define LOG_WALK_WARN(...)                                                     \
  meshwalk::util::LogManager::GetLogger("walker")->warn(__VA_ARGS__)
#define LOG_WALK_ERROR(...)                                                    \
  meshwalk::util::LogManager::GetLogger("walker")->error(__VA_ARGS__)

#define LOG_CRYPTO_DEBUG(...)                                                  \
  meshwalk::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_INFO(...)                                                   \
  meshwalk::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_WARN(...)                                                   \
  meshwalk::util::LogManager::GetLogger("crypto")->warn(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  meshwalk::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  meshwalk::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  meshwalk::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace meshwalk {
namespace util {

/**
 * Atomic file operations for crash-safe persistence (key files, bootstrap
 * cache)
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file
 * 3. fsync() the directory so the rename is durable
 * 4. Atomic rename over original file
 *
 * Either the old or the new file is always intact.
 */

/**
 * Write string to file atomically with the given permissions
 * (0600 for private keys, 0644 otherwise)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file cannot be read or exceeds 16MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: $HOME/.meshwalk (./.meshwalk without HOME)
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace meshwalk

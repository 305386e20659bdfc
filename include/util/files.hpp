#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace floodchain {
namespace util {

/**
 * Atomic file write for crash-safe persistence
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file and its directory
 * 3. Atomic rename over original file
 *
 * Either the old file or the new file is always intact.
 * Returns true on success, false on failure.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

/**
 * Read entire file into string
 * Returns std::nullopt if the file is missing, unreadable or larger than 100MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the application
 * Returns ~/.floodchain on Unix
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace floodchain

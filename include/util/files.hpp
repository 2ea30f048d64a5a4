// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace offsync {
namespace util {

/**
 * Crash-safe file persistence
 *
 * Both the change log and the offline queue are rewritten in full on every
 * mutation. atomic_write_file guarantees a reader sees either the previous
 * document or the new one, never a torn write:
 * 1. Write to a temporary sibling (.tmp.<random>)
 * 2. fsync() the temporary file
 * 3. fsync() the parent directory
 * 4. rename() over the target
 */

/**
 * Write string to file atomically
 * @param mode File permissions for a newly created file (default 0644)
 * Returns true on success, false on failure (the target is left untouched)
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file is missing, unreadable or larger than 100MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Move an unreadable file out of the way as "<name>.corrupt.<millis>"
 * Returns the new path, or std::nullopt if the rename failed
 */
std::optional<std::filesystem::path> quarantine_file(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Default data directory: $HOME/.offsync, or ./.offsync without HOME
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace offsync

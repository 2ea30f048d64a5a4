// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace offsync {
namespace util {

namespace fs = std::filesystem;

/**
 * Exclusive advisory lock on a file (fcntl F_SETLK)
 *
 * The lock is held for the lifetime of the object; closing the descriptor
 * releases it.
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  explicit FileLock(const fs::path &file);
  ~FileLock();

  /**
   * Try to acquire an exclusive lock without blocking
   * @return true if lock acquired, false otherwise (see GetReason())
   */
  bool TryLock();

  bool IsOpen() const { return fd_ != -1; }
  const std::string &GetReason() const { return reason_; }

private:
  std::string reason_;
  int fd_{-1};
};

/**
 * Result of directory lock attempt
 */
enum class LockResult {
  Success,    // Lock acquired (or already held by this process)
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock already held by another process
};

/**
 * Lock a data directory so a second offsyncd cannot share its queue file
 *
 * Creates <directory>/<lockfile_name> and holds an exclusive lock on it
 * until UnlockDirectory() or ReleaseAllDirectoryLocks().
 */
LockResult LockDirectory(const fs::path &directory,
                         const std::string &lockfile_name = ".lock");

/**
 * Release a directory lock taken by LockDirectory()
 */
void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name = ".lock");

/**
 * Release all directory locks (shutdown cleanup)
 */
void ReleaseAllDirectoryLocks();

} // namespace util
} // namespace offsync

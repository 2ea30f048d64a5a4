// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"
#include <stdexcept>
#include <string>

namespace offsync {
namespace sync {

/**
 * Thrown by ChangeLog implementations when local storage cannot be read or
 * written. A failed mutation leaves the previous state intact.
 */
class ChangeLogError : public std::runtime_error {
public:
  explicit ChangeLogError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * Local change log consumed by the sync client
 *
 * Allows dependency injection of different storage engines:
 * - FileChangeLog: JSON document in the data directory
 * - MemoryChangeLog: in-process store for tests (in test/infra)
 *
 * All methods may throw ChangeLogError.
 */
class ChangeLog {
public:
  virtual ~ChangeLog() = default;

  // Local creates/updates/deletes not yet acknowledged by the server
  virtual ChangeSetMap CollectLocalChanges() = 0;

  // Apply a pulled change set as one transaction (all or nothing)
  virtual void ApplyRemoteChanges(const ChangeSetMap &changes) = 0;

  // Mark the pushed changes as acknowledged. Records edited again since
  // CollectLocalChanges() stay dirty.
  virtual void MarkLocalChangesPushed(const ChangeSetMap &pushed) = 0;

  virtual SyncCursor GetLastPulledAt() = 0;
  virtual void SetLastPulledAt(int64_t cursor) = 0;

  // Number of records with unacknowledged local changes
  virtual size_t CountPendingChanges() = 0;
};

} // namespace sync
} // namespace offsync

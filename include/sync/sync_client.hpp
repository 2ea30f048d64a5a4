// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "sync/change_log.hpp"
#include "sync/transport.hpp"
#include "sync/types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace offsync {
namespace sync {

/**
 * SyncClient - executes one pull-then-push round
 *
 * Round structure:
 * 1. Read the cursor from the change log
 * 2. Pull remote changes since the cursor and apply them transactionally;
 *    the returned cursor is persisted only after the apply succeeded
 * 3. Push unacknowledged local changes together with that same cursor
 *
 * Pull failures degrade gracefully: the round continues with no remote
 * changes and the unchanged cursor (outcome PartialPullFailure). The one
 * exception is Unauthorized, which fails the round with AuthFailure.
 * Push failures fail the round; local changes stay unacknowledged.
 *
 * Not thread-safe for concurrent rounds; the scheduler guarantees at most one
 * round at a time.
 */
class SyncClient {
public:
  struct Config {
    // Page the first-ever pull through /api/sync/pull/batched
    bool batched_initial_pull{true};
    size_t batch_size{500};
    int max_batches{20};
  };

  /**
   * Names work revealed by pulled changes (e.g. "import contacts for this
   * new account"). Returned jobs travel in SyncRound::deferred_jobs.
   */
  using DeferredWorkHook = std::function<std::vector<queue::JobRequest>(const ChangeSetMap &pulled)>;

  struct PullResult {
    ChangeSetMap changes;
    SyncCursor cursor;  // New cursor on success, the input cursor on failure
    std::optional<SyncError> error;
  };

  SyncClient(ChangeLog &change_log, SyncTransport &transport);
  SyncClient(ChangeLog &change_log, SyncTransport &transport, const Config &config);

  /**
   * Run one complete round. Never throws.
   */
  SyncRound RunSyncRound();

  /**
   * Fetch remote changes since `cursor`. Never throws: failures are reported
   * in PullResult::error with empty changes and the same cursor.
   */
  PullResult Pull(SyncCursor cursor);

  /**
   * Send local changes. `cursor` must be the one this round's pull returned.
   * @return std::nullopt on acknowledgement, otherwise the failure
   */
  std::optional<SyncError> Push(const ChangeSetMap &changes, int64_t cursor);

  void SetDeferredWorkHook(DeferredWorkHook hook);

private:
  PullResponse PullBatched(SyncCursor cursor);

  ChangeLog &change_log_;
  SyncTransport &transport_;
  const Config config_;

  std::mutex hook_mutex_;
  DeferredWorkHook deferred_work_hook_;
};

} // namespace sync
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/sync_client.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace offsync {
namespace sync {

namespace {

std::string CursorToString(SyncCursor cursor) {
  return cursor ? std::to_string(*cursor) : std::string("null");
}

void AppendChanges(ChangeSetMap &into, const ChangeSetMap &page, bool take_deleted) {
  for (const auto &[collection, set] : page) {
    ChangeSet &target = into[collection];
    target.created.insert(target.created.end(), set.created.begin(), set.created.end());
    target.updated.insert(target.updated.end(), set.updated.begin(), set.updated.end());
    if (take_deleted) {
      target.deleted.insert(target.deleted.end(), set.deleted.begin(), set.deleted.end());
    }
  }
}

SyncError StorageError(const std::exception &e) {
  return SyncError{SyncErrorKind::LocalStorage, 0, e.what()};
}

} // namespace

SyncClient::SyncClient(ChangeLog &change_log, SyncTransport &transport)
    : SyncClient(change_log, transport, Config{}) {}

SyncClient::SyncClient(ChangeLog &change_log, SyncTransport &transport, const Config &config)
    : change_log_(change_log), transport_(transport), config_(config) {}

void SyncClient::SetDeferredWorkHook(DeferredWorkHook hook) {
  std::lock_guard<std::mutex> lock(hook_mutex_);
  deferred_work_hook_ = std::move(hook);
}

PullResponse SyncClient::PullBatched(SyncCursor cursor) {
  PullPage page;
  page.batch_size = config_.batch_size;

  PullResponse merged;
  for (int batch = 1; batch <= config_.max_batches; ++batch) {
    PullResponse response = transport_.PullBatch(cursor, page);
    LOG_SYNC_DEBUG("Batch {}: {} changes, has_more={}", batch, CountChanges(response.changes),
                   response.has_more);

    // Deletions are complete in the first page
    AppendChanges(merged.changes, response.changes, batch == 1);

    // Records modified while paging carry a later timestamp; keep the
    // earliest so the next pull picks them up again
    merged.timestamp = batch == 1 ? response.timestamp
                                  : std::min(merged.timestamp, response.timestamp);

    if (!response.has_more) {
      return merged;
    }
    page.skip = response.next_skip;
  }

  LOG_SYNC_WARN("Batched pull stopped after {} batches with more data pending",
                config_.max_batches);
  return merged;
}

SyncClient::PullResult SyncClient::Pull(SyncCursor cursor) {
  PullResult result;
  result.cursor = cursor;

  try {
    PullResponse response = (!cursor && config_.batched_initial_pull) ? PullBatched(cursor)
                                                                      : transport_.Pull(cursor);
    result.changes = std::move(response.changes);
    result.cursor = response.timestamp;
    LOG_SYNC_DEBUG("Pulled {} changes (cursor {} -> {})", CountChanges(result.changes),
                   CursorToString(cursor), response.timestamp);
  } catch (const TransportError &e) {
    LOG_SYNC_WARN("Pull failed ({}): {}", SyncErrorKindName(e.kind()), e.what());
    result.error = e.ToSyncError();
  } catch (const std::exception &e) {
    LOG_SYNC_WARN("Pull failed: {}", e.what());
    result.error = SyncError{SyncErrorKind::TransientNetwork, 0, e.what()};
  }

  if (result.error) {
    result.changes.clear();
    result.cursor = cursor;
  }
  return result;
}

std::optional<SyncError> SyncClient::Push(const ChangeSetMap &changes, int64_t cursor) {
  try {
    transport_.Push(changes, cursor);
    LOG_SYNC_DEBUG("Pushed {} changes (cursor {})", CountChanges(changes), cursor);
    return std::nullopt;
  } catch (const TransportError &e) {
    LOG_SYNC_WARN("Push failed ({}): {}", SyncErrorKindName(e.kind()), e.what());
    return e.ToSyncError();
  } catch (const std::exception &e) {
    LOG_SYNC_WARN("Push failed: {}", e.what());
    return SyncError{SyncErrorKind::TransientNetwork, 0, e.what()};
  }
}

SyncRound SyncClient::RunSyncRound() {
  SyncRound round;
  round.started_at = util::GetTimeMillis();

  auto finish = [&round](SyncOutcome outcome) {
    round.outcome = outcome;
    round.finished_at = util::GetTimeMillis();
    LOG_SYNC_INFO("Sync round finished: {} (pulled {}, pushed {}, {}ms)",
                  SyncOutcomeName(outcome), CountChanges(round.pulled),
                  CountChanges(round.pushed), round.finished_at - round.started_at);
    return round;
  };

  try {
    round.cursor_used = change_log_.GetLastPulledAt();
  } catch (const std::exception &e) {
    round.error = StorageError(e);
    return finish(SyncOutcome::StorageFailure);
  }

  // Pull
  PullResult pull = Pull(round.cursor_used);
  if (pull.error && pull.error->kind == SyncErrorKind::Unauthorized) {
    round.cursor_returned = round.cursor_used;
    round.error = pull.error;
    return finish(SyncOutcome::AuthFailure);
  }

  if (!pull.error) {
    try {
      change_log_.ApplyRemoteChanges(pull.changes);
      change_log_.SetLastPulledAt(*pull.cursor);
    } catch (const std::exception &e) {
      LOG_SYNC_ERROR("Failed to apply pulled changes: {}", e.what());
      round.cursor_returned = round.cursor_used;
      round.error = StorageError(e);
      return finish(SyncOutcome::StorageFailure);
    }
    round.pulled = std::move(pull.changes);
  }
  round.cursor_returned = pull.cursor;

  if (HasChanges(round.pulled)) {
    DeferredWorkHook hook;
    {
      std::lock_guard<std::mutex> lock(hook_mutex_);
      hook = deferred_work_hook_;
    }
    if (hook) {
      try {
        round.deferred_jobs = hook(round.pulled);
      } catch (const std::exception &e) {
        LOG_SYNC_ERROR("Deferred work hook threw: {}", e.what());
      }
    }
  }

  const SyncOutcome pulled_outcome =
      pull.error ? SyncOutcome::PartialPullFailure : SyncOutcome::Success;
  if (pull.error) {
    round.error = pull.error;
  }

  // Push
  ChangeSetMap local;
  try {
    local = change_log_.CollectLocalChanges();
  } catch (const std::exception &e) {
    round.error = StorageError(e);
    return finish(SyncOutcome::StorageFailure);
  }

  if (!HasChanges(local)) {
    round.local_changes_acknowledged = true;
    return finish(pulled_outcome);
  }

  if (!round.cursor_returned) {
    // The server has acknowledged no pulled state yet
    LOG_SYNC_INFO("Skipping push of {} changes: no cursor yet", CountChanges(local));
    return finish(pulled_outcome);
  }

  round.push_attempted = true;
  if (auto push_error = Push(local, *round.cursor_returned)) {
    round.error = push_error;
    return finish(push_error->kind == SyncErrorKind::Unauthorized ? SyncOutcome::AuthFailure
                                                                  : SyncOutcome::PushFailure);
  }

  try {
    change_log_.MarkLocalChangesPushed(local);
  } catch (const std::exception &e) {
    // The server has the changes; an idempotent re-push next round is harmless
    round.error = StorageError(e);
    return finish(SyncOutcome::StorageFailure);
  }

  round.pushed = std::move(local);
  round.local_changes_acknowledged = true;
  return finish(pulled_outcome);
}

} // namespace sync
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "queue/offline_job.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace offsync {
namespace sync {

// A record is a JSON object carrying a string "id"
using Record = nlohmann::json;
using RecordId = std::string;

/**
 * Server-issued watermark (ms since epoch) of how much remote history the
 * client has consumed. std::nullopt only before the first successful pull.
 */
using SyncCursor = std::optional<int64_t>;

/**
 * Changes to one collection in one round
 *
 * A record id appears in at most one of the three buckets.
 */
struct ChangeSet {
  std::vector<Record> created;
  std::vector<Record> updated;
  std::vector<RecordId> deleted;

  bool empty() const { return created.empty() && updated.empty() && deleted.empty(); }
  size_t size() const { return created.size() + updated.size() + deleted.size(); }
};

// Collection name -> changes
using ChangeSetMap = std::map<std::string, ChangeSet>;

size_t CountChanges(const ChangeSetMap &changes);
bool HasChanges(const ChangeSetMap &changes);

// Returns the record's "id" if it is a non-empty string
std::optional<RecordId> RecordIdOf(const Record &record);

/**
 * Wire encoding: {"<collection>": {"created": [...], "updated": [...], "deleted": [...]}}
 * ChangeSetMapFromJson throws std::invalid_argument on a malformed document.
 */
nlohmann::json ChangeSetMapToJson(const ChangeSetMap &changes);
ChangeSetMap ChangeSetMapFromJson(const nlohmann::json &j);

enum class SyncErrorKind {
  TransientNetwork,  // Retried per backoff
  ServerRejected,    // Terminal once attempts are exhausted
  Unauthorized,      // Never retried
  LocalStorage,      // Fails the current round or job only
};

const char *SyncErrorKindName(SyncErrorKind kind);

struct SyncError {
  SyncErrorKind kind{SyncErrorKind::TransientNetwork};
  int http_status{0};  // 0 when no HTTP response was received
  std::string message;
};

enum class SyncOutcome {
  Success,
  PartialPullFailure,  // Pull degraded to "no changes"; push still attempted
  PushFailure,
  AuthFailure,
  StorageFailure,
};

const char *SyncOutcomeName(SyncOutcome outcome);

/**
 * What caused a round or drain to start
 */
enum class SyncTrigger {
  Foreground,
  NetworkReachable,
  Periodic,
  Manual,
  LocalChange,
  Retry,
  QueueRetry,
  JobEnqueued,
};

const char *SyncTriggerName(SyncTrigger trigger);

/**
 * Result of one pull-then-push exchange. Logged, never persisted.
 */
struct SyncRound {
  SyncCursor cursor_used;      // Read from the change log before the pull
  SyncCursor cursor_returned;  // Threaded into the push
  ChangeSetMap pulled;
  ChangeSetMap pushed;         // Empty unless the push was acknowledged
  bool push_attempted{false};
  // Push acknowledged, or there was nothing to push
  bool local_changes_acknowledged{false};
  SyncOutcome outcome{SyncOutcome::Success};
  std::optional<SyncError> error;
  std::vector<queue::JobRequest> deferred_jobs;
  int64_t started_at{0};
  int64_t finished_at{0};

  bool ok() const { return outcome == SyncOutcome::Success; }

  // A failure that counts toward the retry ceiling
  bool failed() const {
    return outcome == SyncOutcome::PushFailure || outcome == SyncOutcome::AuthFailure ||
           outcome == SyncOutcome::StorageFailure;
  }
};

// Consecutive failures at which sync is reported unhealthy
inline constexpr int kUnhealthyFailureCount = 5;

/**
 * Session-wide sync bookkeeping, read through SyncScheduler::GetSyncState()
 */
struct SyncState {
  bool is_syncing{false};
  bool is_draining{false};
  std::optional<int64_t> last_sync_at;  // ms since epoch, last successful round
  bool last_sync_ok{false};
  size_t pending_local_changes{0};
  int consecutive_failures{0};
  std::optional<SyncError> last_error;

  bool is_healthy() const { return consecutive_failures < kUnhealthyFailureCount; }
};

} // namespace sync
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace offsync {
namespace queue {

using JobId = std::string;

/**
 * Kind of deferred work. Serialized as the strings used by the mobile
 * client's queue file ("google_contacts_sync", "patient_sync", "other").
 */
enum class JobType {
  ContactsImport,
  RecordSync,
  Other,
};

enum class JobStatus {
  Pending,
  Processing,
  Completed,
  Failed,
  Cancelled,
};

const char *JobTypeToString(JobType type);
std::optional<JobType> JobTypeFromString(const std::string &str);

const char *JobStatusToString(JobStatus status);
std::optional<JobStatus> JobStatusFromString(const std::string &str);

// Import contacts from the user's linked address book
struct ContactsImportPayload {
  bool incremental{true};
};

// Force a sync of a single collection
struct RecordSyncPayload {
  std::string collection;
};

/**
 * Job payload: one of the known shapes, or raw JSON for payloads written by
 * another client version
 */
using JobPayload = std::variant<ContactsImportPayload, RecordSyncPayload, nlohmann::json>;

nlohmann::json PayloadToJson(const JobPayload &payload);

/**
 * Decode a payload for the given type. Falls back to the raw JSON alternative
 * when the document does not match the type's known shape.
 */
JobPayload PayloadFromJson(JobType type, const nlohmann::json &j);

struct OfflineJob {
  JobId id;
  JobType type{JobType::Other};
  // Type string as stored, set only when it names no known JobType. Such
  // jobs are written back unchanged and never dispatched.
  std::string foreign_type;
  JobPayload payload{std::in_place_type<nlohmann::json>, nlohmann::json::object()};
  JobStatus status{JobStatus::Pending};
  int attempts{0};
  int max_attempts{3};
  int64_t created_at{0};  // ms since epoch
  int64_t updated_at{0};  // ms since epoch
  std::optional<std::string> last_error;

  // Completed, Failed or Cancelled
  bool IsFinished() const {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
  }
};

nlohmann::json JobToJson(const OfflineJob &job);

/**
 * Parse one persisted job. Returns std::nullopt if a required field is
 * missing or has the wrong type. An unknown type string loads as
 * JobType::Other with the string kept in foreign_type.
 */
std::optional<OfflineJob> JobFromJson(const nlohmann::json &j);

/**
 * Outcome reported by a job handler
 */
struct JobResult {
  bool success{false};
  std::string error;
  bool retryable{true};  // false: fail the job now, whatever attempts remain

  static JobResult Ok() { return JobResult{true, {}, true}; }
  static JobResult Fail(std::string message) { return JobResult{false, std::move(message), true}; }
  static JobResult Terminal(std::string message) {
    return JobResult{false, std::move(message), false};
  }
};

// Handlers may also throw; the queue records the exception message as a failed attempt
using JobHandler = std::function<JobResult(const OfflineJob &)>;

/**
 * Work item named by a sync round, to be enqueued by the scheduler
 */
struct JobRequest {
  JobType type{JobType::Other};
  JobPayload payload{std::in_place_type<nlohmann::json>, nlohmann::json::object()};
  int max_attempts{3};
};

struct QueueStatus {
  size_t pending{0};
  size_t processing{0};
  size_t failed{0};
};

/**
 * Result of one ProcessQueue() pass
 */
struct DrainStats {
  size_t processed{0};   // Handlers invoked
  size_t succeeded{0};
  size_t retried{0};     // Failed attempt, back to Pending
  size_t failed{0};      // Failed permanently
  size_t cancelled{0};   // Cancelled while the handler ran
  size_t skipped{0};     // No handler registered
  bool already_running{false};
  // Set when jobs were re-queued: how long to wait before the next drain
  std::optional<std::chrono::milliseconds> retry_delay;
};

} // namespace queue
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/types.hpp"
#include <stdexcept>

namespace offsync {
namespace sync {

using json = nlohmann::json;

size_t CountChanges(const ChangeSetMap &changes) {
  size_t total = 0;
  for (const auto &[collection, set] : changes) {
    total += set.size();
  }
  return total;
}

bool HasChanges(const ChangeSetMap &changes) {
  for (const auto &[collection, set] : changes) {
    if (!set.empty()) {
      return true;
    }
  }
  return false;
}

std::optional<RecordId> RecordIdOf(const Record &record) {
  if (!record.is_object()) {
    return std::nullopt;
  }
  auto it = record.find("id");
  if (it == record.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto id = it->get<std::string>();
  if (id.empty()) {
    return std::nullopt;
  }
  return id;
}

json ChangeSetMapToJson(const ChangeSetMap &changes) {
  json out = json::object();
  for (const auto &[collection, set] : changes) {
    out[collection] = json{{"created", set.created},
                           {"updated", set.updated},
                           {"deleted", set.deleted}};
  }
  return out;
}

namespace {

std::vector<Record> ParseRecords(const json &bucket, const std::string &collection,
                                 const char *name) {
  std::vector<Record> records;
  if (bucket.is_null()) {
    return records;
  }
  if (!bucket.is_array()) {
    throw std::invalid_argument("changes." + collection + "." + name + " is not an array");
  }
  records.reserve(bucket.size());
  for (const auto &record : bucket) {
    if (!RecordIdOf(record)) {
      throw std::invalid_argument("record without id in changes." + collection + "." + name);
    }
    records.push_back(record);
  }
  return records;
}

} // namespace

ChangeSetMap ChangeSetMapFromJson(const json &j) {
  ChangeSetMap changes;
  if (j.is_null()) {
    return changes;
  }
  if (!j.is_object()) {
    throw std::invalid_argument("changes is not an object");
  }

  for (const auto &[collection, body] : j.items()) {
    if (!body.is_object()) {
      throw std::invalid_argument("changes." + collection + " is not an object");
    }
    ChangeSet set;
    set.created = ParseRecords(body.value("created", json()), collection, "created");
    set.updated = ParseRecords(body.value("updated", json()), collection, "updated");

    const json deleted = body.value("deleted", json());
    if (!deleted.is_null()) {
      if (!deleted.is_array()) {
        throw std::invalid_argument("changes." + collection + ".deleted is not an array");
      }
      for (const auto &id : deleted) {
        if (!id.is_string()) {
          throw std::invalid_argument("non-string id in changes." + collection + ".deleted");
        }
        set.deleted.push_back(id.get<std::string>());
      }
    }
    changes.emplace(collection, std::move(set));
  }
  return changes;
}

const char *SyncErrorKindName(SyncErrorKind kind) {
  switch (kind) {
  case SyncErrorKind::TransientNetwork:
    return "transient_network";
  case SyncErrorKind::ServerRejected:
    return "server_rejected";
  case SyncErrorKind::Unauthorized:
    return "unauthorized";
  case SyncErrorKind::LocalStorage:
    return "local_storage";
  }
  return "unknown";
}

const char *SyncOutcomeName(SyncOutcome outcome) {
  switch (outcome) {
  case SyncOutcome::Success:
    return "success";
  case SyncOutcome::PartialPullFailure:
    return "partial_pull_failure";
  case SyncOutcome::PushFailure:
    return "push_failure";
  case SyncOutcome::AuthFailure:
    return "auth_failure";
  case SyncOutcome::StorageFailure:
    return "storage_failure";
  }
  return "unknown";
}

const char *SyncTriggerName(SyncTrigger trigger) {
  switch (trigger) {
  case SyncTrigger::Foreground:
    return "foreground";
  case SyncTrigger::NetworkReachable:
    return "network";
  case SyncTrigger::Periodic:
    return "periodic";
  case SyncTrigger::Manual:
    return "manual";
  case SyncTrigger::LocalChange:
    return "change";
  case SyncTrigger::Retry:
    return "retry";
  case SyncTrigger::QueueRetry:
    return "queue_retry";
  case SyncTrigger::JobEnqueued:
    return "job_enqueued";
  }
  return "unknown";
}

} // namespace sync
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/file_change_log.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace offsync {
namespace sync {

using json = nlohmann::json;

namespace {
constexpr int kChangeLogVersion = 1;
} // namespace

const char *FileChangeLog::RecordStatusToString(RecordStatus status) {
  switch (status) {
  case RecordStatus::Synced:
    return "synced";
  case RecordStatus::Created:
    return "created";
  case RecordStatus::Updated:
    return "updated";
  case RecordStatus::Deleted:
    return "deleted";
  }
  return "synced";
}

std::optional<FileChangeLog::RecordStatus>
FileChangeLog::RecordStatusFromString(const std::string &str) {
  if (str == "synced")
    return RecordStatus::Synced;
  if (str == "created")
    return RecordStatus::Created;
  if (str == "updated")
    return RecordStatus::Updated;
  if (str == "deleted")
    return RecordStatus::Deleted;
  return std::nullopt;
}

FileChangeLog::FileChangeLog(std::filesystem::path path) : path_(std::move(path)) {}

bool FileChangeLog::Load() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    LOG_SYNC_DEBUG("No change log at {}, starting empty", path_.string());
    doc_ = Document{};
    return true;
  }

  auto content = util::read_file_string(path_);
  if (!content) {
    LOG_SYNC_ERROR("Failed to read change log {}", path_.string());
    return false;
  }

  try {
    json root = json::parse(*content);
    if (!root.is_object() || root.value("version", 0) != kChangeLogVersion) {
      throw std::invalid_argument("unsupported change log version");
    }

    Document doc;
    const json &cursor = root.at("last_pulled_at");
    if (!cursor.is_null()) {
      doc.last_pulled_at = cursor.get<int64_t>();
    }

    for (const auto &[name, records] : root.at("collections").items()) {
      Collection &collection = doc.collections[name];
      for (const auto &[id, entry_json] : records.items()) {
        auto status = RecordStatusFromString(entry_json.at("status").get<std::string>());
        if (!status) {
          throw std::invalid_argument("bad record status for " + name + "/" + id);
        }
        collection[id] = Entry{*status, entry_json.at("record")};
      }
    }

    doc_ = std::move(doc);
    LOG_SYNC_INFO("Loaded change log {} ({} collections)", path_.string(),
                  doc_.collections.size());
    return true;
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Corrupt change log {}: {}", path_.string(), e.what());
    auto moved = util::quarantine_file(path_);
    if (moved) {
      LOG_SYNC_WARN("Moved corrupt change log to {}", moved->string());
    }
    doc_ = Document{};
    return false;
  }
}

void FileChangeLog::Save(const Document &doc) const {
  json root;
  root["version"] = kChangeLogVersion;
  root["last_pulled_at"] = doc.last_pulled_at ? json(*doc.last_pulled_at) : json(nullptr);

  json collections = json::object();
  for (const auto &[name, records] : doc.collections) {
    json entries = json::object();
    for (const auto &[id, entry] : records) {
      entries[id] = json{{"status", RecordStatusToString(entry.status)}, {"record", entry.record}};
    }
    collections[name] = std::move(entries);
  }
  root["collections"] = std::move(collections);

  if (!util::atomic_write_file(path_, root.dump(2), 0600)) {
    throw ChangeLogError("failed to write change log " + path_.string());
  }
}

void FileChangeLog::UpsertRecord(const std::string &collection, const Record &record) {
  auto id = RecordIdOf(record);
  if (!id) {
    throw std::invalid_argument("record in " + collection + " has no id");
  }

  ChangeListener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Document next = doc_;
    auto &records = next.collections[collection];
    auto it = records.find(*id);
    if (it == records.end()) {
      records[*id] = Entry{RecordStatus::Created, record};
    } else {
      // A never-pushed record stays "created" no matter how often it is edited
      if (it->second.status != RecordStatus::Created) {
        it->second.status = RecordStatus::Updated;
      }
      it->second.record = record;
    }
    Save(next);
    doc_ = std::move(next);
    listener = listener_;
  }

  if (listener) {
    listener(collection, *id);
  }
}

bool FileChangeLog::DeleteRecord(const std::string &collection, const RecordId &id) {
  ChangeListener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto coll_it = doc_.collections.find(collection);
    if (coll_it == doc_.collections.end()) {
      return false;
    }
    auto it = coll_it->second.find(id);
    if (it == coll_it->second.end() || it->second.status == RecordStatus::Deleted) {
      return false;
    }

    Document next = doc_;
    auto &records = next.collections[collection];
    if (records[id].status == RecordStatus::Created) {
      // The server never saw it: drop without a tombstone
      records.erase(id);
    } else {
      records[id].status = RecordStatus::Deleted;
    }
    Save(next);
    doc_ = std::move(next);
    listener = listener_;
  }

  if (listener) {
    listener(collection, id);
  }
  return true;
}

std::optional<Record> FileChangeLog::GetRecord(const std::string &collection,
                                               const RecordId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto coll_it = doc_.collections.find(collection);
  if (coll_it == doc_.collections.end()) {
    return std::nullopt;
  }
  auto it = coll_it->second.find(id);
  if (it == coll_it->second.end() || it->second.status == RecordStatus::Deleted) {
    return std::nullopt;
  }
  return it->second.record;
}

std::vector<Record> FileChangeLog::ListRecords(const std::string &collection) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Record> out;
  auto coll_it = doc_.collections.find(collection);
  if (coll_it == doc_.collections.end()) {
    return out;
  }
  for (const auto &[id, entry] : coll_it->second) {
    if (entry.status != RecordStatus::Deleted) {
      out.push_back(entry.record);
    }
  }
  return out;
}

std::optional<FileChangeLog::RecordStatus>
FileChangeLog::GetRecordStatus(const std::string &collection, const RecordId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto coll_it = doc_.collections.find(collection);
  if (coll_it == doc_.collections.end()) {
    return std::nullopt;
  }
  auto it = coll_it->second.find(id);
  if (it == coll_it->second.end()) {
    return std::nullopt;
  }
  return it->second.status;
}

void FileChangeLog::SetChangeListener(ChangeListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

ChangeSetMap FileChangeLog::CollectLocalChanges() {
  std::lock_guard<std::mutex> lock(mutex_);
  ChangeSetMap changes;
  for (const auto &[name, records] : doc_.collections) {
    ChangeSet set;
    for (const auto &[id, entry] : records) {
      switch (entry.status) {
      case RecordStatus::Created:
        set.created.push_back(entry.record);
        break;
      case RecordStatus::Updated:
        set.updated.push_back(entry.record);
        break;
      case RecordStatus::Deleted:
        set.deleted.push_back(id);
        break;
      case RecordStatus::Synced:
        break;
      }
    }
    if (!set.empty()) {
      changes.emplace(name, std::move(set));
    }
  }
  return changes;
}

void FileChangeLog::ApplyRemoteChanges(const ChangeSetMap &changes) {
  std::lock_guard<std::mutex> lock(mutex_);
  Document next = doc_;
  size_t applied = 0;
  size_t skipped = 0;

  for (const auto &[name, set] : changes) {
    auto &records = next.collections[name];

    auto apply_record = [&](const Record &record) {
      auto id = RecordIdOf(record);
      if (!id) {
        ++skipped;
        return;
      }
      auto it = records.find(*id);
      if (it != records.end() && it->second.status != RecordStatus::Synced) {
        // Unpushed local change wins; it goes out with the next push
        ++skipped;
        return;
      }
      records[*id] = Entry{RecordStatus::Synced, record};
      ++applied;
    };

    for (const auto &record : set.created) {
      apply_record(record);
    }
    for (const auto &record : set.updated) {
      apply_record(record);
    }
    for (const auto &id : set.deleted) {
      if (records.erase(id) > 0) {
        ++applied;
      }
    }
  }

  if (applied == 0) {
    LOG_SYNC_TRACE("No remote changes to apply ({} skipped)", skipped);
    return;
  }

  Save(next);
  doc_ = std::move(next);
  LOG_SYNC_DEBUG("Applied {} remote changes ({} skipped for local edits)", applied, skipped);
}

void FileChangeLog::MarkLocalChangesPushed(const ChangeSetMap &pushed) {
  std::lock_guard<std::mutex> lock(mutex_);
  Document next = doc_;

  for (const auto &[name, set] : pushed) {
    auto &records = next.collections[name];

    auto acknowledge = [&](const Record &sent) {
      auto id = RecordIdOf(sent);
      if (!id) {
        return;
      }
      auto it = records.find(*id);
      if (it == records.end()) {
        // Deleted while its create was in flight: the server has it now,
        // so the delete must go out with the next push
        records[*id] = Entry{RecordStatus::Deleted, sent};
        return;
      }
      if (it->second.record == sent &&
          (it->second.status == RecordStatus::Created || it->second.status == RecordStatus::Updated)) {
        it->second.status = RecordStatus::Synced;
      } else if (it->second.status == RecordStatus::Created) {
        // Edited during the push: the server now has a version, so this is an update
        it->second.status = RecordStatus::Updated;
      }
    };

    for (const auto &record : set.created) {
      acknowledge(record);
    }
    for (const auto &record : set.updated) {
      acknowledge(record);
    }
    for (const auto &id : set.deleted) {
      auto it = records.find(id);
      if (it != records.end() && it->second.status == RecordStatus::Deleted) {
        records.erase(it);
      }
    }
  }

  Save(next);
  doc_ = std::move(next);
}

SyncCursor FileChangeLog::GetLastPulledAt() {
  std::lock_guard<std::mutex> lock(mutex_);
  return doc_.last_pulled_at;
}

void FileChangeLog::SetLastPulledAt(int64_t cursor) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (doc_.last_pulled_at && *doc_.last_pulled_at > cursor) {
    // Never move the watermark backwards
    LOG_SYNC_WARN("Ignoring cursor {} older than stored cursor {}", cursor, *doc_.last_pulled_at);
    return;
  }
  Document next = doc_;
  next.last_pulled_at = cursor;
  Save(next);
  doc_ = std::move(next);
}

size_t FileChangeLog::CountPendingChanges() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto &[name, records] : doc_.collections) {
    for (const auto &[id, entry] : records) {
      if (entry.status != RecordStatus::Synced) {
        ++count;
      }
    }
  }
  return count;
}

} // namespace sync
} // namespace offsync

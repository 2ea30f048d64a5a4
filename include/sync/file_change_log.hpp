// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "sync/change_log.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace offsync {
namespace sync {

/**
 * FileChangeLog - local record store persisted as one JSON document
 *
 * Layout of changelog.json:
 *   {"version": 1,
 *    "last_pulled_at": <ms|null>,
 *    "collections": {"<name>": {"<id>": {"status": "synced|created|updated|deleted",
 *                                       "record": {...}}}}}
 *
 * Every mutation rewrites the document with util::atomic_write_file. A write
 * failure throws ChangeLogError and leaves the in-memory state unchanged, so
 * ApplyRemoteChanges() is all-or-nothing.
 *
 * Conflicts are last-writer-wins from the client's point of view: a pulled
 * create/update is not applied over a record with unpushed local changes,
 * because that local change will be pushed next. A pulled delete always wins.
 *
 * Thread-safe.
 */
class FileChangeLog : public ChangeLog {
public:
  enum class RecordStatus { Synced, Created, Updated, Deleted };

  // Invoked after a successful local write (not for pulled changes)
  using ChangeListener = std::function<void(const std::string &collection, const RecordId &id)>;

  explicit FileChangeLog(std::filesystem::path path);

  /**
   * Load the document from disk. A missing file is an empty log.
   * A corrupt file is moved aside and the log starts empty.
   * @return false if the file existed but could not be used
   */
  bool Load();

  /**
   * Local write: insert or replace a record (must carry a string "id")
   * @throws std::invalid_argument if the record has no id
   * @throws ChangeLogError if the write could not be persisted
   */
  void UpsertRecord(const std::string &collection, const Record &record);

  /**
   * Local delete. Returns false if the record does not exist.
   * @throws ChangeLogError if the write could not be persisted
   */
  bool DeleteRecord(const std::string &collection, const RecordId &id);

  // Live record (deleted tombstones are not returned)
  std::optional<Record> GetRecord(const std::string &collection, const RecordId &id) const;
  std::vector<Record> ListRecords(const std::string &collection) const;
  std::optional<RecordStatus> GetRecordStatus(const std::string &collection,
                                              const RecordId &id) const;

  void SetChangeListener(ChangeListener listener);

  // ChangeLog
  ChangeSetMap CollectLocalChanges() override;
  void ApplyRemoteChanges(const ChangeSetMap &changes) override;
  void MarkLocalChangesPushed(const ChangeSetMap &pushed) override;
  SyncCursor GetLastPulledAt() override;
  void SetLastPulledAt(int64_t cursor) override;
  size_t CountPendingChanges() override;

  static const char *RecordStatusToString(RecordStatus status);
  static std::optional<RecordStatus> RecordStatusFromString(const std::string &str);

private:
  struct Entry {
    RecordStatus status{RecordStatus::Synced};
    Record record;
  };

  using Collection = std::map<RecordId, Entry>;

  struct Document {
    SyncCursor last_pulled_at;
    std::map<std::string, Collection> collections;
  };

  // Persist `doc`; throws ChangeLogError on failure. Caller holds mutex_.
  void Save(const Document &doc) const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  Document doc_;
  ChangeListener listener_;
};

} // namespace sync
} // namespace offsync

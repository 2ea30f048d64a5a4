#pragma once

#include "sync/change_log.hpp"
#include <mutex>
#include <vector>

namespace offsync {
namespace test {

// In-process ChangeLog for sync client/scheduler tests
//
// Local changes are whatever was staged with StageLocalChanges(); pushed
// changes are removed on MarkLocalChangesPushed(). Each storage operation
// can be made to throw ChangeLogError.
class MemoryChangeLog : public sync::ChangeLog {
public:
    sync::ChangeSetMap CollectLocalChanges() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_collect_) throw sync::ChangeLogError("collect failed");
        ++collect_calls_;
        return local_;
    }

    void ApplyRemoteChanges(const sync::ChangeSetMap& changes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_apply_) throw sync::ChangeLogError("disk full");
        applied_.push_back(changes);
    }

    void MarkLocalChangesPushed(const sync::ChangeSetMap& pushed) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_mark_) throw sync::ChangeLogError("mark failed");
        for (const auto& [collection, set] : pushed) {
            auto it = local_.find(collection);
            if (it == local_.end()) continue;
            RemoveAll(it->second.created, set.created);
            RemoveAll(it->second.updated, set.updated);
            RemoveAll(it->second.deleted, set.deleted);
            if (it->second.empty()) local_.erase(it);
        }
    }

    sync::SyncCursor GetLastPulledAt() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_cursor_) throw sync::ChangeLogError("cursor unreadable");
        return cursor_;
    }

    void SetLastPulledAt(int64_t cursor) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cursor_ = cursor;
    }

    size_t CountPendingChanges() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return sync::CountChanges(local_);
    }

    // Test controls

    void StageLocalChanges(const sync::ChangeSetMap& changes) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [collection, set] : changes) {
            auto& target = local_[collection];
            target.created.insert(target.created.end(), set.created.begin(), set.created.end());
            target.updated.insert(target.updated.end(), set.updated.begin(), set.updated.end());
            target.deleted.insert(target.deleted.end(), set.deleted.begin(), set.deleted.end());
        }
    }

    void SetCursor(sync::SyncCursor cursor) {
        std::lock_guard<std::mutex> lock(mutex_);
        cursor_ = cursor;
    }

    sync::SyncCursor cursor() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cursor_;
    }

    std::vector<sync::ChangeSetMap> applied() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return applied_;
    }

    void set_fail_apply(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_apply_ = fail; }
    void set_fail_mark(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_mark_ = fail; }
    void set_fail_cursor(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_cursor_ = fail; }
    void set_fail_collect(bool fail) { std::lock_guard<std::mutex> lock(mutex_); fail_collect_ = fail; }

private:
    template <typename T>
    static void RemoveAll(std::vector<T>& from, const std::vector<T>& items) {
        for (const auto& item : items) {
            for (auto it = from.begin(); it != from.end(); ++it) {
                if (*it == item) {
                    from.erase(it);
                    break;
                }
            }
        }
    }

    mutable std::mutex mutex_;
    sync::ChangeSetMap local_;
    sync::SyncCursor cursor_;
    std::vector<sync::ChangeSetMap> applied_;
    size_t collect_calls_{0};
    bool fail_apply_{false};
    bool fail_mark_{false};
    bool fail_cursor_{false};
    bool fail_collect_{false};
};

// {"id": id, "name": name}
inline sync::Record MakeRecord(const std::string& id, const std::string& name = "x") {
    return sync::Record{{"id", id}, {"name", name}};
}

} // namespace test
} // namespace offsync

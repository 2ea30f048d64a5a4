// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/events.hpp"
#include <algorithm>

namespace offsync {
namespace sync {

// ============================================================================
// AppEvents::Subscription
// ============================================================================

AppEvents::Subscription::Subscription(AppEvents *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

AppEvents::Subscription::~Subscription() { Unsubscribe(); }

AppEvents::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

AppEvents::Subscription &
AppEvents::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void AppEvents::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// AppEvents
// ============================================================================

AppEvents::Subscription AppEvents::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_id_++;
  size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

template <typename Callback>
std::vector<Callback> AppEvents::Snapshot(Callback CallbackEntry::*member) const {
  std::vector<Callback> snapshot;
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.reserve(callbacks_.size());
  for (const auto &entry : callbacks_) {
    if (entry.*member) {
      snapshot.push_back(entry.*member);
    }
  }
  return snapshot;
}

AppEvents::Subscription AppEvents::SubscribeAppStateChanged(AppStateCallback callback) {
  CallbackEntry entry{};
  entry.app_state = std::move(callback);
  return Add(std::move(entry));
}

AppEvents::Subscription AppEvents::SubscribeNetworkChanged(NetworkCallback callback) {
  CallbackEntry entry{};
  entry.network = std::move(callback);
  return Add(std::move(entry));
}

AppEvents::Subscription AppEvents::SubscribeRecordChanged(RecordChangedCallback callback) {
  CallbackEntry entry{};
  entry.record_changed = std::move(callback);
  return Add(std::move(entry));
}

AppEvents::Subscription AppEvents::SubscribeSyncCompleted(SyncCompletedCallback callback) {
  CallbackEntry entry{};
  entry.sync_completed = std::move(callback);
  return Add(std::move(entry));
}

AppEvents::Subscription AppEvents::SubscribeAuthRequired(AuthRequiredCallback callback) {
  CallbackEntry entry{};
  entry.auth_required = std::move(callback);
  return Add(std::move(entry));
}

void AppEvents::NotifyAppStateChanged(bool foreground) {
  for (auto &cb : Snapshot(&CallbackEntry::app_state)) {
    cb(foreground);
  }
}

void AppEvents::NotifyNetworkChanged(bool reachable) {
  for (auto &cb : Snapshot(&CallbackEntry::network)) {
    cb(reachable);
  }
}

void AppEvents::NotifyRecordChanged(const std::string &collection, const RecordId &id) {
  for (auto &cb : Snapshot(&CallbackEntry::record_changed)) {
    cb(collection, id);
  }
}

void AppEvents::NotifySyncCompleted(SyncTrigger trigger, const SyncRound &round) {
  for (auto &cb : Snapshot(&CallbackEntry::sync_completed)) {
    cb(trigger, round);
  }
}

void AppEvents::NotifyAuthRequired(const SyncError &error) {
  for (auto &cb : Snapshot(&CallbackEntry::auth_required)) {
    cb(error);
  }
}

size_t AppEvents::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void AppEvents::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &entry) { return entry.id == id; }),
                   callbacks_.end());
}

} // namespace sync
} // namespace offsync

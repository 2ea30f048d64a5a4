// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "sync/types.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace offsync {
namespace sync {

/**
 * Event hub connecting the host application and the sync subsystem
 *
 * Design:
 * - Simple observer pattern with std::function
 * - Synchronous callbacks on the notifying thread
 * - Callbacks are copied out of the lock before being invoked, so a callback
 *   may subscribe or unsubscribe
 * - RAII-based subscription management
 * - Owned by app::Application and passed by reference (no singleton)
 *
 * Inbound events (host -> sync):
 * - AppStateChanged: app moved to foreground/background
 * - NetworkChanged: reachability changed
 * - RecordChanged: a local write happened
 *
 * Outbound events (sync -> host):
 * - SyncCompleted: a round finished (any outcome)
 * - AuthRequired: the server rejected the credential
 */
class AppEvents {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

    bool IsActive() const { return active_; }

  private:
    friend class AppEvents;
    Subscription(AppEvents *owner, size_t id);

    AppEvents *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using AppStateCallback = std::function<void(bool foreground)>;
  using NetworkCallback = std::function<void(bool reachable)>;
  using RecordChangedCallback =
      std::function<void(const std::string &collection, const RecordId &id)>;
  using SyncCompletedCallback = std::function<void(SyncTrigger trigger, const SyncRound &round)>;
  using AuthRequiredCallback = std::function<void(const SyncError &error)>;

  AppEvents() = default;
  AppEvents(const AppEvents &) = delete;
  AppEvents &operator=(const AppEvents &) = delete;

  [[nodiscard]] Subscription SubscribeAppStateChanged(AppStateCallback callback);
  [[nodiscard]] Subscription SubscribeNetworkChanged(NetworkCallback callback);
  [[nodiscard]] Subscription SubscribeRecordChanged(RecordChangedCallback callback);
  [[nodiscard]] Subscription SubscribeSyncCompleted(SyncCompletedCallback callback);
  [[nodiscard]] Subscription SubscribeAuthRequired(AuthRequiredCallback callback);

  void NotifyAppStateChanged(bool foreground);
  void NotifyNetworkChanged(bool reachable);
  void NotifyRecordChanged(const std::string &collection, const RecordId &id);
  void NotifySyncCompleted(SyncTrigger trigger, const SyncRound &round);
  void NotifyAuthRequired(const SyncError &error);

  size_t SubscriberCount() const;

private:
  // Unsubscribe by ID (called by Subscription)
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    AppStateCallback app_state;
    NetworkCallback network;
    RecordChangedCallback record_changed;
    SyncCompletedCallback sync_completed;
    AuthRequiredCallback auth_required;
  };

  // Register a filled-in entry and hand out its handle
  Subscription Add(CallbackEntry entry);

  // Copy out every non-empty callback selected by `member`
  template <typename Callback>
  std::vector<Callback> Snapshot(Callback CallbackEntry::*member) const;

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace sync
} // namespace offsync

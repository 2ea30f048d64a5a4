// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "queue/offline_queue.hpp"
#include "sync/events.hpp"
#include "sync/sync_client.hpp"
#include "sync/types.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace offsync {
namespace sync {

/**
 * SyncScheduler - decides when sync rounds and queue drains run
 *
 * State machine: Idle -> Syncing -> Idle, with the side channel
 * Idle -> Draining -> Idle. One atomic guard covers both: a trigger that
 * arrives while a round or drain is in flight is dropped, not queued.
 *
 * Trigger policy:
 * - Foreground: background sync enabled and the last sync is older than
 *   min_foreground_interval (or there was none)
 * - Network reachable: sync if background sync is enabled and local changes
 *   are pending; the queue is drained afterwards in either case
 * - Periodic: background sync enabled and auto_sync
 * - Manual: always admitted (resets the failure counter, cancels the debounce)
 * - Local change: debounced by change_debounce; every change restarts the wait
 * - Retry: armed after a failed round, retry_base_delay x failures, until
 *   max_sync_attempts consecutive failures
 * Every trigger except Manual is skipped while the device is offline.
 *
 * Threading:
 * - Timers live on the supplied io_context (single reactor thread)
 * - Rounds and drains run on a private one-thread util::ThreadPool
 * - Completions are posted back to the io_context for bookkeeping
 * - Public methods may be called from any thread
 *
 * The io_context must not be run again after the scheduler is destroyed.
 */
class SyncScheduler {
public:
  struct Config {
    bool background_sync_enabled{true};
    bool auto_sync{true};
    std::chrono::milliseconds periodic_interval{std::chrono::minutes(30)};
    std::chrono::milliseconds min_foreground_interval{std::chrono::minutes(5)};
    std::chrono::milliseconds change_debounce{std::chrono::seconds(5)};
    int max_sync_attempts{3};
    std::chrono::milliseconds retry_base_delay{std::chrono::seconds(5)};
    // Reachability assumed until the first NetworkChanged event
    bool start_online{true};
  };

  // Receives the finished round of an admitted manual trigger (io_context thread)
  using ManualSyncCallback = std::function<void(const SyncRound &)>;

  SyncScheduler(boost::asio::io_context &io_context, SyncClient &client,
                queue::OfflineQueue &queue, AppEvents &events);
  SyncScheduler(boost::asio::io_context &io_context, SyncClient &client,
                queue::OfflineQueue &queue, AppEvents &events, const Config &config);
  ~SyncScheduler();

  SyncScheduler(const SyncScheduler &) = delete;
  SyncScheduler &operator=(const SyncScheduler &) = delete;

  /**
   * Subscribe to the event hub and start the periodic timer if enabled.
   * Idempotent. Returns false if already running or already shut down.
   */
  bool Initialize();

  /**
   * Unsubscribe, cancel all timers and wait for the in-flight round or
   * drain to finish. Idempotent.
   */
  void Shutdown();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  /**
   * Run a round now. Returns false if a round or drain is already in flight.
   * `callback` runs on the io_context thread once the round finished.
   */
  bool TriggerManualSync(ManualSyncCallback callback = {});

  // Restart the local-change debounce timer
  void TriggerChangeSync();

  // Cancel a pending debounce; no effect on an in-flight round
  void CancelPendingChangeSync();

  void OnAppStateChanged(bool foreground);
  void OnNetworkChanged(bool reachable);
  void OnRecordChanged(const std::string &collection, const RecordId &id);

  // Drain the offline queue now if online and idle
  bool TriggerQueueDrain();

  /**
   * Enqueue a deferred job; drains immediately when online and idle
   */
  queue::JobId EnqueueOfflineJob(queue::JobType type, queue::JobPayload payload,
                                 int max_attempts = 3);

  // Start or stop the periodic timer at runtime
  void UpdateSettings(bool background_sync_enabled, bool auto_sync);

  // Seed the pending counter from the change log at startup
  void SetPendingLocalChanges(size_t count);

  SyncState GetSyncState() const;
  queue::QueueStatus GetQueueStatus() const;

  bool IsBusy() const { return busy_.load(std::memory_order_acquire); }
  bool IsOnline() const { return online_.load(std::memory_order_acquire); }

private:
  // Background admission: running, online, background sync enabled
  bool AdmitBackground(SyncTrigger trigger) const;

  // Take the guard and hand the work to the worker thread
  bool StartWork(SyncTrigger trigger, bool run_sync, bool run_drain,
                 ManualSyncCallback callback = {});

  // Worker thread
  void RunWork(SyncTrigger trigger, bool run_sync, bool run_drain, size_t pending_snapshot,
               ManualSyncCallback callback);

  // io_context thread
  void OnWorkComplete(SyncTrigger trigger, std::optional<SyncRound> round,
                      std::optional<queue::DrainStats> drain, size_t pending_snapshot,
                      const ManualSyncCallback &callback);
  void ApplyRoundResult(const SyncRound &round, size_t pending_snapshot);

  // Timer arming (io_context thread only)
  void schedule_next_periodic();
  void schedule_debounced_sync();
  void schedule_retry(std::chrono::milliseconds delay);
  void schedule_queue_retry(std::chrono::milliseconds delay);
  void cancel_timers();

  boost::asio::io_context &io_context_;
  SyncClient &client_;
  queue::OfflineQueue &queue_;
  AppEvents &events_;
  const Config config_;

  std::atomic<bool> background_sync_enabled_;
  std::atomic<bool> auto_sync_;
  std::atomic<bool> online_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shut_down_{false};

  // Exclusion guard: held from admission until bookkeeping is done
  std::atomic<bool> busy_{false};

  mutable std::mutex state_mutex_;
  SyncState state_;

  boost::asio::steady_timer debounce_timer_;
  boost::asio::steady_timer periodic_timer_;
  boost::asio::steady_timer retry_timer_;
  boost::asio::steady_timer queue_retry_timer_;

  std::mutex subscriptions_mutex_;
  std::vector<AppEvents::Subscription> subscriptions_;

  // Declared last: destroyed (and joined) first
  util::ThreadPool worker_;
};

} // namespace sync
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "sync/sync_scheduler.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>

namespace offsync {
namespace sync {

SyncScheduler::SyncScheduler(boost::asio::io_context &io_context, SyncClient &client,
                             queue::OfflineQueue &queue, AppEvents &events)
    : SyncScheduler(io_context, client, queue, events, Config{}) {}

SyncScheduler::SyncScheduler(boost::asio::io_context &io_context, SyncClient &client,
                             queue::OfflineQueue &queue, AppEvents &events,
                             const Config &config)
    : io_context_(io_context),
      client_(client),
      queue_(queue),
      events_(events),
      config_(config),
      background_sync_enabled_(config.background_sync_enabled),
      auto_sync_(config.auto_sync),
      online_(config.start_online),
      debounce_timer_(io_context),
      periodic_timer_(io_context),
      retry_timer_(io_context),
      queue_retry_timer_(io_context),
      worker_(1, "sync") {}

SyncScheduler::~SyncScheduler() { Shutdown(); }

bool SyncScheduler::Initialize() {
  if (shut_down_.load(std::memory_order_acquire)) {
    LOG_SYNC_WARN("SyncScheduler cannot be restarted after Shutdown()");
    return false;
  }
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    subscriptions_.push_back(
        events_.SubscribeAppStateChanged([this](bool foreground) { OnAppStateChanged(foreground); }));
    subscriptions_.push_back(
        events_.SubscribeNetworkChanged([this](bool reachable) { OnNetworkChanged(reachable); }));
    subscriptions_.push_back(events_.SubscribeRecordChanged(
        [this](const std::string &collection, const RecordId &id) { OnRecordChanged(collection, id); }));
  }

  boost::asio::post(io_context_, [this]() {
    if (background_sync_enabled_.load() && auto_sync_.load()) {
      schedule_next_periodic();
    }
  });

  LOG_SYNC_INFO("Sync scheduler started (background={}, auto_sync={}, interval={}s)",
                background_sync_enabled_.load(), auto_sync_.load(),
                std::chrono::duration_cast<std::chrono::seconds>(config_.periodic_interval).count());
  return true;
}

void SyncScheduler::Shutdown() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
    shut_down_.store(true, std::memory_order_release);
    return;
  }
  shut_down_.store(true, std::memory_order_release);

  {
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    subscriptions_.clear();
  }

  // Handlers also check running_, so a wait that already fired is harmless
  cancel_timers();

  // Let an in-flight round or drain finish
  worker_.shutdown();
  worker_.wait_for_completion();

  LOG_SYNC_INFO("Sync scheduler stopped");
}

bool SyncScheduler::AdmitBackground(SyncTrigger trigger) const {
  if (!running_.load(std::memory_order_acquire)) {
    return false;
  }
  if (!online_.load(std::memory_order_acquire)) {
    LOG_SYNC_DEBUG("Skipping {} sync: offline", SyncTriggerName(trigger));
    return false;
  }
  if (!background_sync_enabled_.load(std::memory_order_acquire)) {
    LOG_SYNC_TRACE("Skipping {} sync: background sync disabled", SyncTriggerName(trigger));
    return false;
  }
  return true;
}

bool SyncScheduler::TriggerManualSync(ManualSyncCallback callback) {
  if (!running_.load(std::memory_order_acquire)) {
    return false;
  }

  if (!StartWork(SyncTrigger::Manual, true, false, std::move(callback))) {
    return false;
  }

  // A manual round supersedes any pending debounce or retry
  boost::asio::post(io_context_, [this]() {
    debounce_timer_.cancel();
    retry_timer_.cancel();
  });
  return true;
}

void SyncScheduler::TriggerChangeSync() {
  if (!running_.load(std::memory_order_acquire) ||
      !background_sync_enabled_.load(std::memory_order_acquire)) {
    return;
  }
  boost::asio::post(io_context_, [this]() { schedule_debounced_sync(); });
}

void SyncScheduler::CancelPendingChangeSync() {
  boost::asio::post(io_context_, [this]() { debounce_timer_.cancel(); });
}

void SyncScheduler::OnAppStateChanged(bool foreground) {
  if (!foreground || !AdmitBackground(SyncTrigger::Foreground)) {
    return;
  }

  std::optional<int64_t> last_sync_at;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_sync_at = state_.last_sync_at;
  }

  if (last_sync_at) {
    const int64_t elapsed = util::GetTimeMillis() - *last_sync_at;
    if (elapsed < config_.min_foreground_interval.count()) {
      LOG_SYNC_DEBUG("Skipping foreground sync: last sync {}s ago", elapsed / 1000);
      return;
    }
  }

  StartWork(SyncTrigger::Foreground, true, false);
}

void SyncScheduler::OnNetworkChanged(bool reachable) {
  const bool was_online = online_.exchange(reachable, std::memory_order_acq_rel);
  if (!reachable) {
    if (was_online) {
      LOG_SYNC_INFO("Network unreachable, background sync paused");
    }
    return;
  }
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  size_t pending = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    pending = state_.pending_local_changes;
  }

  const bool run_sync = background_sync_enabled_.load(std::memory_order_acquire) && pending > 0;
  LOG_SYNC_INFO("Network reachable ({} pending local changes)", pending);
  StartWork(SyncTrigger::NetworkReachable, run_sync, true);
}

void SyncScheduler::OnRecordChanged(const std::string &collection, const RecordId &id) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++state_.pending_local_changes;
  }
  LOG_SYNC_TRACE("Local change {}/{}", collection, id);
  TriggerChangeSync();
}

bool SyncScheduler::TriggerQueueDrain() {
  if (!running_.load(std::memory_order_acquire) || !online_.load(std::memory_order_acquire)) {
    return false;
  }
  return StartWork(SyncTrigger::JobEnqueued, false, true);
}

queue::JobId SyncScheduler::EnqueueOfflineJob(queue::JobType type, queue::JobPayload payload,
                                              int max_attempts) {
  queue::JobId id = queue_.Enqueue(type, std::move(payload), max_attempts);
  TriggerQueueDrain();
  return id;
}

void SyncScheduler::UpdateSettings(bool background_sync_enabled, bool auto_sync) {
  background_sync_enabled_.store(background_sync_enabled, std::memory_order_release);
  auto_sync_.store(auto_sync, std::memory_order_release);
  LOG_SYNC_INFO("Sync settings updated (background={}, auto_sync={})", background_sync_enabled,
                auto_sync);

  boost::asio::post(io_context_, [this, background_sync_enabled, auto_sync]() {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    if (background_sync_enabled && auto_sync) {
      schedule_next_periodic();
    } else {
      periodic_timer_.cancel();
    }
    if (!background_sync_enabled) {
      debounce_timer_.cancel();
    }
  });
}

void SyncScheduler::SetPendingLocalChanges(size_t count) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_.pending_local_changes = count;
}

SyncState SyncScheduler::GetSyncState() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

queue::QueueStatus SyncScheduler::GetQueueStatus() const { return queue_.GetStatus(); }

bool SyncScheduler::StartWork(SyncTrigger trigger, bool run_sync, bool run_drain,
                              ManualSyncCallback callback) {
  if (!run_sync && !run_drain) {
    return false;
  }

  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    LOG_SYNC_DEBUG("Dropping {} trigger: sync already in progress", SyncTriggerName(trigger));
    return false;
  }

  size_t pending_snapshot = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.is_syncing = run_sync;
    state_.is_draining = !run_sync && run_drain;
    if (trigger == SyncTrigger::Manual) {
      state_.consecutive_failures = 0;
    }
    pending_snapshot = state_.pending_local_changes;
  }

  LOG_SYNC_DEBUG("Starting {} ({}{})", SyncTriggerName(trigger), run_sync ? "sync" : "",
                 run_drain ? (run_sync ? "+drain" : "drain") : "");

  bool posted = worker_.try_post(
      [this, trigger, run_sync, run_drain, pending_snapshot, callback = std::move(callback)]() {
        RunWork(trigger, run_sync, run_drain, pending_snapshot, callback);
      });

  if (!posted) {
    LOG_SYNC_WARN("Sync worker unavailable, dropping {} trigger", SyncTriggerName(trigger));
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.is_syncing = false;
      state_.is_draining = false;
    }
    busy_.store(false, std::memory_order_release);
    return false;
  }
  return true;
}

void SyncScheduler::RunWork(SyncTrigger trigger, bool run_sync, bool run_drain,
                            size_t pending_snapshot, ManualSyncCallback callback) {
  std::optional<SyncRound> round;
  std::optional<queue::DrainStats> drain;

  try {
    if (run_sync) {
      round = client_.RunSyncRound();
      for (const auto &request : round->deferred_jobs) {
        queue_.Enqueue(request.type, request.payload, request.max_attempts);
      }
    }

    if (run_drain) {
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.is_syncing = false;
        state_.is_draining = true;
      }
      drain = queue_.ProcessQueue();
    }
  } catch (const std::exception &e) {
    // Must still post the completion below, or the guard is never released
    LOG_SYNC_ERROR("Unexpected error during {} work: {}", SyncTriggerName(trigger), e.what());
  }

  boost::asio::post(io_context_, [this, trigger, round = std::move(round), drain,
                                  pending_snapshot, callback = std::move(callback)]() mutable {
    OnWorkComplete(trigger, std::move(round), drain, pending_snapshot, callback);
  });
}

void SyncScheduler::OnWorkComplete(SyncTrigger trigger, std::optional<SyncRound> round,
                                   std::optional<queue::DrainStats> drain,
                                   size_t pending_snapshot, const ManualSyncCallback &callback) {
  if (round) {
    ApplyRoundResult(*round, pending_snapshot);
  }

  if (drain) {
    if (drain->processed > 0 || drain->skipped > 0) {
      LOG_QUEUE_INFO("Queue drain: {} processed, {} succeeded, {} retried, {} failed, {} skipped",
                     drain->processed, drain->succeeded, drain->retried, drain->failed,
                     drain->skipped);
    }
    if (drain->retry_delay && running_.load(std::memory_order_acquire)) {
      schedule_queue_retry(*drain->retry_delay);
    }
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.is_syncing = false;
    state_.is_draining = false;
  }
  busy_.store(false, std::memory_order_release);

  if (!round) {
    return;
  }

  if (running_.load(std::memory_order_acquire)) {
    events_.NotifySyncCompleted(trigger, *round);
    if (round->outcome == SyncOutcome::AuthFailure && round->error) {
      events_.NotifyAuthRequired(*round->error);
    }
  }

  if (callback) {
    try {
      callback(*round);
    } catch (const std::exception &e) {
      LOG_SYNC_ERROR("Manual sync callback threw: {}", e.what());
    }
  }
}

void SyncScheduler::ApplyRoundResult(const SyncRound &round, size_t pending_snapshot) {
  std::optional<std::chrono::milliseconds> retry_delay;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (round.local_changes_acknowledged) {
      // Changes recorded while the round ran stay pending
      state_.pending_local_changes -= std::min(state_.pending_local_changes, pending_snapshot);
    }

    switch (round.outcome) {
    case SyncOutcome::Success:
      state_.last_sync_at = round.finished_at;
      state_.last_sync_ok = true;
      state_.consecutive_failures = 0;
      state_.last_error.reset();
      break;
    case SyncOutcome::PartialPullFailure:
      state_.last_sync_ok = false;
      state_.last_error = round.error;
      break;
    case SyncOutcome::PushFailure:
    case SyncOutcome::AuthFailure:
    case SyncOutcome::StorageFailure:
      state_.last_sync_ok = false;
      state_.last_error = round.error;
      ++state_.consecutive_failures;
      if (round.outcome != SyncOutcome::AuthFailure &&
          state_.consecutive_failures < config_.max_sync_attempts) {
        retry_delay = config_.retry_base_delay * state_.consecutive_failures;
      }
      if (!state_.is_healthy()) {
        LOG_SYNC_WARN("Sync unhealthy: {} consecutive failures", state_.consecutive_failures);
      }
      break;
    }
  }

  if (retry_delay && running_.load(std::memory_order_acquire)) {
    LOG_SYNC_INFO("Retrying sync in {}ms", retry_delay->count());
    schedule_retry(*retry_delay);
  }
}

void SyncScheduler::schedule_next_periodic() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  periodic_timer_.expires_after(config_.periodic_interval);
  periodic_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    if (!auto_sync_.load(std::memory_order_acquire)) {
      return;
    }
    if (AdmitBackground(SyncTrigger::Periodic)) {
      StartWork(SyncTrigger::Periodic, true, false);
    }
    schedule_next_periodic();
  });
}

void SyncScheduler::schedule_debounced_sync() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  // Re-arming cancels the previous wait
  debounce_timer_.expires_after(config_.change_debounce);
  debounce_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    if (AdmitBackground(SyncTrigger::LocalChange)) {
      StartWork(SyncTrigger::LocalChange, true, false);
    }
  });
}

void SyncScheduler::schedule_retry(std::chrono::milliseconds delay) {
  retry_timer_.expires_after(delay);
  retry_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    if (!online_.load(std::memory_order_acquire)) {
      LOG_SYNC_DEBUG("Skipping retry sync: offline");
      return;
    }
    StartWork(SyncTrigger::Retry, true, false);
  });
}

void SyncScheduler::schedule_queue_retry(std::chrono::milliseconds delay) {
  queue_retry_timer_.expires_after(delay);
  queue_retry_timer_.async_wait([this](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    if (!online_.load(std::memory_order_acquire)) {
      return;
    }
    StartWork(SyncTrigger::QueueRetry, false, true);
  });
}

void SyncScheduler::cancel_timers() {
  debounce_timer_.cancel();
  periodic_timer_.cancel();
  retry_timer_.cancel();
  queue_retry_timer_.cancel();
}

} // namespace sync
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "queue/offline_job.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace offsync {
namespace queue {

/**
 * OfflineQueue - persisted list of deferred jobs with handler dispatch
 *
 * Job lifecycle:
 *   Pending -> Processing -> Completed (purged after the drain)
 *                         -> Pending   (failed attempt, attempts < max_attempts)
 *                         -> Failed    (attempts exhausted, session cap hit,
 *                                       or a non-retryable result)
 *   Pending/Processing -> Cancelled    (Cancel())
 *
 * Handler registry:
 * - One handler per JobType; registering again replaces it
 * - Handlers are process-local and never persisted
 * - Jobs without a handler are skipped and stay Pending, as are jobs
 *   loaded with a type this build does not know (see OfflineJob::foreign_type)
 * - A non-retryable JobResult fails the job at once
 * - Handlers may throw; the exception counts as a failed attempt
 *
 * Persistence: the whole list is rewritten to Config::path after every
 * mutation using util::atomic_write_file. A failed write is logged and the
 * in-memory state is kept. An empty path disables persistence.
 *
 * Thread-safety: all methods are thread-safe. ProcessQueue() is
 * single-in-flight; a concurrent call returns immediately. Handlers run
 * without the lock held, one at a time, in FIFO order.
 */
class OfflineQueue {
public:
  struct Config {
    std::filesystem::path path;  // offline_queue.json; empty = memory only
    int max_session_retries{50};
    std::chrono::milliseconds backoff_base{std::chrono::seconds(1)};
    std::chrono::milliseconds backoff_max{std::chrono::seconds(60)};
  };

  OfflineQueue();
  explicit OfflineQueue(const Config &config);

  OfflineQueue(const OfflineQueue &) = delete;
  OfflineQueue &operator=(const OfflineQueue &) = delete;

  /**
   * Load jobs from Config::path, replacing the in-memory list
   *
   * A missing file is an empty queue. A corrupt file is moved aside.
   * Jobs left in Processing by a crash are reset to Pending.
   *
   * @return false if the file existed but could not be used
   */
  bool Load();

  /**
   * Append a Pending job. Never fails at the API level; a failed write is
   * logged and the job is kept in memory.
   */
  JobId Enqueue(JobType type, JobPayload payload, int max_attempts = 3);

  /**
   * Cancel a Pending job, or a Processing job whose handler has not returned
   * (its result is then discarded). False for unknown or finished jobs.
   */
  bool Cancel(const JobId &id);

  /**
   * Run every job that is Pending at call time, in FIFO order
   */
  DrainStats ProcessQueue();

  QueueStatus GetStatus() const;
  std::optional<OfflineJob> GetJob(const JobId &id) const;
  std::vector<OfflineJob> GetJobsByType(JobType type) const;
  std::vector<OfflineJob> GetAllJobs() const;
  size_t Size() const;

  // Failed -> Pending with attempts reset. Returns the number of jobs reset.
  size_t RetryFailed();

  // Remove Completed, Failed and Cancelled jobs. Returns the number removed.
  size_t ClearFinished();

  // Remove every job
  void ClearQueue();

  /**
   * Register the handler for a job type (replaces an existing one)
   * Empty handlers are rejected.
   */
  void RegisterHandler(JobType type, JobHandler handler);
  void UnregisterHandler(JobType type);
  bool HasHandler(JobType type) const;

  void ResetSessionRetries();
  int GetSessionRetries() const;

  bool IsProcessing() const { return draining_.load(std::memory_order_acquire); }

  /**
   * min(base * 2^attempts, max)
   */
  static std::chrono::milliseconds BackoffDelay(int attempts, std::chrono::milliseconds base,
                                                std::chrono::milliseconds max);

private:
  using JobList = std::vector<OfflineJob>;

  // Caller holds mutex_
  JobList::iterator FindLocked(const JobId &id);
  JobList::const_iterator FindLocked(const JobId &id) const;
  bool SaveLocked() const;

  // Apply a handler's result to the job; caller holds mutex_
  void RecordResultLocked(OfflineJob &job, const JobResult &result, DrainStats &stats,
                          int &max_retry_attempts);

  const Config config_;

  mutable std::mutex mutex_;
  JobList jobs_;  // Insertion order == FIFO order
  std::set<JobId> cancel_requested_;
  std::map<JobType, JobHandler> handlers_;
  int session_retries_{0};

  std::atomic<bool> draining_{false};
};

} // namespace queue
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "queue/offline_queue.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <iterator>

namespace offsync {
namespace queue {

using json = nlohmann::json;

namespace {

constexpr int kQueueFileVersion = 1;
constexpr const char *kSessionCapError = "Max session retries exceeded";

JobId NewJobId() {
  static thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

} // namespace

OfflineQueue::OfflineQueue() : OfflineQueue(Config{}) {}

OfflineQueue::OfflineQueue(const Config &config) : config_(config) {}

std::chrono::milliseconds OfflineQueue::BackoffDelay(int attempts, std::chrono::milliseconds base,
                                                     std::chrono::milliseconds max) {
  if (attempts < 0) {
    attempts = 0;
  }
  // Large attempt counts saturate at the cap
  if (attempts >= 30) {
    return max;
  }
  auto delay = base * (int64_t{1} << attempts);
  return std::min<std::chrono::milliseconds>(delay, max);
}

bool OfflineQueue::Load() {
  if (config_.path.empty()) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto &path = config_.path;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_QUEUE_DEBUG("No offline queue at {}", path.string());
    jobs_.clear();
    return true;
  }

  auto content = util::read_file_string(path);
  if (!content) {
    LOG_QUEUE_ERROR("Failed to read offline queue {}", path.string());
    return false;
  }

  json root = json::parse(*content, nullptr, false);
  if (root.is_discarded() || !root.is_object() || root.value("version", 0) != kQueueFileVersion ||
      !root.contains("jobs") || !root["jobs"].is_array()) {
    LOG_QUEUE_WARN("Invalid offline queue file format/version: {}", path.string());
    if (auto moved = util::quarantine_file(path)) {
      LOG_QUEUE_WARN("Moved unreadable queue to {}", moved->string());
    }
    jobs_.clear();
    return false;
  }

  JobList loaded;
  size_t recovered = 0;
  for (const auto &job_json : root["jobs"]) {
    auto job = JobFromJson(job_json);
    if (!job) {
      LOG_QUEUE_WARN("Skipping malformed job entry in {}", path.string());
      continue;
    }
    if (job->status == JobStatus::Processing) {
      // Interrupted mid-handler by a crash or kill
      job->status = JobStatus::Pending;
      ++recovered;
    }
    loaded.push_back(std::move(*job));
  }

  jobs_ = std::move(loaded);
  LOG_QUEUE_INFO("Loaded {} offline jobs from {} ({} recovered from processing)", jobs_.size(),
                 path.string(), recovered);
  if (recovered > 0) {
    SaveLocked();
  }
  return true;
}

bool OfflineQueue::SaveLocked() const {
  if (config_.path.empty()) {
    return true;
  }

  json jobs_array = json::array();
  for (const auto &job : jobs_) {
    jobs_array.push_back(JobToJson(job));
  }
  json root;
  root["version"] = kQueueFileVersion;
  root["jobs"] = std::move(jobs_array);

  if (!util::atomic_write_file(config_.path, root.dump(2), 0600)) {
    LOG_QUEUE_ERROR("Failed to save offline queue to {}", config_.path.string());
    return false;
  }
  return true;
}

OfflineQueue::JobList::iterator OfflineQueue::FindLocked(const JobId &id) {
  return std::find_if(jobs_.begin(), jobs_.end(),
                      [&id](const OfflineJob &job) { return job.id == id; });
}

OfflineQueue::JobList::const_iterator OfflineQueue::FindLocked(const JobId &id) const {
  return std::find_if(jobs_.begin(), jobs_.end(),
                      [&id](const OfflineJob &job) { return job.id == id; });
}

JobId OfflineQueue::Enqueue(JobType type, JobPayload payload, int max_attempts) {
  OfflineJob job;
  job.id = NewJobId();
  job.type = type;
  job.payload = std::move(payload);
  job.status = JobStatus::Pending;
  job.max_attempts = std::max(1, max_attempts);
  job.created_at = util::GetTimeMillis();
  job.updated_at = job.created_at;

  std::lock_guard<std::mutex> lock(mutex_);
  jobs_.push_back(job);
  SaveLocked();
  LOG_QUEUE_INFO("Enqueued {} job {}", JobTypeToString(type), job.id);
  return job.id;
}

bool OfflineQueue::Cancel(const JobId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = FindLocked(id);
  if (it == jobs_.end()) {
    return false;
  }

  switch (it->status) {
  case JobStatus::Pending:
    it->status = JobStatus::Cancelled;
    it->updated_at = util::GetTimeMillis();
    SaveLocked();
    LOG_QUEUE_INFO("Cancelled job {}", id);
    return true;
  case JobStatus::Processing:
    // Resolved when the handler returns
    if (!cancel_requested_.insert(id).second) {
      return false;
    }
    LOG_QUEUE_INFO("Cancellation requested for running job {}", id);
    return true;
  case JobStatus::Completed:
  case JobStatus::Failed:
  case JobStatus::Cancelled:
    return false;
  }
  return false;
}

void OfflineQueue::RecordResultLocked(OfflineJob &job, const JobResult &result,
                                      DrainStats &stats, int &max_retry_attempts) {
  job.updated_at = util::GetTimeMillis();

  if (cancel_requested_.erase(job.id) > 0) {
    job.status = JobStatus::Cancelled;
    ++stats.cancelled;
    LOG_QUEUE_INFO("Job {} cancelled while running; result discarded", job.id);
    return;
  }

  if (result.success) {
    job.status = JobStatus::Completed;
    job.last_error.reset();
    ++stats.succeeded;
    LOG_QUEUE_DEBUG("Job {} completed", job.id);
    return;
  }

  ++job.attempts;
  job.last_error = result.error;

  if (!result.retryable) {
    job.status = JobStatus::Failed;
    ++stats.failed;
    LOG_QUEUE_WARN("Job {} failed without retry: {}", job.id, result.error);
    return;
  }

  if (job.attempts >= job.max_attempts) {
    job.status = JobStatus::Failed;
    ++stats.failed;
    LOG_QUEUE_WARN("Job {} failed permanently after {} attempts: {}", job.id, job.attempts,
                   result.error);
    return;
  }

  if (session_retries_ >= config_.max_session_retries) {
    job.status = JobStatus::Failed;
    job.last_error = kSessionCapError;
    ++stats.failed;
    LOG_QUEUE_WARN("Job {} failed: {}", job.id, kSessionCapError);
    return;
  }

  ++session_retries_;
  job.status = JobStatus::Pending;
  ++stats.retried;
  max_retry_attempts = std::max(max_retry_attempts, job.attempts);
  LOG_QUEUE_DEBUG("Job {} failed (attempt {}/{}): {}", job.id, job.attempts, job.max_attempts,
                  result.error);
}

DrainStats OfflineQueue::ProcessQueue() {
  DrainStats stats;

  bool expected = false;
  if (!draining_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    stats.already_running = true;
    return stats;
  }

  struct DrainGuard {
    std::atomic<bool> &flag;
    ~DrainGuard() { flag.store(false, std::memory_order_release); }
  } guard{draining_};

  // Jobs enqueued during the drain wait for the next one
  std::vector<JobId> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &job : jobs_) {
      if (job.status == JobStatus::Pending) {
        snapshot.push_back(job.id);
      }
    }
  }

  int max_retry_attempts = 0;

  for (const auto &id : snapshot) {
    JobHandler handler;
    OfflineJob job_copy;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = FindLocked(id);
      if (it == jobs_.end() || it->status != JobStatus::Pending) {
        // Cancelled or cleared since the snapshot
        continue;
      }
      if (!it->foreign_type.empty()) {
        LOG_QUEUE_TRACE("Leaving job {} of unknown type \"{}\"", id, it->foreign_type);
        ++stats.skipped;
        continue;
      }
      auto handler_it = handlers_.find(it->type);
      if (handler_it == handlers_.end()) {
        LOG_QUEUE_TRACE("No handler for {} job {}", JobTypeToString(it->type), id);
        ++stats.skipped;
        continue;
      }
      handler = handler_it->second;
      it->status = JobStatus::Processing;
      it->updated_at = util::GetTimeMillis();
      job_copy = *it;
      SaveLocked();
    }

    // Execute handler outside the lock (handlers may take time)
    ++stats.processed;
    JobResult result;
    try {
      result = handler(job_copy);
    } catch (const std::exception &e) {
      LOG_QUEUE_ERROR("Handler exception for {} job {}: {}", JobTypeToString(job_copy.type), id,
                      e.what());
      result = JobResult::Fail(e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = FindLocked(id);
    if (it == jobs_.end()) {
      // ClearQueue() ran while the handler was busy
      cancel_requested_.erase(id);
      continue;
    }
    RecordResultLocked(*it, result, stats, max_retry_attempts);
    SaveLocked();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto completed = std::remove_if(jobs_.begin(), jobs_.end(), [](const OfflineJob &job) {
      return job.status == JobStatus::Completed;
    });
    bool purged = completed != jobs_.end();
    jobs_.erase(completed, jobs_.end());

    bool any_pending = std::any_of(jobs_.begin(), jobs_.end(), [](const OfflineJob &job) {
      return job.status == JobStatus::Pending;
    });
    if (!any_pending) {
      session_retries_ = 0;
    }
    if (purged) {
      SaveLocked();
    }
  }

  if (stats.retried > 0) {
    stats.retry_delay = BackoffDelay(max_retry_attempts, config_.backoff_base, config_.backoff_max);
  }
  return stats;
}

QueueStatus OfflineQueue::GetStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueStatus status;
  for (const auto &job : jobs_) {
    switch (job.status) {
    case JobStatus::Pending:
      ++status.pending;
      break;
    case JobStatus::Processing:
      ++status.processing;
      break;
    case JobStatus::Failed:
      ++status.failed;
      break;
    case JobStatus::Completed:
    case JobStatus::Cancelled:
      break;
    }
  }
  return status;
}

std::optional<OfflineJob> OfflineQueue::GetJob(const JobId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = FindLocked(id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::vector<OfflineJob> OfflineQueue::GetJobsByType(JobType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<OfflineJob> out;
  std::copy_if(jobs_.begin(), jobs_.end(), std::back_inserter(out),
               [type](const OfflineJob &job) { return job.type == type; });
  return out;
}

std::vector<OfflineJob> OfflineQueue::GetAllJobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_;
}

size_t OfflineQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

size_t OfflineQueue::RetryFailed() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  const int64_t now = util::GetTimeMillis();
  for (auto &job : jobs_) {
    if (job.status == JobStatus::Failed) {
      job.status = JobStatus::Pending;
      job.attempts = 0;
      job.last_error.reset();
      job.updated_at = now;
      ++count;
    }
  }
  if (count > 0) {
    SaveLocked();
    LOG_QUEUE_INFO("Reset {} failed jobs to pending", count);
  }
  return count;
}

size_t OfflineQueue::ClearFinished() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto finished = std::remove_if(jobs_.begin(), jobs_.end(),
                                 [](const OfflineJob &job) { return job.IsFinished(); });
  size_t removed = static_cast<size_t>(std::distance(finished, jobs_.end()));
  jobs_.erase(finished, jobs_.end());
  if (removed > 0) {
    SaveLocked();
  }
  return removed;
}

void OfflineQueue::ClearQueue() {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_.clear();
  cancel_requested_.clear();
  SaveLocked();
  LOG_QUEUE_INFO("Offline queue cleared");
}

void OfflineQueue::RegisterHandler(JobType type, JobHandler handler) {
  // Reject empty handlers (prevent std::bad_function_call)
  if (!handler) {
    LOG_QUEUE_ERROR("Attempted to register empty handler for {}", JobTypeToString(type));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[type] = std::move(handler);
  LOG_QUEUE_DEBUG("Registered handler for {}", JobTypeToString(type));
}

void OfflineQueue::UnregisterHandler(JobType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(type) > 0) {
    LOG_QUEUE_DEBUG("Unregistered handler for {}", JobTypeToString(type));
  }
}

bool OfflineQueue::HasHandler(JobType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(type) > 0;
}

void OfflineQueue::ResetSessionRetries() {
  std::lock_guard<std::mutex> lock(mutex_);
  session_retries_ = 0;
}

int OfflineQueue::GetSessionRetries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_retries_;
}

} // namespace queue
} // namespace offsync

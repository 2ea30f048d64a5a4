// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace offsync {
namespace util {

/**
 * Worker pool for blocking work that must stay off the io_context thread
 *
 * The sync scheduler runs a pool of exactly one thread: sync rounds and queue
 * drains are executed strictly one after another in submission order.
 *
 * - Exceptions thrown by a task are logged and never kill the worker
 * - shutdown() stops accepting work; already queued tasks still run
 * - The destructor shuts down and joins
 *
 * Usage:
 *   ThreadPool pool(1, "sync");
 *   auto future = pool.enqueue([] { return 42; });
 *   pool.try_post([] { do_work(); });
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = hardware concurrency)
   * @param name Label used in log messages
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   */
  explicit ThreadPool(size_t num_threads = 0, std::string name = "pool",
                      size_t max_queue_size = 0);

  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /**
   * Enqueue a task and get a future for its result
   * @throws std::runtime_error if pool is stopped or queue is full
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  /**
   * Fire-and-forget submission
   * @return false if the pool is stopped or full (task not queued)
   */
  bool try_post(std::function<void()> task);

  /**
   * Stop accepting new tasks (pending tasks will still execute)
   * Safe to call multiple times
   */
  void shutdown();

  /**
   * Join all workers. Call after shutdown().
   */
  void wait_for_completion();

  size_t size() const { return workers_.size(); }

  size_t pending_tasks() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  bool is_stopped() const {
    return stop_.load(std::memory_order_acquire);
  }

  size_t tasks_completed() const {
    return tasks_completed_.load(std::memory_order_relaxed);
  }

  size_t task_exceptions() const {
    return task_exceptions_.load(std::memory_order_relaxed);
  }

private:
  // Returns false if the task was rejected; caller holds no lock
  bool push_task(std::function<void()> task);

  void worker_loop(size_t index);

  std::string name_;
  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> tasks_;
  size_t max_queue_size_;  // 0 = unlimited

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_{false};

  std::atomic<size_t> tasks_completed_{0};
  std::atomic<size_t> task_exceptions_{0};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  if (!push_task([task]() { (*task)(); })) {
    throw std::runtime_error("enqueue on stopped or full ThreadPool");
  }
  return res;
}

} // namespace util
} // namespace offsync

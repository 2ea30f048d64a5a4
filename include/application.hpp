// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include "queue/offline_queue.hpp"
#include "sync/events.hpp"
#include "sync/file_change_log.hpp"
#include "sync/http_transport.hpp"
#include "sync/sync_client.hpp"
#include "sync/sync_scheduler.hpp"
#include "util/files.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace offsync {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (changelog.json, offline_queue.json, debug.log)
  std::filesystem::path datadir;

  // Remote server
  sync::HttpTransport::Config transport_config;

  // File holding the bearer token; re-read for every request so an external
  // process can refresh it. Empty = $OFFSYNC_AUTH_TOKEN.
  std::filesystem::path token_file;

  sync::SyncClient::Config client_config;
  sync::SyncScheduler::Config scheduler_config;
  queue::OfflineQueue::Config queue_config;

  // Logging
  bool verbose = false;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - owns the sync subsystem
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
//
// Signals:
// - SIGINT/SIGTERM: graceful shutdown
// - SIGUSR1: manual sync
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  sync::SyncScheduler &scheduler() { return *scheduler_; }
  sync::AppEvents &events() { return events_; }
  sync::FileChangeLog &change_log() { return *change_log_; }
  queue::OfflineQueue &offline_queue() { return *queue_; }

  bool is_running() const { return running_; }

  void request_shutdown() { shutdown_requested_ = true; }
  void request_sync() { sync_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> sync_requested_{false};

  // Reactor for the scheduler's timers, run on io_thread_
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;

  // Components (initialized in order, destroyed in reverse)
  sync::AppEvents events_;
  std::unique_ptr<sync::FileChangeLog> change_log_;
  std::unique_ptr<sync::HttpTransport> transport_;
  std::unique_ptr<sync::SyncClient> client_;
  std::unique_ptr<queue::OfflineQueue> queue_;
  std::unique_ptr<sync::SyncScheduler> scheduler_;

  // IMPORTANT: Must be declared AFTER components so they are destroyed BEFORE
  sync::AppEvents::Subscription sync_completed_sub_;
  sync::AppEvents::Subscription auth_required_sub_;

  // Initialization steps
  bool init_datadir();
  bool init_storage();
  bool init_sync();
  void register_job_handlers();

  std::optional<std::string> read_token() const;

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace offsync

// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "queue/job_handlers.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace offsync {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  const auto &server = config_.transport_config;
  std::cout << GetStartupBanner("http://" + server.host + ":" + std::to_string(server.port) +
                                server.base_path)
            << std::flush;

  LOG_INFO("Initializing offsyncd...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_storage()) {
    LOG_ERROR("Failed to initialize local storage");
    return false;
  }

  if (!init_sync()) {
    LOG_ERROR("Failed to initialize sync subsystem");
    return false;
  }

  sync_completed_sub_ = events_.SubscribeSyncCompleted(
      [](sync::SyncTrigger trigger, const sync::SyncRound &round) {
        LOG_APP_INFO("Sync ({}) finished: {}, pulled {}, pushed {}",
                     sync::SyncTriggerName(trigger), sync::SyncOutcomeName(round.outcome),
                     sync::CountChanges(round.pulled), sync::CountChanges(round.pushed));
      });

  auth_required_sub_ = events_.SubscribeAuthRequired([](const sync::SyncError &error) {
    LOG_APP_WARN("Server rejected the credential (HTTP {}): sign in again to resume sync",
                 error.http_status);
  });

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting offsyncd...");

  setup_signal_handlers();

  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));
  io_thread_ = std::thread([this]() { io_context_.run(); });

  if (!scheduler_->Initialize()) {
    LOG_ERROR("Failed to start sync scheduler");
    return false;
  }

  running_ = true;

  LOG_INFO("offsyncd started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Send SIGUSR1 to sync now, Ctrl+C to stop");

  // Catch up right away, as if the app had just come to the foreground
  events_.NotifyAppStateChanged(true);
  return true;
}

void Application::stop() {
  // start() may have spun up the reactor before failing
  if (!running_ && !io_thread_.joinable()) {
    return;
  }

  running_ = true;
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    if (sync_requested_.exchange(false)) {
      if (!scheduler_->TriggerManualSync()) {
        LOG_APP_INFO("Manual sync ignored: a sync is already running");
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down offsyncd...");

  running_ = false;

  // Unsubscribe from notifications BEFORE stopping components
  sync_completed_sub_.Unsubscribe();
  auth_required_sub_.Unsubscribe();

  // Waits for an in-flight round or drain
  if (scheduler_) {
    LOG_INFO("Stopping sync scheduler...");
    scheduler_->Shutdown();
  }

  work_guard_.reset();
  io_context_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  if (change_log_) {
    change_log_->SetChangeListener({});
  }

  LOG_INFO("Releasing data directory lock...");
  util::UnlockDirectory(config_.datadir, ".lock");

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Two processes must never share one queue file
  util::LockResult lock_result = util::LockDirectory(config_.datadir, ".lock");

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "offsyncd is probably already running.",
              config_.datadir.string());
    return false;
  }

  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_storage() {
  LOG_INFO("Loading local change log...");
  change_log_ = std::make_unique<sync::FileChangeLog>(config_.datadir / "changelog.json");
  if (!change_log_->Load()) {
    LOG_WARN("Change log could not be loaded; starting from an empty log");
  }

  LOG_INFO("Loading offline queue...");
  queue::OfflineQueue::Config queue_config = config_.queue_config;
  if (queue_config.path.empty()) {
    queue_config.path = config_.datadir / "offline_queue.json";
  }
  queue_ = std::make_unique<queue::OfflineQueue>(queue_config);
  if (!queue_->Load()) {
    LOG_WARN("Offline queue could not be loaded; starting with an empty queue");
  }
  return true;
}

std::optional<std::string> Application::read_token() const {
  if (!config_.token_file.empty()) {
    auto content = util::read_file_string(config_.token_file);
    if (!content) {
      return std::nullopt;
    }
    std::string token = *content;
    while (!token.empty() && (token.back() == '\n' || token.back() == '\r' || token.back() == ' ')) {
      token.pop_back();
    }
    return token;
  }

  const char *env = std::getenv("OFFSYNC_AUTH_TOKEN");
  if (env && *env) {
    return std::string(env);
  }
  return std::nullopt;
}

bool Application::init_sync() {
  LOG_INFO("Initializing sync subsystem...");

  sync::HttpTransport::Config transport_config = config_.transport_config;
  transport_config.user_agent = GetUserAgent();
  transport_ = std::make_unique<sync::HttpTransport>(transport_config,
                                                     [this]() { return read_token(); });

  client_ = std::make_unique<sync::SyncClient>(*change_log_, *transport_, config_.client_config);

  scheduler_ = std::make_unique<sync::SyncScheduler>(io_context_, *client_, *queue_, events_,
                                                     config_.scheduler_config);

  register_job_handlers();

  // Local writes feed the scheduler through the event hub
  change_log_->SetChangeListener([this](const std::string &collection, const sync::RecordId &id) {
    events_.NotifyRecordChanged(collection, id);
  });

  size_t pending = change_log_->CountPendingChanges();
  scheduler_->SetPendingLocalChanges(pending);
  LOG_INFO("{} local changes waiting to be pushed, {} offline jobs pending", pending,
           queue_->GetStatus().pending);
  return true;
}

void Application::register_job_handlers() {
  queue_->RegisterHandler(queue::JobType::ContactsImport,
                          queue::MakeContactsImportHandler(*transport_));
  queue_->RegisterHandler(queue::JobType::RecordSync,
                          queue::MakeRecordSyncHandler(*client_, *queue_));
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  std::signal(SIGUSR1, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  if (!instance_) {
    return;
  }

  if (signal == SIGUSR1) {
    instance_->sync_requested_ = true;
    return;
  }

  // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
  const char *msg = "\nReceived signal\n";
  ssize_t written = write(STDOUT_FILENO, msg, 17);
  (void)written;

  instance_->shutdown_requested_ = true;
}

} // namespace app
} // namespace offsync

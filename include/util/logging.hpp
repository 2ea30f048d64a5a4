// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace offsync {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "sync", "queue", "net", "app"),
 * all sharing the same sinks.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "offsync.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "sync", "queue", "net")
   *
   * Auto-initializes if not initialized. Unknown names fall back to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (sync, queue, net, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace offsync

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  offsync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  offsync::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  offsync::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  offsync::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  offsync::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_SYNC_TRACE(...)                                                    \
  offsync::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  offsync::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  offsync::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  offsync::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...)                                                    \
  offsync::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_QUEUE_TRACE(...)                                                   \
  offsync::util::LogManager::GetLogger("queue")->trace(__VA_ARGS__)
#define LOG_QUEUE_DEBUG(...)                                                   \
  offsync::util::LogManager::GetLogger("queue")->debug(__VA_ARGS__)
#define LOG_QUEUE_INFO(...)                                                    \
  offsync::util::LogManager::GetLogger("queue")->info(__VA_ARGS__)
#define LOG_QUEUE_WARN(...)                                                    \
  offsync::util::LogManager::GetLogger("queue")->warn(__VA_ARGS__)
#define LOG_QUEUE_ERROR(...)                                                   \
  offsync::util::LogManager::GetLogger("queue")->error(__VA_ARGS__)

#define LOG_NET_TRACE(...)                                                     \
  offsync::util::LogManager::GetLogger("net")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  offsync::util::LogManager::GetLogger("net")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  offsync::util::LogManager::GetLogger("net")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  offsync::util::LogManager::GetLogger("net")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  offsync::util::LogManager::GetLogger("net")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  offsync::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  offsync::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  offsync::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

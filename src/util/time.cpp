// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace offsync {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time_ms{0};

int64_t GetTimeMillis() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t GetTime() { return GetTimeMillis() / 1000; }

void SetMockTime(int64_t time_ms) {
  g_mock_time_ms.store(time_ms, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time_ms.load(std::memory_order_relaxed); }

std::string FormatTimeMillis(int64_t unix_time_ms) {
  if (unix_time_ms < 0) {
    return "invalid";
  }

  std::time_t t = static_cast<std::time_t>(unix_time_ms / 1000);
  int millis = static_cast<int>(unix_time_ms % 1000);

  std::tm tm_utc;
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }

  char date[32];
  if (std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_utc) == 0) {
    return "invalid";
  }

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s.%03d UTC", date, millis);
  return std::string(buf);
}

} // namespace util
} // namespace offsync

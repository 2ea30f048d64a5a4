// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace offsync {
namespace util {

/**
 * Mockable wall clock
 *
 * Sync cursors, job timestamps and trigger policy all read the clock through
 * these functions so tests can move time without sleeping.
 *
 * - Production code calls GetTimeMillis() / GetTime()
 * - Tests call SetMockTime() (or use MockTimeScope) to pin the clock
 * - A mock value of 0 means "use the real system clock"
 *
 * Timers on the io_context still run on the real steady clock; only policy
 * checks ("has 5 minutes passed since the last sync?") see mock time.
 */

/**
 * Current time in milliseconds since the Unix epoch
 * Returns mock time if set, otherwise real system time
 */
int64_t GetTimeMillis();

/**
 * Current time in seconds since the Unix epoch (GetTimeMillis() / 1000)
 */
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time_ms Unix timestamp in milliseconds (0 to disable mocking)
 *
 * Mock time does not advance on its own; tests call SetMockTime() again.
 */
void SetMockTime(int64_t time_ms);

/**
 * Current mock time setting in milliseconds, 0 if disabled
 */
int64_t GetMockTime();

/**
 * Format a millisecond timestamp as "YYYY-MM-DD HH:MM:SS.mmm UTC"
 *
 * Example: FormatTimeMillis(1729868000123) -> "2024-10-25 14:53:20.123 UTC"
 */
std::string FormatTimeMillis(int64_t unix_time_ms);

/**
 * RAII helper to set mock time and restore the previous setting on scope exit
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time_ms) : previous_time_(GetMockTime()) {
    SetMockTime(time_ms);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace offsync

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace deadlock {
namespace util {

/**
 * Mockable wall clock for testing
 *
 * Production code calls GetTime() instead of reading the system clock
 * directly, so tests can pin "now" (ledger last_seen, eviction age) with
 * SetMockTime() or MockTimeScope. Timers and measured durations keep using
 * std::chrono::steady_clock and are never mocked.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Get current time as Unix timestamp in milliseconds
 * Returns mock time (scaled to ms) if set, otherwise real system time
 */
int64_t GetTimeMillis();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 *
 * Example: FormatTime(1729868000) -> "2024-10-25 14:53:20 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * Format a Unix timestamp in milliseconds as ISO 8601 UTC
 *
 * Example: FormatTimeMillis(1729868000123) -> "2024-10-25T14:53:20.123Z"
 */
std::string FormatTimeMillis(int64_t unix_time_ms);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
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
} // namespace deadlock

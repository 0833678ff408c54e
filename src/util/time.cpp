// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace deadlock {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t GetTimeMillis() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock * 1000;
  }

  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

static bool ToUtc(int64_t unix_time, std::tm &tm_utc) {
  std::time_t t = static_cast<std::time_t>(unix_time);
#if defined(_WIN32)
  return gmtime_s(&tm_utc, &t) == 0;
#else
  return gmtime_r(&t, &tm_utc) != nullptr;
#endif
}

std::string FormatTime(int64_t unix_time) {
  std::tm tm_utc;
  if (!ToUtc(unix_time, tm_utc)) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

std::string FormatTimeMillis(int64_t unix_time_ms) {
  // Floor division so pre-epoch values still yield a valid millisecond part
  int64_t seconds = unix_time_ms / 1000;
  int64_t millis = unix_time_ms % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::tm tm_utc;
  if (!ToUtc(seconds, tm_utc)) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

} // namespace util
} // namespace deadlock

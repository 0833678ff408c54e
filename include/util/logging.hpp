// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace deadlock {
namespace util {

/**
 * Log sink settings
 *
 * File logging uses a size-based rotating sink: when the active file exceeds
 * max_file_size bytes it is renamed to <file>.1, older backups shift up, and
 * at most max_files backups are kept.
 */
struct LogSettings {
  std::string level = "info";
  bool log_to_file = false;
  std::string file_path = "honeypot.log";
  size_t max_file_size = 10 * 1024 * 1024;
  size_t max_files = 5;
  bool log_to_console = true;
};

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the application.
 *
 * Thread-safety: All methods are thread-safe. Logger access is
 * protected by mutex for safe concurrent use.
 *
 * The "event" component carries session records and stays at info
 * whatever the configured level; only SetComponentLevel("event", ...)
 * changes it.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param settings Level, console and rotating file configuration
   *
   * Thread-safe. Calls while logging is active are no-ops; a call after
   * Shutdown() opens the sinks again.
   */
  static void Initialize(const LogSettings &settings = LogSettings{});

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Thread-safe: Protected by mutex. Safe to call from any thread.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("tarpit", "stats", "app", "event", "default")
   *
   * Thread-safe: Protected by mutex. Auto-initializes if not initialized.
   * Returns cached logger for performance.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components except "event")
   *
   * Thread-safe: Protected by mutex.
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   *
   * Thread-safe: Protected by mutex.
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);

  /**
   * Check a level name against spdlog's level names
   * (trace, debug, info, warn, error, critical, off)
   */
  static bool IsValidLevel(const std::string &level);
};

} // namespace util
} // namespace deadlock

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  deadlock::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  deadlock::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  deadlock::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  deadlock::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  deadlock::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_TARPIT_TRACE(...)                                                  \
  deadlock::util::LogManager::GetLogger("tarpit")->trace(__VA_ARGS__)
#define LOG_TARPIT_DEBUG(...)                                                  \
  deadlock::util::LogManager::GetLogger("tarpit")->debug(__VA_ARGS__)
#define LOG_TARPIT_INFO(...)                                                   \
  deadlock::util::LogManager::GetLogger("tarpit")->info(__VA_ARGS__)
#define LOG_TARPIT_WARN(...)                                                   \
  deadlock::util::LogManager::GetLogger("tarpit")->warn(__VA_ARGS__)
#define LOG_TARPIT_ERROR(...)                                                  \
  deadlock::util::LogManager::GetLogger("tarpit")->error(__VA_ARGS__)

#define LOG_STATS_DEBUG(...)                                                   \
  deadlock::util::LogManager::GetLogger("stats")->debug(__VA_ARGS__)
#define LOG_STATS_INFO(...)                                                    \
  deadlock::util::LogManager::GetLogger("stats")->info(__VA_ARGS__)
#define LOG_STATS_WARN(...)                                                    \
  deadlock::util::LogManager::GetLogger("stats")->warn(__VA_ARGS__)
#define LOG_STATS_ERROR(...)                                                   \
  deadlock::util::LogManager::GetLogger("stats")->error(__VA_ARGS__)

#define LOG_EVENT_INFO(...)                                                    \
  deadlock::util::LogManager::GetLogger("event")->info(__VA_ARGS__)

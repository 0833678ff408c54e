// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace deadlock {
namespace util {

// Lifecycle: Initialize() is a no-op while ACTIVE; after Shutdown() it
// may run again (tests reopen the log with different sinks)
enum class InitState { UNINITIALIZED, ACTIVE, SHUT_DOWN };
static std::mutex s_init_mutex;
static InitState s_init_state = InitState::UNINITIALIZED;

// Mutex protecting s_loggers map access (all reads and writes)
static std::mutex s_loggers_mutex;
static std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

static constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Event records are persisted at info regardless of the diagnostic level
static constexpr const char *EVENT_COMPONENT = "event";

// Internal initialization function (called under s_init_mutex)
static void InitializeInternal(const LogSettings &settings) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (settings.log_to_file) {
      namespace fs = std::filesystem;
      try {
        fs::path p = settings.file_path.empty() ? fs::path("honeypot.log")
                                                : fs::path(settings.file_path);
        if (p.has_parent_path() && !p.parent_path().empty()) {
          std::error_code dir_ec;
          fs::create_directories(p.parent_path(), dir_ec);
          if (dir_ec) {
            std::cerr << "Cannot create log directory " << p.parent_path()
                      << ": " << dir_ec.message() << "\n";
          }
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            p.string(), settings.max_file_size, settings.max_files);
        file_sink->set_pattern(LOG_PATTERN);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize file logger (" << ex.what()
                  << "), falling back to console logging\n";
      }
    }

    // Console sink whenever requested, or when the file sink could not be opened
    if (settings.log_to_console || sinks.empty()) {
      auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern(LOG_PATTERN);
      sinks.push_back(console_sink);
    }

    std::vector<std::string> components = {"default", "tarpit", "stats", "app",
                                           "event"};

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    for (const auto &component : components) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      if (component == EVENT_COMPONENT) {
        logger->set_level(spdlog::level::info);
      } else {
        logger->set_level(spdlog::level::from_str(settings.level));
      }

      // Flush every message so `tail -f` on the honeypot log stays live
      logger->flush_on(spdlog::level::trace);

      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    // Direct logger access (cannot use LOG_INFO macro - would deadlock on mutex)
    if (settings.level != "off") {
      s_loggers["default"]->info("Logging system initialized (level: {})",
                                 settings.level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Initialize(const LogSettings &settings) {
  std::lock_guard<std::mutex> init_lock(s_init_mutex);
  if (s_init_state == InitState::ACTIVE) {
    return;
  }
  InitializeInternal(settings);
  s_init_state = InitState::ACTIVE;
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> init_lock(s_init_mutex);
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  spdlog::shutdown();
  s_loggers.clear();
  s_init_state = InitState::SHUT_DOWN;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  // Auto-initialize with defaults on first use only; after Shutdown the
  // silent fallback below is used instead
  {
    std::lock_guard<std::mutex> init_lock(s_init_mutex);
    if (s_init_state == InitState::UNINITIALIZED) {
      InitializeInternal(LogSettings{});
      s_init_state = InitState::ACTIVE;
    }
  }

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Loggers are gone (after Shutdown, or failed init): install a silent
  // console logger so late callers never dereference null
  if (s_loggers.empty()) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(LOG_PATTERN);
    auto logger = std::make_shared<spdlog::logger>("default", console_sink);
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    if (name == EVENT_COMPONENT) {
      continue;
    }
    logger->set_level(log_level);
  }

  if (s_loggers.count("default") > 0 && level != "off") {
    s_loggers["default"]->info("Log level changed to: {}", level);
  }
}

void LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto it = s_loggers.find(component);
  if (it != s_loggers.end()) {
    it->second->set_level(spdlog::level::from_str(level));
    if (s_loggers.count("default") > 0 && level != "off") {
      s_loggers["default"]->info("Component '{}' log level set to: {}", component, level);
    }
  } else if (s_loggers.count("default") > 0 &&
             s_loggers["default"]->level() != spdlog::level::off) {
    s_loggers["default"]->warn("Unknown log component: {}", component);
  }
}

bool LogManager::IsValidLevel(const std::string &level) {
  // spdlog::level::from_str maps unknown names to "off", so compare back
  if (level == "off") {
    return true;
  }
  if (level == "warning" || level == "err") {
    return true;
  }
  return spdlog::level::from_str(level) != spdlog::level::off;
}

} // namespace util
} // namespace deadlock

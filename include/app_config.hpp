// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "stats/stats_server.hpp"
#include "tarpit/config.hpp"
#include "util/logging.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace deadlock {
namespace app {

// Application configuration
struct AppConfig {
  // Engine settings (port, delays, banner, limits)
  tarpit::TarpitConfig tarpit;

  // Logging (level, rotating file)
  util::LogSettings logging;

  // Optional HTTP statistics endpoint
  bool enable_http_stats = false;
  stats::StatsSettings stats;

  // Ledger eviction: entries unseen for ledger_max_age are dropped every
  // ledger_sweep_interval (0 = never evict)
  std::chrono::seconds ledger_max_age{0};
  std::chrono::seconds ledger_sweep_interval{60};

  AppConfig() {
    logging.log_to_file = true;
  }
};

/**
 * Load the [honeypot] section of an INI file into config
 *
 * Keys that are absent keep their current value, so the file overrides
 * defaults and the command line overrides the file. A file without a
 * [honeypot] section is accepted and changes nothing.
 *
 * @param path INI file path
 * @param config Updated in place (partially on failure)
 * @param error Set to a diagnostic when false is returned
 * @return false if the file cannot be read or a value does not parse
 */
bool LoadConfigFile(const std::string &path, AppConfig &config, std::string &error);

/**
 * Validate the complete configuration (engine and ambient settings)
 * @return Error message for the first invalid setting, nullopt if valid
 */
std::optional<std::string> ValidateAppConfig(const AppConfig &config);

} // namespace app
} // namespace deadlock

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tarpit/config.hpp"

namespace deadlock {
namespace tarpit {

std::optional<std::string> ValidateConfig(const TarpitConfig &config) {
  if (config.max_connections == 0) {
    return "max_connections must be at least 1";
  }
  if (config.banner.empty()) {
    return "ssh_banner must not be empty";
  }
  if (config.banner.find_first_of("\r\n") != std::string::npos) {
    return "ssh_banner must not contain CR or LF (the line terminator is added on the wire)";
  }
  if (config.banner_delay.count() < 0) {
    return "banner_delay must be >= 0";
  }
  if (config.delay.initial_delay.count() < 0) {
    return "initial_delay must be >= 0";
  }
  if (config.delay.delay_increment.count() < 0) {
    return "delay_increment must be >= 0";
  }
  if (config.delay.max_delay < config.delay.initial_delay) {
    return "max_delay must be >= initial_delay";
  }
  if (config.connection_timeout.count() <= 0) {
    return "connection_timeout must be > 0";
  }
  if (config.max_session_duration.count() <= 0) {
    return "max_session_duration must be > 0";
  }
  if (config.shutdown_grace.count() < 0) {
    return "shutdown_grace must be >= 0";
  }
  if (config.io_threads == 0) {
    return "io_threads must be at least 1";
  }
  return std::nullopt;
}

} // namespace tarpit
} // namespace deadlock

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace deadlock {
namespace tarpit {

// Delay escalation parameters (see ComputeDelay)
struct DelaySettings {
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds delay_increment{2000};
  std::chrono::milliseconds max_delay{60000};
};

// Engine configuration: an immutable snapshot handed to TarpitServer::Start()
struct TarpitConfig {
  // 0 binds an ephemeral port (tests)
  uint16_t port = 2222;
  size_t max_connections = 100;

  // Sent as banner + "\r\n", one byte at a time
  std::string banner = "SSH-2.0-OpenSSH_8.9p1 Ubuntu-3ubuntu0.1";
  std::chrono::milliseconds banner_delay{100};

  DelaySettings delay;

  // Read phase: idle timeout per read, hard ceiling for the whole phase
  std::chrono::milliseconds connection_timeout{std::chrono::seconds(300)};
  std::chrono::milliseconds max_session_duration{std::chrono::seconds(3600)};

  // Peer input kept for the session event; later bytes are counted only
  size_t max_input_length = 1024;

  bool tcp_keepalive = true;

  std::chrono::milliseconds shutdown_grace{std::chrono::seconds(10)};

  size_t io_threads = 2;
};

/**
 * Check every engine invariant
 * @return Error message for the first violated setting, nullopt if valid
 */
std::optional<std::string> ValidateConfig(const TarpitConfig &config);

} // namespace tarpit
} // namespace deadlock

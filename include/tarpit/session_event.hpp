// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace deadlock {
namespace tarpit {

// How a session ended
enum class SessionOutcome {
  COMPLETED, // Peer closed cleanly after the banner
  RESET,     // Peer reset, or closed mid-banner / mid-read with an error
  TIMEOUT,   // Idle read timeout or hard read-phase ceiling
  REJECTED,  // Over capacity; closed on accept without banner or delay
  SHUTDOWN,  // Ended at a suspension point because the server is draining
  FORCED,    // Still active at the shutdown grace deadline
  ERROR,     // Local failure (e.g. remote endpoint unavailable)
};

const char *SessionOutcomeToString(SessionOutcome outcome);

// Terminal state of one connection; emitted exactly once per accepted socket
struct SessionEvent {
  uint64_t session_id{0};
  std::string address;
  uint16_t port{0};

  // Ledger count at admission (0 for rejected connections)
  uint64_t connection_count{0};
  std::chrono::milliseconds delay{0};

  uint64_t bytes_sent{0};
  uint64_t bytes_received{0};

  // Escaped prefix of peer input (at most max_input_length raw bytes)
  std::string input;
  bool input_truncated{false};

  // Unix milliseconds
  int64_t start_time_ms{0};
  int64_t end_time_ms{0};
  std::chrono::milliseconds duration{0};

  SessionOutcome outcome{SessionOutcome::COMPLETED};
};

// One-line JSON record for the event log
nlohmann::json ToJson(const SessionEvent &event);

} // namespace tarpit
} // namespace deadlock

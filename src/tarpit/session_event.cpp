// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tarpit/session_event.hpp"
#include "util/time.hpp"

namespace deadlock {
namespace tarpit {

const char *SessionOutcomeToString(SessionOutcome outcome) {
  switch (outcome) {
  case SessionOutcome::COMPLETED:
    return "completed";
  case SessionOutcome::RESET:
    return "reset";
  case SessionOutcome::TIMEOUT:
    return "timeout";
  case SessionOutcome::REJECTED:
    return "rejected";
  case SessionOutcome::SHUTDOWN:
    return "shutdown";
  case SessionOutcome::FORCED:
    return "forced";
  case SessionOutcome::ERROR:
    return "error";
  }
  return "unknown";
}

nlohmann::json ToJson(const SessionEvent &event) {
  return nlohmann::json{
      {"timestamp", util::FormatTimeMillis(event.end_time_ms)},
      {"session_id", event.session_id},
      {"address", event.address},
      {"port", event.port},
      {"connection_count", event.connection_count},
      {"delay_ms", event.delay.count()},
      {"bytes_sent", event.bytes_sent},
      {"bytes_received", event.bytes_received},
      {"input", event.input},
      {"input_truncated", event.input_truncated},
      {"outcome", SessionOutcomeToString(event.outcome)},
      {"duration_ms", event.duration.count()}};
}

} // namespace tarpit
} // namespace deadlock

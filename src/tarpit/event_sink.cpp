// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tarpit/event_sink.hpp"
#include "util/logging.hpp"

namespace deadlock {
namespace tarpit {

void LogEventSink::Emit(const SessionEvent &event) {
  // Input was escaped by the session, but dump() with replace keeps the
  // record valid JSON even if a non-UTF-8 byte slips through
  LOG_EVENT_INFO("{}", ToJson(event).dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace));
}

} // namespace tarpit
} // namespace deadlock

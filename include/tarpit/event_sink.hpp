// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "tarpit/session_event.hpp"
#include <memory>

namespace deadlock {
namespace tarpit {

// Abstract destination for session events
// Allows dependency injection of different implementations:
// - LogEventSink: JSON lines on the "event" logger (rotating file)
// - CollectingEventSink: in-memory capture for tests (in test/)
//
// Emit() is called from IO threads, possibly concurrently, and must not
// block for long; implementations must be thread-safe.
class EventSink {
public:
  virtual ~EventSink() = default;

  virtual void Emit(const SessionEvent &event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

// Writes each event as one JSON line through the "event" component logger,
// which shares the rotating file sink configured in LogManager
class LogEventSink : public EventSink {
public:
  void Emit(const SessionEvent &event) override;
};

} // namespace tarpit
} // namespace deadlock

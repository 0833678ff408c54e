// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "tarpit/config.hpp"
#include "tarpit/event_sink.hpp"
#include "tarpit/offense_ledger.hpp"
#include "tarpit/session_event.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace deadlock {
namespace tarpit {

/**
 * TarpitSession - owns one accepted socket from handoff to close
 *
 * Sequence (all handlers serialized on the session's strand):
 *   DELAYING  record the address in the ledger, wait ComputeDelay() on a timer
 *   BANNER    write banner + "\r\n" one byte at a time, banner_delay apart
 *   READING   read and discard peer input (prefix kept for the event) until
 *             EOF, error, idle timeout or the read-phase ceiling
 *   CLOSED    socket closed, event emitted, completion callback invoked
 *
 * Every wait is an asio timer or async operation: no thread is held while a
 * session is suspended. Finish() is the only path into CLOSED and runs at most
 * once, so the socket is closed and the event emitted exactly once.
 *
 * Draining: RequestStop() lets the pending step (delay timer, banner pause,
 * one-byte write) complete and ends the session with SHUTDOWN at the next
 * suspension point; a session already in READING ends immediately.
 * ForceClose() ends any live session with FORCED.
 */
class TarpitSession : public std::enable_shared_from_this<TarpitSession> {
public:
  using CompletionCallback =
      std::function<void(uint64_t session_id, SessionOutcome outcome)>;

  enum class Phase { CREATED, DELAYING, BANNER, READING, CLOSED };

  static std::shared_ptr<TarpitSession>
  Create(boost::asio::io_context &io_context,
         boost::asio::ip::tcp::socket socket,
         std::shared_ptr<const TarpitConfig> config, OffenseLedger &ledger,
         EventSinkPtr sink, CompletionCallback on_complete);

  ~TarpitSession() = default;

  // Non-copyable, non-movable (sessions are not reusable)
  TarpitSession(const TarpitSession&) = delete;
  TarpitSession& operator=(const TarpitSession&) = delete;
  TarpitSession(TarpitSession&&) = delete;
  TarpitSession& operator=(TarpitSession&&) = delete;

  void Start();
  void RequestStop();
  void ForceClose();

  uint64_t id() const { return id_; }
  Phase phase() const { return phase_.load(std::memory_order_acquire); }

private:
  TarpitSession(boost::asio::io_context &io_context,
                boost::asio::ip::tcp::socket socket,
                std::shared_ptr<const TarpitConfig> config,
                OffenseLedger &ledger, EventSinkPtr sink,
                CompletionCallback on_complete);

  // Strand-serialized internals (must be called on strand_)
  void StartImpl();
  void OnDelayElapsed(const boost::system::error_code &ec);
  void WriteNextBannerByte();
  void OnBannerByteWritten(const boost::system::error_code &ec, size_t bytes);
  void OnBannerPause(const boost::system::error_code &ec);
  void StartReading();
  void DoRead();
  void OnRead(const boost::system::error_code &ec, size_t bytes);
  void Finish(SessionOutcome outcome);

  bool IsClosed() const { return phase() == Phase::CLOSED; }
  void SetPhase(Phase p) { phase_.store(p, std::memory_order_release); }

  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;

  // Delay, banner pacing and idle-read timeouts share one timer; the
  // read-phase ceiling runs on its own
  boost::asio::steady_timer step_timer_;
  boost::asio::steady_timer deadline_timer_;

  std::shared_ptr<const TarpitConfig> config_;
  OffenseLedger &ledger_;
  EventSinkPtr sink_;
  CompletionCallback on_complete_;

  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  std::atomic<Phase> phase_{Phase::CREATED};
  std::atomic<bool> stop_requested_{false};

  // Session state (accessed only on strand_)
  std::string address_{"unknown"};
  uint16_t port_{0};
  uint64_t connection_count_{0};
  std::chrono::milliseconds delay_{0};
  std::string banner_;
  size_t banner_pos_{0};
  uint64_t bytes_sent_{0};
  uint64_t bytes_received_{0};
  std::vector<uint8_t> captured_;
  bool captured_truncated_{false};
  int64_t start_time_ms_{0};
  std::chrono::steady_clock::time_point started_;

  // Bumped for every read; an idle timeout from an older read is stale
  uint64_t read_seq_{0};

  static constexpr size_t RECV_BUFFER_SIZE = 4096;
  std::vector<uint8_t> recv_buffer_;
};

using TarpitSessionPtr = std::shared_ptr<TarpitSession>;

} // namespace tarpit
} // namespace deadlock

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "tarpit/config.hpp"
#include "tarpit/event_sink.hpp"
#include "tarpit/offense_ledger.hpp"
#include "tarpit/tarpit_session.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace deadlock {
namespace tarpit {

/**
 * TarpitServer - listener and dispatcher for tarpit sessions
 *
 * Owns the io_context, its IO threads and the acceptor. Every accepted
 * socket is either admitted (a TarpitSession is started and tracked) or,
 * when max_connections sessions are already active, closed at once with a
 * REJECTED event. Rejected sockets never touch the ledger.
 *
 * State machine: STARTING -> RUNNING -> DRAINING -> STOPPED
 * - Start() binds and listens; a bind failure returns false (STOPPED)
 * - Stop() stops accepting, asks every session to stop, waits up to
 *   shutdown_grace, force-closes the rest, waits for all of them to reach a
 *   terminal state, then joins the IO threads
 *
 * A server is single-use: it cannot be started again after Stop().
 * Start()/Stop() must not be called from an IO thread.
 */
class TarpitServer {
public:
  enum class State { STARTING, RUNNING, DRAINING, STOPPED };

  TarpitServer(const TarpitConfig &config, OffenseLedger &ledger,
               EventSinkPtr sink);
  ~TarpitServer();

  TarpitServer(const TarpitServer&) = delete;
  TarpitServer& operator=(const TarpitServer&) = delete;

  bool Start();
  void Stop();

  State state() const { return state_.load(std::memory_order_acquire); }
  bool IsRunning() const { return state() == State::RUNNING; }

  // Actual bound port (differs from config when port 0 was requested)
  uint16_t listening_port() const { return listening_port_.load(); }

  size_t active_sessions() const { return active_.load(std::memory_order_acquire); }
  uint64_t admitted_total() const { return admitted_.load(std::memory_order_relaxed); }
  uint64_t rejected_total() const { return rejected_.load(std::memory_order_relaxed); }
  uint64_t forced_total() const { return forced_.load(std::memory_order_relaxed); }
  uint64_t accept_errors_total() const {
    return accept_errors_.load(std::memory_order_relaxed);
  }

  // Pause before re-arming accept after descriptor or buffer exhaustion
  static constexpr std::chrono::milliseconds ACCEPT_BACKOFF{100};

  const TarpitConfig &config() const { return *config_; }
  const OffenseLedger &ledger() const { return ledger_; }

private:
  void StartAccept();
  void RetryAcceptLater(const boost::system::error_code &ec);
  void HandleAccept(const boost::system::error_code &ec,
                    boost::asio::ip::tcp::socket socket);
  void Reject(boost::asio::ip::tcp::socket socket);
  bool TryAcquireSlot();
  void OnSessionComplete(uint64_t session_id, SessionOutcome outcome);
  void CloseAcceptor();

  // Wait until no session is active or the deadline passes
  bool WaitForIdle(std::chrono::steady_clock::time_point deadline);

  std::shared_ptr<const TarpitConfig> config_;
  OffenseLedger &ledger_;
  EventSinkPtr sink_;

  // Declared first so it is destroyed last: sockets, timers and strands of
  // sessions still referenced by queued handlers must not outlive it
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;

  // Accept handler, accept backoff and acceptor close are serialized on this strand
  boost::asio::strand<boost::asio::io_context::executor_type> accept_strand_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  boost::asio::steady_timer accept_retry_timer_;
  bool accept_backoff_logged_{false}; // accept_strand_ only
  std::atomic<uint16_t> listening_port_{0};

  std::atomic<State> state_{State::STARTING};

  std::atomic<size_t> active_{0};
  std::atomic<uint64_t> admitted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> forced_{0};
  std::atomic<uint64_t> accept_errors_{0};

  util::ThreadSafeMap<uint64_t, TarpitSessionPtr> sessions_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
};

} // namespace tarpit
} // namespace deadlock

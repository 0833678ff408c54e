// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tarpit/tarpit_session.hpp"
#include "tarpit/delay_policy.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <cassert>

namespace deadlock {
namespace tarpit {

std::atomic<uint64_t> TarpitSession::next_id_{1};

std::shared_ptr<TarpitSession>
TarpitSession::Create(boost::asio::io_context &io_context,
                      boost::asio::ip::tcp::socket socket,
                      std::shared_ptr<const TarpitConfig> config,
                      OffenseLedger &ledger, EventSinkPtr sink,
                      CompletionCallback on_complete) {
  return std::shared_ptr<TarpitSession>(
      new TarpitSession(io_context, std::move(socket), std::move(config),
                        ledger, std::move(sink), std::move(on_complete)));
}

TarpitSession::TarpitSession(boost::asio::io_context &io_context,
                             boost::asio::ip::tcp::socket socket,
                             std::shared_ptr<const TarpitConfig> config,
                             OffenseLedger &ledger, EventSinkPtr sink,
                             CompletionCallback on_complete)
    : socket_(std::move(socket)), strand_(io_context.get_executor()),
      step_timer_(io_context), deadline_timer_(io_context),
      config_(std::move(config)), ledger_(ledger), sink_(std::move(sink)),
      on_complete_(std::move(on_complete)), id_(next_id_++),
      recv_buffer_(RECV_BUFFER_SIZE) {}

void TarpitSession::Start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    self->StartImpl();
  });
}

void TarpitSession::StartImpl() {
  if (IsClosed()) {
    return;
  }

  started_ = std::chrono::steady_clock::now();
  start_time_ms_ = util::GetTimeMillis();

  boost::system::error_code ec;
  auto remote_ep = socket_.remote_endpoint(ec);
  if (ec) {
    // Peer vanished between accept and handoff; nothing to record
    LOG_TARPIT_DEBUG("session {}: remote endpoint unavailable: {}", id_, ec.message());
    Finish(SessionOutcome::ERROR);
    return;
  }
  auto normalized = util::ValidateAndNormalizeIP(remote_ep.address().to_string());
  address_ = normalized ? *normalized : remote_ep.address().to_string();
  port_ = remote_ep.port();

  if (stop_requested_.load(std::memory_order_acquire)) {
    Finish(SessionOutcome::SHUTDOWN);
    return;
  }

  OffenseRecord record = ledger_.Record(address_);
  connection_count_ = record.connection_count;
  delay_ = ComputeDelay(connection_count_, config_->delay);

  LOG_TARPIT_INFO("connection from {} (attempt #{}, delay: {:.1f}s)",
                  util::FormatEndpoint(address_, port_), connection_count_,
                  delay_.count() / 1000.0);

  SetPhase(Phase::DELAYING);
  step_timer_.expires_after(delay_);
  step_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
        self->OnDelayElapsed(ec);
      }));
}

void TarpitSession::OnDelayElapsed(const boost::system::error_code &ec) {
  if (IsClosed() || ec == boost::asio::error::operation_aborted) {
    return;
  }

  if (stop_requested_.load(std::memory_order_acquire)) {
    Finish(SessionOutcome::SHUTDOWN);
    return;
  }

  SetPhase(Phase::BANNER);
  banner_ = config_->banner + "\r\n";
  banner_pos_ = 0;
  WriteNextBannerByte();
}

void TarpitSession::WriteNextBannerByte() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  boost::asio::async_write(
      socket_, boost::asio::buffer(&banner_[banner_pos_], 1),
      boost::asio::bind_executor(
          strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                               size_t bytes) {
            self->OnBannerByteWritten(ec, bytes);
          }));
}

void TarpitSession::OnBannerByteWritten(const boost::system::error_code &ec,
                                        size_t bytes) {
  if (IsClosed()) {
    return;
  }

  if (ec) {
    LOG_TARPIT_DEBUG("write error to {} after {} banner bytes: {}",
                     util::FormatEndpoint(address_, port_), banner_pos_,
                     ec.message());
    Finish(SessionOutcome::RESET);
    return;
  }

  bytes_sent_ += bytes;
  ++banner_pos_;

  if (stop_requested_.load(std::memory_order_acquire)) {
    Finish(SessionOutcome::SHUTDOWN);
    return;
  }

  if (banner_pos_ >= banner_.size()) {
    StartReading();
    return;
  }

  step_timer_.expires_after(config_->banner_delay);
  step_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
        self->OnBannerPause(ec);
      }));
}

void TarpitSession::OnBannerPause(const boost::system::error_code &ec) {
  if (IsClosed() || ec == boost::asio::error::operation_aborted) {
    return;
  }

  if (stop_requested_.load(std::memory_order_acquire)) {
    Finish(SessionOutcome::SHUTDOWN);
    return;
  }

  WriteNextBannerByte();
}

void TarpitSession::StartReading() {
  SetPhase(Phase::READING);

  deadline_timer_.expires_after(config_->max_session_duration);
  deadline_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
        if (self->IsClosed() || ec == boost::asio::error::operation_aborted) {
          return;
        }
        LOG_TARPIT_DEBUG("session {} from {} reached the read ceiling", self->id_,
                         self->address_);
        self->Finish(SessionOutcome::TIMEOUT);
      }));

  DoRead();
}

void TarpitSession::DoRead() {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif

  const uint64_t seq = ++read_seq_;

  step_timer_.expires_after(config_->connection_timeout);
  step_timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this(), seq](const boost::system::error_code &ec) {
        if (self->IsClosed() || ec == boost::asio::error::operation_aborted ||
            seq != self->read_seq_) {
          return;
        }
        LOG_TARPIT_DEBUG("connection from {} timed out",
                         util::FormatEndpoint(self->address_, self->port_));
        self->Finish(SessionOutcome::TIMEOUT);
      }));

  socket_.async_read_some(
      boost::asio::buffer(recv_buffer_),
      boost::asio::bind_executor(
          strand_, [self = shared_from_this()](const boost::system::error_code &ec,
                                               size_t bytes) {
            self->OnRead(ec, bytes);
          }));
}

void TarpitSession::OnRead(const boost::system::error_code &ec, size_t bytes) {
  if (IsClosed()) {
    return;
  }

  if (ec) {
    if (ec == boost::asio::error::eof) {
      Finish(SessionOutcome::COMPLETED);
    } else if (ec != boost::asio::error::operation_aborted) {
      LOG_TARPIT_DEBUG("read error from {}: {}",
                       util::FormatEndpoint(address_, port_), ec.message());
      Finish(SessionOutcome::RESET);
    }
    return;
  }

  bytes_received_ += bytes;

  const size_t limit = config_->max_input_length;
  if (captured_.size() < limit) {
    size_t take = std::min(bytes, limit - captured_.size());
    captured_.insert(captured_.end(), recv_buffer_.begin(),
                     recv_buffer_.begin() + static_cast<std::ptrdiff_t>(take));
    if (take < bytes) {
      captured_truncated_ = true;
    }
  } else if (bytes > 0) {
    captured_truncated_ = true;
  }

  LOG_TARPIT_DEBUG("data from {}: {}", util::FormatEndpoint(address_, port_),
                   util::EscapeBytes(std::vector<uint8_t>(
                       recv_buffer_.begin(),
                       recv_buffer_.begin() + static_cast<std::ptrdiff_t>(
                                                  std::min(bytes, limit)))));

  DoRead();
}

void TarpitSession::RequestStop() {
  stop_requested_.store(true, std::memory_order_release);
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    // Delay and banner steps observe the flag when their pending operation
    // completes; a read has no step to finish
    if (self->phase() == Phase::READING) {
      self->Finish(SessionOutcome::SHUTDOWN);
    }
  });
}

void TarpitSession::ForceClose() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    self->Finish(SessionOutcome::FORCED);
  });
}

void TarpitSession::Finish(SessionOutcome outcome) {
#ifndef NDEBUG
  assert(strand_.running_in_this_thread());
#endif
  if (IsClosed()) {
    return;
  }
  SetPhase(Phase::CLOSED);

  (void)step_timer_.cancel();
  (void)deadline_timer_.cancel();

  // Cancels the outstanding read/write; their handlers see CLOSED and return
  boost::system::error_code ignored;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);

  SessionEvent event;
  event.session_id = id_;
  event.address = address_;
  event.port = port_;
  event.connection_count = connection_count_;
  event.delay = delay_;
  event.bytes_sent = bytes_sent_;
  event.bytes_received = bytes_received_;
  event.input = util::EscapeBytes(captured_);
  event.input_truncated = captured_truncated_;
  event.start_time_ms = start_time_ms_ ? start_time_ms_ : util::GetTimeMillis();
  event.end_time_ms = util::GetTimeMillis();
  event.duration = started_ == std::chrono::steady_clock::time_point{}
                       ? std::chrono::milliseconds(0)
                       : std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - started_);
  event.outcome = outcome;

  if (outcome == SessionOutcome::FORCED) {
    LOG_TARPIT_WARN("connection from {} force-closed at shutdown deadline",
                    util::FormatEndpoint(address_, port_));
  } else {
    LOG_TARPIT_INFO("connection from {} closed ({}, {} bytes received, {} ms)",
                    util::FormatEndpoint(address_, port_),
                    SessionOutcomeToString(outcome), bytes_received_,
                    event.duration.count());
  }

  if (sink_) {
    try {
      sink_->Emit(event);
    } catch (const std::exception &e) {
      LOG_TARPIT_ERROR("event sink failed for session {}: {}", id_, e.what());
    }
  }

  // Move to a local so the callback (and whatever it captured) is released
  // even if it is the last owner of the server-side bookkeeping
  CompletionCallback done = std::move(on_complete_);
  on_complete_ = {};
  if (done) {
    done(id_, outcome);
  }
}

} // namespace tarpit
} // namespace deadlock

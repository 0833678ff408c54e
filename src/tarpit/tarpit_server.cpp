// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tarpit/tarpit_server.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"
#include <boost/asio/ip/v6_only.hpp>
#include <future>

namespace deadlock {
namespace tarpit {

TarpitServer::TarpitServer(const TarpitConfig &config, OffenseLedger &ledger,
                           EventSinkPtr sink)
    : config_(std::make_shared<const TarpitConfig>(config)), ledger_(ledger),
      sink_(std::move(sink)),
      io_context_(std::make_unique<boost::asio::io_context>()),
      accept_strand_(boost::asio::make_strand(io_context_->get_executor())),
      accept_retry_timer_(*io_context_) {}

TarpitServer::~TarpitServer() { Stop(); }

bool TarpitServer::Start() {
  if (state() != State::STARTING) {
    LOG_TARPIT_ERROR("tarpit server cannot be started twice");
    return false;
  }

  if (auto err = ValidateConfig(*config_)) {
    LOG_TARPIT_ERROR("invalid tarpit configuration: {}", *err);
    state_.store(State::STOPPED, std::memory_order_release);
    return false;
  }

  try {
    using tcp = boost::asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

    // Try dual-stack (IPv6 with v6_only=false); fall back to IPv4-only on failure
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), config_->port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const std::exception &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), config_->port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_.store(ec ? config_->port : ep.port());

  } catch (const std::exception &e) {
    LOG_TARPIT_ERROR("failed to listen on port {}: {}", config_->port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    state_.store(State::STOPPED, std::memory_order_release);
    return false;
  }

  state_.store(State::RUNNING, std::memory_order_release);

  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < config_->io_threads; i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }

  boost::asio::post(accept_strand_, [this]() { StartAccept(); });

  LOG_TARPIT_INFO("tarpit listening on port {} (max {} concurrent sessions)",
                  listening_port(), config_->max_connections);
  return true;
}

void TarpitServer::StartAccept() {
  if (!acceptor_ || state() != State::RUNNING) {
    return;
  }

  // No shared_from_this(): Stop() closes the acceptor and joins the IO
  // threads before the server can be destroyed
  acceptor_->async_accept(boost::asio::bind_executor(
      accept_strand_, [this](const boost::system::error_code &ec,
                             boost::asio::ip::tcp::socket socket) {
        HandleAccept(ec, std::move(socket));
      }));
}

void TarpitServer::HandleAccept(const boost::system::error_code &ec,
                                boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec == boost::asio::error::operation_aborted || state() != State::RUNNING) {
      return;
    }
    accept_errors_.fetch_add(1, std::memory_order_relaxed);

    // Resource exhaustion persists until sessions close; re-arming at once
    // would spin on the same error
    if (ec == boost::system::errc::too_many_files_open ||
        ec == boost::system::errc::too_many_files_open_in_system ||
        ec == boost::asio::error::no_buffer_space ||
        ec == boost::asio::error::no_memory) {
      RetryAcceptLater(ec);
      return;
    }

    LOG_TARPIT_DEBUG("accept error: {}", ec.message());
    StartAccept();
    return;
  }

  accept_backoff_logged_ = false;

  if (state() != State::RUNNING) {
    boost::system::error_code ignored;
    socket.close(ignored);
    return;
  }

  // Best-effort socket options. no_delay keeps each banner byte in its own
  // segment instead of letting Nagle batch the trickle
  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  if (config_->tcp_keepalive) {
    socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);
  }

  if (!TryAcquireSlot()) {
    Reject(std::move(socket));
    StartAccept();
    return;
  }

  admitted_.fetch_add(1, std::memory_order_relaxed);

  try {
    auto session = TarpitSession::Create(
        *io_context_, std::move(socket), config_, ledger_, sink_,
        [this](uint64_t id, SessionOutcome outcome) {
          OnSessionComplete(id, outcome);
        });
    sessions_.Insert(session->id(), session);
    session->Start();
  } catch (const std::exception &e) {
    // Keep accepting; release the slot the failed session would have held
    LOG_TARPIT_ERROR("failed to start session: {}", e.what());
    active_.fetch_sub(1, std::memory_order_acq_rel);
    idle_cv_.notify_all();
  }

  StartAccept();
}

void TarpitServer::RetryAcceptLater(const boost::system::error_code &ec) {
  if (!accept_backoff_logged_) {
    LOG_TARPIT_WARN("accept failed: {}; retrying every {} ms until it recovers",
                    ec.message(), ACCEPT_BACKOFF.count());
    accept_backoff_logged_ = true;
  }

  accept_retry_timer_.expires_after(ACCEPT_BACKOFF);
  accept_retry_timer_.async_wait(boost::asio::bind_executor(
      accept_strand_, [this](const boost::system::error_code &wait_ec) {
        if (!wait_ec) {
          StartAccept();
        }
      }));
}

bool TarpitServer::TryAcquireSlot() {
  size_t current = active_.load(std::memory_order_acquire);
  while (current < config_->max_connections) {
    if (active_.compare_exchange_weak(current, current + 1,
                                      std::memory_order_acq_rel)) {
      return true;
    }
  }
  return false;
}

void TarpitServer::Reject(boost::asio::ip::tcp::socket socket) {
  rejected_.fetch_add(1, std::memory_order_relaxed);

  SessionEvent event;
  event.address = "unknown";
  boost::system::error_code ec;
  auto remote_ep = socket.remote_endpoint(ec);
  if (!ec) {
    auto normalized = util::ValidateAndNormalizeIP(remote_ep.address().to_string());
    event.address = normalized ? *normalized : remote_ep.address().to_string();
    event.port = remote_ep.port();
  }

  boost::system::error_code ignored;
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);

  event.start_time_ms = util::GetTimeMillis();
  event.end_time_ms = event.start_time_ms;
  event.outcome = SessionOutcome::REJECTED;

  LOG_TARPIT_DEBUG("rejected connection from {}: at capacity ({})",
                   util::FormatEndpoint(event.address, event.port),
                   config_->max_connections);

  if (sink_) {
    try {
      sink_->Emit(event);
    } catch (const std::exception &e) {
      LOG_TARPIT_ERROR("event sink failed for rejected connection: {}", e.what());
    }
  }
}

void TarpitServer::OnSessionComplete(uint64_t session_id, SessionOutcome outcome) {
  if (outcome == SessionOutcome::FORCED) {
    forced_.fetch_add(1, std::memory_order_relaxed);
  }
  sessions_.Erase(session_id);
  {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    active_.fetch_sub(1, std::memory_order_acq_rel);
  }
  idle_cv_.notify_all();
}

void TarpitServer::CloseAcceptor() {
  // Run the close on the accept strand so it cannot race a running accept
  // handler; wait for it so no session can be admitted after we return
  auto closed = std::make_shared<std::promise<void>>();
  auto done = closed->get_future();
  boost::asio::dispatch(accept_strand_, [this, closed]() {
    accept_retry_timer_.cancel();
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
    }
    closed->set_value();
  });
  if (done.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
    LOG_TARPIT_WARN("timed out closing the listening socket");
  }
}

bool TarpitServer::WaitForIdle(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(idle_mutex_);
  return idle_cv_.wait_until(lock, deadline, [this]() {
    return active_.load(std::memory_order_acquire) == 0;
  });
}

void TarpitServer::Stop() {
  State expected = State::RUNNING;
  if (!state_.compare_exchange_strong(expected, State::DRAINING,
                                      std::memory_order_acq_rel)) {
    if (expected == State::STARTING) {
      state_.store(State::STOPPED, std::memory_order_release);
    }
    return;
  }

  // Don't log before this point - Stop() also runs from the destructor
  LOG_TARPIT_INFO("draining {} active sessions (grace {} ms)", active_sessions(),
                  config_->shutdown_grace.count());

  CloseAcceptor();

  for (const auto &[id, session] : sessions_.GetAll()) {
    session->RequestStop();
  }

  auto grace_deadline = std::chrono::steady_clock::now() + config_->shutdown_grace;
  if (!WaitForIdle(grace_deadline)) {
    auto remaining = sessions_.GetAll();
    LOG_TARPIT_WARN("shutdown grace expired, forcing {} sessions closed",
                    remaining.size());
    for (const auto &[id, session] : remaining) {
      session->ForceClose();
    }
    // Forced closes complete on the strands without waiting on the network
    if (!WaitForIdle(std::chrono::steady_clock::now() + std::chrono::seconds(5))) {
      LOG_TARPIT_ERROR("{} sessions did not terminate after force close",
                       active_sessions());
    }
  }

  work_guard_.reset();
  io_context_->stop();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  sessions_.Clear();
  acceptor_.reset();

  state_.store(State::STOPPED, std::memory_order_release);
  LOG_TARPIT_INFO("tarpit stopped ({} admitted, {} rejected, {} forced)",
                  admitted_total(), rejected_total(), forced_total());
}

} // namespace tarpit
} // namespace deadlock

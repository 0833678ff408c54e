// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "stats/stats_server.hpp"
#include "tarpit/delay_policy.hpp"
#include "tarpit/tarpit_server.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <istream>
#include <sstream>

namespace deadlock {
namespace stats {

namespace {

const char *StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  default:
    return "Internal Server Error";
  }
}

std::string JsonError(const std::string &message) {
  nlohmann::json j;
  j["error"] = message;
  return j.dump();
}

} // namespace

/**
 * One HTTP exchange: read the request head (bounded by size and time),
 * write the response, close. Runs entirely on the server's single IO thread.
 */
class StatsServer::Connection : public std::enable_shared_from_this<Connection> {
public:
  Connection(boost::asio::ip::tcp::socket socket, const StatsServer &server)
      : socket_(std::move(socket)), timer_(socket_.get_executor()),
        buffer_(MAX_REQUEST_SIZE), server_(server) {}

  void Start() {
    boost::system::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    peer_ = ec ? "unknown" : ep.address().to_string();

    timer_.expires_after(REQUEST_TIMEOUT);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code &ec) {
      if (ec == boost::asio::error::operation_aborted || self->done_) {
        return;
      }
      LOG_STATS_DEBUG("stats request from {} timed out", self->peer_);
      self->Close();
    });

    boost::asio::async_read_until(
        socket_, buffer_, "\r\n\r\n",
        [self = shared_from_this()](const boost::system::error_code &ec, size_t) {
          self->OnRequest(ec);
        });
  }

private:
  void OnRequest(const boost::system::error_code &ec) {
    if (done_) {
      return;
    }
    if (ec) {
      // not_found: head exceeded the streambuf limit
      if (ec == boost::asio::error::not_found) {
        LOG_STATS_WARN("stats request from {} exceeds {} bytes", peer_,
                       MAX_REQUEST_SIZE);
      }
      Close();
      return;
    }

    std::istream stream(&buffer_);
    std::string request_line;
    std::getline(stream, request_line);
    if (!request_line.empty() && request_line.back() == '\r') {
      request_line.pop_back();
    }

    std::istringstream parts(request_line);
    std::string method, target, version;
    parts >> method >> target >> version;

    Response response;
    if (method.empty() || target.empty()) {
      response.status = 400;
      response.body = JsonError("malformed request line");
    } else {
      response = server_.HandleRequest(method, target);
    }

    if (response.status == 200) {
      LOG_STATS_INFO("stats request from {}: {}", peer_, target);
    } else {
      LOG_STATS_WARN("stats request from {}: {} {} ({})", peer_, method, target,
                     response.status);
    }

    std::ostringstream out;
    out << "HTTP/1.0 " << response.status << " " << StatusText(response.status)
        << "\r\n"
        << "Content-Type: " << response.content_type << "\r\n"
        << "Content-Length: " << response.body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << response.body;
    response_ = out.str();

    boost::asio::async_write(
        socket_, boost::asio::buffer(response_),
        [self = shared_from_this()](const boost::system::error_code &ec, size_t) {
          if (ec) {
            LOG_STATS_DEBUG("stats response to {} failed: {}", self->peer_,
                            ec.message());
          }
          self->Close();
        });
  }

  void Close() {
    if (done_) {
      return;
    }
    done_ = true;
    timer_.cancel();
    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer timer_;
  boost::asio::streambuf buffer_;
  const StatsServer &server_;
  std::string peer_;
  std::string response_;
  bool done_{false};
};

StatsServer::StatsServer(const StatsSettings &settings,
                         const tarpit::OffenseLedger &ledger,
                         const tarpit::TarpitServer &tarpit, int64_t start_time)
    : settings_(settings), ledger_(ledger), tarpit_(tarpit),
      start_time_(start_time) {}

StatsServer::~StatsServer() { Stop(); }

bool StatsServer::Start() {
  if (running_) {
    return true;
  }

  try {
    using tcp = boost::asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(tcp::v4());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(tcp::endpoint(tcp::v4(), settings_.port));
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    listening_port_.store(acceptor_->local_endpoint().port());
  } catch (const std::exception &e) {
    LOG_STATS_ERROR("failed to start stats server on port {}: {}", settings_.port,
                    e.what());
    acceptor_.reset();
    return false;
  }

  running_ = true;
  StartAccept();
  server_thread_ = std::thread([this]() { io_context_.run(); });

  LOG_STATS_INFO("stats server listening on port {}", listening_port());
  return true;
}

void StatsServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Pending exchanges are abandoned; their sockets close with the io_context
  io_context_.stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }

  LOG_STATS_INFO("stats server stopped");
}

void StatsServer::StartAccept() {
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    if (ec) {
      if (ec == boost::asio::error::operation_aborted || !running_) {
        return;
      }
      LOG_STATS_DEBUG("stats accept error: {}", ec.message());
    } else {
      std::make_shared<Connection>(std::move(socket), *this)->Start();
    }
    if (running_) {
      StartAccept();
    }
  });
}

StatsServer::Response StatsServer::HandleRequest(const std::string &method,
                                                 const std::string &target) const {
  Response response;

  // Ignore any query string
  std::string path = target.substr(0, target.find('?'));

  if (path != "/stats") {
    response.status = 404;
    response.body = JsonError("not found");
    return response;
  }
  if (method != "GET") {
    response.status = 405;
    response.body = JsonError("method not allowed");
    return response;
  }

  response.body = BuildStats().dump(4);
  return response;
}

nlohmann::json StatsServer::BuildStats() const {
  const int64_t now = util::GetTime();
  const auto &delay = tarpit_.config().delay;
  auto snapshot = ledger_.Snapshot();

  nlohmann::json j;
  j["start_time"] = util::FormatTimeMillis(start_time_ * 1000);
  j["uptime_seconds"] = std::max<int64_t>(0, now - start_time_);
  j["total_connections"] = ledger_.TotalConnections();
  j["distinct_addresses"] = snapshot.size();
  j["active_connections"] = tarpit_.active_sessions();
  j["rejected_connections"] = tarpit_.rejected_total();

  nlohmann::json top = nlohmann::json::array();
  for (size_t i = 0; i < snapshot.size() && i < settings_.top_n; i++) {
    const auto &[address, record] = snapshot[i];
    nlohmann::json entry;
    entry["address"] = address;
    entry["connection_count"] = record.connection_count;
    entry["current_delay_ms"] =
        tarpit::ComputeDelay(record.connection_count, delay).count();
    entry["first_seen"] = util::FormatTime(record.first_seen);
    entry["last_seen"] = util::FormatTime(record.last_seen);
    top.push_back(std::move(entry));
  }
  j["top_addresses"] = std::move(top);

  nlohmann::json per_ip = nlohmann::json::object();
  for (const auto &[address, record] : snapshot) {
    per_ip[address] = record.connection_count;
  }
  j["connections_per_ip"] = std::move(per_ip);

  return j;
}

} // namespace stats
} // namespace deadlock

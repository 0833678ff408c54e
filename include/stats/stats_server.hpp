// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 StatsServer - read-only HTTP view over the offense ledger

 Serves exactly one resource:
   GET /stats  ->  200 application/json

 Any other path answers 404, any other method 405. The server speaks just
 enough HTTP/1.0 for curl and monitoring agents: one request per
 connection, response followed by close.

 Limits
 - Request head (request line + headers) capped at MAX_REQUEST_SIZE bytes
 - Each connection gets REQUEST_TIMEOUT to deliver its request head
 Either violation drops the connection without a response.

 The presenter never mutates tarpit state. It reads ledger snapshots and
 the server's atomic counters.
*/

#include "tarpit/config.hpp"
#include "tarpit/offense_ledger.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace deadlock {

namespace tarpit {
class TarpitServer;
}

namespace stats {

struct StatsSettings {
  // 0 binds an ephemeral port (tests)
  uint16_t port = 8080;
  size_t top_n = 10;
};

class StatsServer {
public:
  static constexpr size_t MAX_REQUEST_SIZE = 8 * 1024;
  static constexpr std::chrono::seconds REQUEST_TIMEOUT{5};

  /**
   * @param ledger Ledger to report on (must outlive the server)
   * @param tarpit Source of active/rejected counters and the delay settings
   *               used for current_delay_ms (must outlive the server)
   * @param start_time Unix seconds the honeypot started
   */
  StatsServer(const StatsSettings &settings, const tarpit::OffenseLedger &ledger,
              const tarpit::TarpitServer &tarpit, int64_t start_time);
  ~StatsServer();

  StatsServer(const StatsServer&) = delete;
  StatsServer& operator=(const StatsServer&) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  uint16_t listening_port() const { return listening_port_.load(); }

  // Document served at /stats
  nlohmann::json BuildStats() const;

  struct Response {
    int status{200};
    std::string content_type{"application/json"};
    std::string body;
  };

  // Route one parsed request line
  Response HandleRequest(const std::string &method, const std::string &target) const;

private:
  class Connection;

  void StartAccept();

  StatsSettings settings_;
  const tarpit::OffenseLedger &ledger_;
  const tarpit::TarpitServer &tarpit_;
  int64_t start_time_;

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint16_t> listening_port_{0};
};

} // namespace stats
} // namespace deadlock

#pragma once

#include "app_config.hpp"
#include "stats/stats_server.hpp"
#include "tarpit/event_sink.hpp"
#include "tarpit/offense_ledger.hpp"
#include "tarpit/tarpit_server.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace deadlock {
namespace app {

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application {
public:
  // sink: destination for session events (defaults to the "event" logger)
  explicit Application(const AppConfig &config = AppConfig{},
                       tarpit::EventSinkPtr sink = nullptr);
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  tarpit::OffenseLedger &ledger() { return ledger_; }
  tarpit::TarpitServer &tarpit_server() { return *tarpit_server_; }
  stats::StatsServer *stats_server() { return stats_server_.get(); }

  // Status
  bool is_running() const { return running_; }
  int64_t start_time() const { return start_time_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

  // Runs one eviction pass (also driven by the sweep thread)
  size_t sweep_ledger();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  int64_t start_time_{0};

  // Components (initialized in order)
  // The ledger is declared first: both servers hold references to it
  tarpit::OffenseLedger ledger_;
  tarpit::EventSinkPtr sink_;
  std::unique_ptr<tarpit::TarpitServer> tarpit_server_;
  std::unique_ptr<stats::StatsServer> stats_server_;

  // Periodic ledger sweep thread
  std::unique_ptr<std::thread> sweep_thread_;
  std::mutex sweep_mutex_;
  std::condition_variable sweep_cv_;

  // Periodic sweeps
  void start_ledger_sweeps();
  void stop_ledger_sweeps();
  void ledger_sweep_loop();

  // Shutdown
  void shutdown();
  void log_final_statistics();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace deadlock

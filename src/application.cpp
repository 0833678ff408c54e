#include "application.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <chrono>
#include <cstdio>    // For snprintf()
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace deadlock {
namespace app {

namespace {

// "2d 03:04:05" / "03:04:05"
std::string FormatUptime(int64_t seconds) {
  if (seconds < 0) {
    seconds = 0;
  }
  int64_t days = seconds / 86400;
  int64_t rem = seconds % 86400;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                static_cast<long long>(rem / 3600),
                static_cast<long long>((rem % 3600) / 60),
                static_cast<long long>(rem % 60));
  if (days > 0) {
    return std::to_string(days) + "d " + buf;
  }
  return buf;
}

} // namespace

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config, tarpit::EventSinkPtr sink)
    : config_(config), sink_(std::move(sink)) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  // Print startup banner (use std::cout for immediate visibility before logger
  // fully initialized)
  std::cout << GetStartupBanner(config_.tarpit.port) << std::flush;

  LOG_INFO("Initializing DeadlockSSH...");

  if (auto err = ValidateAppConfig(config_)) {
    LOG_ERROR("Invalid configuration: {}", *err);
    return false;
  }

  start_time_ = util::GetTime();

  if (!sink_) {
    sink_ = std::make_shared<tarpit::LogEventSink>();
  }

  tarpit_server_ =
      std::make_unique<tarpit::TarpitServer>(config_.tarpit, ledger_, sink_);

  if (config_.enable_http_stats) {
    LOG_INFO("Initializing stats server...");
    stats_server_ = std::make_unique<stats::StatsServer>(
        config_.stats, ledger_, *tarpit_server_, start_time_);
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!tarpit_server_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  LOG_INFO("Starting DeadlockSSH...");

  // Setup signal handlers
  setup_signal_handlers();

  // A bind failure is fatal: the trap is useless without its port
  if (!tarpit_server_->Start()) {
    LOG_ERROR("Failed to start tarpit on port {}", config_.tarpit.port);
    return false;
  }

  // The stats endpoint is optional; run without it if its port is taken
  if (stats_server_ && !stats_server_->Start()) {
    LOG_WARN("Stats server unavailable, continuing without statistics");
    stats_server_.reset();
  }

  running_ = true;

  if (config_.ledger_max_age.count() > 0) {
    start_ledger_sweeps();
  }

  LOG_INFO("DeadlockSSH started successfully");
  LOG_INFO("Listening on port: {}", tarpit_server_->listening_port());
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down DeadlockSSH...");

  running_ = false;

  stop_ledger_sweeps();

  // Stop stats server first (read-only, nothing to drain)
  if (stats_server_) {
    LOG_INFO("Stopping stats server...");
    stats_server_->Stop();
  }

  // Drain sessions, force-close stragglers at the grace deadline
  if (tarpit_server_) {
    LOG_INFO("Stopping tarpit...");
    tarpit_server_->Stop();
  }

  log_final_statistics();

  LOG_INFO("Shutdown complete");
}

void Application::log_final_statistics() {
  LOG_INFO("Final statistics:");
  LOG_INFO("  Total connections: {}", ledger_.TotalConnections());
  if (tarpit_server_) {
    LOG_INFO("  Rejected (at capacity): {}", tarpit_server_->rejected_total());
    LOG_INFO("  Force-closed at shutdown: {}", tarpit_server_->forced_total());
  }
  LOG_INFO("  Uptime: {}", FormatUptime(util::GetTime() - start_time_));

  auto top = ledger_.TopOffenders(5);
  if (top.empty()) {
    LOG_INFO("  Top attacking IPs: none");
    return;
  }
  std::string list;
  for (const auto &[address, record] : top) {
    if (!list.empty()) {
      list += ", ";
    }
    list += address + " (" + std::to_string(record.connection_count) + ")";
  }
  LOG_INFO("  Top attacking IPs: {}", list);
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char* msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);  // Use literal length to avoid strlen()
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

size_t Application::sweep_ledger() {
  const int64_t max_age = config_.ledger_max_age.count();
  size_t evicted = ledger_.SweepStale(util::GetTime(), max_age);
  if (evicted > 0) {
    LOG_DEBUG("Ledger sweep evicted {} addresses unseen for {}s ({} remain)",
              evicted, max_age, ledger_.Size());
  }
  return evicted;
}

void Application::start_ledger_sweeps() {
  LOG_INFO("Starting ledger sweeps (every {}s, max age {}s)",
           config_.ledger_sweep_interval.count(), config_.ledger_max_age.count());
  sweep_thread_ =
      std::make_unique<std::thread>(&Application::ledger_sweep_loop, this);
}

void Application::stop_ledger_sweeps() {
  if (sweep_thread_ && sweep_thread_->joinable()) {
    LOG_DEBUG("Stopping ledger sweep thread");
    {
      std::lock_guard<std::mutex> lock(sweep_mutex_);
    }
    sweep_cv_.notify_all();
    sweep_thread_->join();
    sweep_thread_.reset();
  }
}

void Application::ledger_sweep_loop() {
  std::unique_lock<std::mutex> lock(sweep_mutex_);
  while (running_) {
    sweep_cv_.wait_for(lock, config_.ledger_sweep_interval,
                       [this]() { return !running_; });
    if (!running_)
      break;

    lock.unlock();
    sweep_ledger();
    lock.lock();
  }
}

} // namespace app
} // namespace deadlock

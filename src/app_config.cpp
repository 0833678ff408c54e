// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app_config.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cctype>
#include <limits>

namespace deadlock {
namespace app {

namespace {

constexpr const char *SECTION = "honeypot";

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Accept Python-logging level names as well ("WARNING", "INFO")
std::string NormalizeLevel(const std::string &level) {
  std::string lower = ToLower(level);
  if (lower == "warning") {
    return "warn";
  }
  if (lower == "fatal") {
    return "critical";
  }
  return lower;
}

// Reads [honeypot] keys and records the first bad value
class SectionReader {
public:
  SectionReader(const boost::property_tree::ptree &section, std::string &error)
      : section_(section), error_(error) {}

  bool ok() const { return ok_; }

  std::optional<std::string> Raw(const char *key) const {
    auto value = section_.get_optional<std::string>(key);
    if (!value) {
      return std::nullopt;
    }
    return *value;
  }

  void String(const char *key, std::string &out) {
    if (auto v = Raw(key)) {
      out = *v;
    }
  }

  void Port(const char *key, uint16_t &out) {
    if (auto v = Raw(key)) {
      auto parsed = util::SafeParsePort(*v);
      if (!parsed) {
        Fail(key, *v, "a port number between 1 and 65535");
        return;
      }
      out = *parsed;
    }
  }

  void Size(const char *key, size_t &out, int64_t min = 0) {
    if (auto v = Raw(key)) {
      auto parsed =
          util::SafeParseInt64(*v, min, std::numeric_limits<int64_t>::max());
      if (!parsed) {
        Fail(key, *v, "a non-negative integer");
        return;
      }
      out = static_cast<size_t>(*parsed);
    }
  }

  void Duration(const char *key, std::chrono::milliseconds &out) {
    if (auto v = Raw(key)) {
      auto parsed = util::SafeParseSeconds(*v);
      if (!parsed) {
        Fail(key, *v, "a non-negative number of seconds");
        return;
      }
      out = *parsed;
    }
  }

  void Seconds(const char *key, std::chrono::seconds &out) {
    if (auto v = Raw(key)) {
      auto parsed = util::SafeParseInt64(*v, 0, 86400LL * 365 * 10);
      if (!parsed) {
        Fail(key, *v, "a non-negative integer number of seconds");
        return;
      }
      out = std::chrono::seconds(*parsed);
    }
  }

  void Bool(const char *key, bool &out) {
    if (auto v = Raw(key)) {
      auto parsed = util::SafeParseBool(*v);
      if (!parsed) {
        Fail(key, *v, "a boolean (true/false, yes/no, on/off, 1/0)");
        return;
      }
      out = *parsed;
    }
  }

private:
  void Fail(const char *key, const std::string &value, const char *expected) {
    if (ok_) {
      error_ = std::string("invalid value '") + value + "' for " + key +
               ": expected " + expected;
      ok_ = false;
    }
  }

  const boost::property_tree::ptree &section_;
  std::string &error_;
  bool ok_{true};
};

} // namespace

bool LoadConfigFile(const std::string &path, AppConfig &config, std::string &error) {
  boost::property_tree::ptree tree;
  try {
    boost::property_tree::ini_parser::read_ini(path, tree);
  } catch (const boost::property_tree::ini_parser_error &e) {
    error = std::string("cannot read configuration file: ") + e.what();
    return false;
  }

  auto section = tree.get_child_optional(SECTION);
  if (!section) {
    return true;
  }

  SectionReader reader(*section, error);
  auto &t = config.tarpit;

  reader.Port("port", t.port);
  reader.Size("max_connections", t.max_connections);
  reader.String("ssh_banner", t.banner);
  reader.Duration("banner_delay", t.banner_delay);
  reader.Duration("initial_delay", t.delay.initial_delay);
  reader.Duration("delay_increment", t.delay.delay_increment);
  reader.Duration("max_delay", t.delay.max_delay);
  reader.Duration("connection_timeout", t.connection_timeout);
  reader.Duration("max_session_duration", t.max_session_duration);
  reader.Size("max_input_length", t.max_input_length);
  reader.Bool("tcp_keepalive", t.tcp_keepalive);
  reader.Duration("shutdown_grace", t.shutdown_grace);
  reader.Size("io_threads", t.io_threads);

  reader.Seconds("ledger_max_age", config.ledger_max_age);
  reader.Seconds("ledger_sweep_interval", config.ledger_sweep_interval);

  reader.String("log_file", config.logging.file_path);
  if (auto level = reader.Raw("log_level")) {
    config.logging.level = NormalizeLevel(*level);
  }
  reader.Size("max_log_size", config.logging.max_file_size);
  reader.Size("log_backup_count", config.logging.max_files);

  reader.Bool("enable_http_stats", config.enable_http_stats);
  reader.Port("http_stats_port", config.stats.port);

  return reader.ok();
}

std::optional<std::string> ValidateAppConfig(const AppConfig &config) {
  if (auto err = tarpit::ValidateConfig(config.tarpit)) {
    return err;
  }
  if (!util::LogManager::IsValidLevel(config.logging.level)) {
    return "unknown log_level '" + config.logging.level +
           "' (trace, debug, info, warn, error, critical, off)";
  }
  if (config.logging.log_to_file) {
    if (config.logging.file_path.empty()) {
      return std::string("log_file must not be empty");
    }
    if (config.logging.max_file_size == 0) {
      return std::string("max_log_size must be > 0");
    }
  }
  if (config.ledger_max_age.count() > 0 && config.ledger_sweep_interval.count() <= 0) {
    return std::string("ledger_sweep_interval must be > 0 when ledger_max_age is set");
  }
  return std::nullopt;
}

} // namespace app
} // namespace deadlock

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app_config.hpp"
#include "tarpit/config.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace deadlock;
using std::chrono::milliseconds;

namespace {

// Writes an INI file under the temp directory, removed on scope exit
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& contents) {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                ("deadlock_config_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++) + ".conf");
        std::ofstream out(path_);
        out << contents;
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("ValidateConfig - defaults are valid", "[config]") {
    tarpit::TarpitConfig config;
    REQUIRE_FALSE(tarpit::ValidateConfig(config).has_value());
}

TEST_CASE("ValidateConfig - rejects invalid settings", "[config]") {
    tarpit::TarpitConfig config;

    SECTION("max_connections 0") {
        config.max_connections = 0;
        REQUIRE(tarpit::ValidateConfig(config).has_value());
    }

    SECTION("Empty banner") {
        config.banner.clear();
        REQUIRE(tarpit::ValidateConfig(config).has_value());
    }

    SECTION("Banner with line terminator") {
        config.banner = "SSH-2.0-OpenSSH\r\nextra";
        REQUIRE(tarpit::ValidateConfig(config).has_value());
    }

    SECTION("Negative delays") {
        config.delay.initial_delay = milliseconds(-1);
        REQUIRE(tarpit::ValidateConfig(config).has_value());
        config.delay.initial_delay = milliseconds(1000);
        config.delay.delay_increment = milliseconds(-1);
        REQUIRE(tarpit::ValidateConfig(config).has_value());
        config.delay.delay_increment = milliseconds(0);
        config.banner_delay = milliseconds(-5);
        REQUIRE(tarpit::ValidateConfig(config).has_value());
    }

    SECTION("max_delay below initial_delay") {
        config.delay.initial_delay = milliseconds(5000);
        config.delay.max_delay = milliseconds(4999);
        auto err = tarpit::ValidateConfig(config);
        REQUIRE(err.has_value());
        REQUIRE(err->find("max_delay") != std::string::npos);
    }

    SECTION("Non-positive read timeouts") {
        config.connection_timeout = milliseconds(0);
        REQUIRE(tarpit::ValidateConfig(config).has_value());
        config.connection_timeout = milliseconds(1000);
        config.max_session_duration = milliseconds(0);
        REQUIRE(tarpit::ValidateConfig(config).has_value());
    }

    SECTION("Negative grace and zero IO threads") {
        config.shutdown_grace = milliseconds(-1);
        REQUIRE(tarpit::ValidateConfig(config).has_value());
        config.shutdown_grace = milliseconds(0);
        REQUIRE_FALSE(tarpit::ValidateConfig(config).has_value());
        config.io_threads = 0;
        REQUIRE(tarpit::ValidateConfig(config).has_value());
    }

    SECTION("Boundary values are accepted") {
        config.delay.initial_delay = milliseconds(0);
        config.delay.delay_increment = milliseconds(0);
        config.delay.max_delay = milliseconds(0);
        config.banner_delay = milliseconds(0);
        config.max_connections = 1;
        REQUIRE_FALSE(tarpit::ValidateConfig(config).has_value());
    }
}

TEST_CASE("LoadConfigFile - reads the honeypot section", "[config][file]") {
    TempConfigFile file(
        "; DeadlockSSH test configuration\n"
        "[honeypot]\n"
        "port = 2022\n"
        "max_connections = 50\n"
        "ssh_banner = SSH-2.0-OpenSSH_7.4\n"
        "banner_delay = 0.25\n"
        "initial_delay = 2\n"
        "delay_increment = 1.5\n"
        "max_delay = 30\n"
        "connection_timeout = 120\n"
        "max_input_length = 512\n"
        "tcp_keepalive = no\n"
        "log_file = /tmp/deadlock-test.log\n"
        "log_level = WARNING\n"
        "max_log_size = 2048\n"
        "log_backup_count = 3\n"
        "enable_http_stats = true\n"
        "http_stats_port = 9090\n"
        "ledger_max_age = 86400\n");

    app::AppConfig config;
    std::string error;
    bool loaded = app::LoadConfigFile(file.path(), config, error);
    INFO(error);
    REQUIRE(loaded);

    CHECK(config.tarpit.port == 2022);
    CHECK(config.tarpit.max_connections == 50);
    CHECK(config.tarpit.banner == "SSH-2.0-OpenSSH_7.4");
    CHECK(config.tarpit.banner_delay == milliseconds(250));
    CHECK(config.tarpit.delay.initial_delay == milliseconds(2000));
    CHECK(config.tarpit.delay.delay_increment == milliseconds(1500));
    CHECK(config.tarpit.delay.max_delay == milliseconds(30000));
    CHECK(config.tarpit.connection_timeout == milliseconds(120000));
    CHECK(config.tarpit.max_input_length == 512);
    CHECK_FALSE(config.tarpit.tcp_keepalive);
    CHECK(config.logging.file_path == "/tmp/deadlock-test.log");
    CHECK(config.logging.level == "warn");
    CHECK(config.logging.max_file_size == 2048);
    CHECK(config.logging.max_files == 3);
    CHECK(config.enable_http_stats);
    CHECK(config.stats.port == 9090);
    CHECK(config.ledger_max_age == std::chrono::seconds(86400));

    REQUIRE_FALSE(app::ValidateAppConfig(config).has_value());
}

TEST_CASE("LoadConfigFile - absent keys keep defaults", "[config][file]") {
    TempConfigFile file("[honeypot]\nport = 2200\n");

    app::AppConfig config;
    std::string error;
    REQUIRE(app::LoadConfigFile(file.path(), config, error));

    app::AppConfig defaults;
    CHECK(config.tarpit.port == 2200);
    CHECK(config.tarpit.max_connections == defaults.tarpit.max_connections);
    CHECK(config.tarpit.banner == defaults.tarpit.banner);
    CHECK(config.tarpit.delay.max_delay == defaults.tarpit.delay.max_delay);
    CHECK(config.logging.file_path == "honeypot.log");
    CHECK_FALSE(config.enable_http_stats);
}

TEST_CASE("LoadConfigFile - file without honeypot section changes nothing", "[config][file]") {
    TempConfigFile file("[other]\nport = 1\n");

    app::AppConfig config;
    std::string error;
    REQUIRE(app::LoadConfigFile(file.path(), config, error));
    CHECK(config.tarpit.port == 2222);
}

TEST_CASE("LoadConfigFile - errors", "[config][file]") {
    app::AppConfig config;
    std::string error;

    SECTION("Missing file") {
        REQUIRE_FALSE(app::LoadConfigFile("/nonexistent/deadlock.conf", config, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Bad port") {
        TempConfigFile file("[honeypot]\nport = 70000\n");
        REQUIRE_FALSE(app::LoadConfigFile(file.path(), config, error));
        REQUIRE(error.find("port") != std::string::npos);
    }

    SECTION("Bad duration") {
        TempConfigFile file("[honeypot]\ninitial_delay = soon\n");
        REQUIRE_FALSE(app::LoadConfigFile(file.path(), config, error));
        REQUIRE(error.find("initial_delay") != std::string::npos);
    }

    SECTION("Negative duration") {
        TempConfigFile file("[honeypot]\nmax_delay = -3\n");
        REQUIRE_FALSE(app::LoadConfigFile(file.path(), config, error));
    }

    SECTION("Bad boolean") {
        TempConfigFile file("[honeypot]\nenable_http_stats = sometimes\n");
        REQUIRE_FALSE(app::LoadConfigFile(file.path(), config, error));
        REQUIRE(error.find("enable_http_stats") != std::string::npos);
    }

    SECTION("First error is reported") {
        TempConfigFile file("[honeypot]\nport = x\nmax_connections = y\n");
        REQUIRE_FALSE(app::LoadConfigFile(file.path(), config, error));
        REQUIRE(error.find("port") != std::string::npos);
    }
}

TEST_CASE("ValidateAppConfig - ambient settings", "[config]") {
    app::AppConfig config;
    REQUIRE_FALSE(app::ValidateAppConfig(config).has_value());

    SECTION("Engine errors surface") {
        config.tarpit.delay.initial_delay = milliseconds(10);
        config.tarpit.delay.max_delay = milliseconds(5);
        REQUIRE(app::ValidateAppConfig(config).has_value());
    }

    SECTION("Unknown log level") {
        config.logging.level = "loud";
        REQUIRE(app::ValidateAppConfig(config).has_value());
    }

    SECTION("Empty log file path") {
        config.logging.file_path.clear();
        REQUIRE(app::ValidateAppConfig(config).has_value());
        config.logging.log_to_file = false;
        REQUIRE_FALSE(app::ValidateAppConfig(config).has_value());
    }

    SECTION("Sweeps need an interval") {
        config.ledger_max_age = std::chrono::seconds(60);
        config.ledger_sweep_interval = std::chrono::seconds(0);
        REQUIRE(app::ValidateAppConfig(config).has_value());
    }
}

#include "app_config.hpp"
#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <optional>
#include <string>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --config=<file>      INI configuration file ([honeypot] section)\n"
      << "  -c <file>            Same as --config\n"
      << "  --port=<port>        Listen port, overrides the config file (default: 2222)\n"
      << "  -p <port>            Same as --port\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --logfile=<path>     Rotating log file (default: honeypot.log)\n"
      << "  --nologfile          Log to the console only\n"
      << "\n"
      << "Statistics:\n"
      << "  --stats              Enable the HTTP statistics endpoint (GET /stats)\n"
      << "  --statsport=<port>   Statistics port (default: 8080)\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments. The config file is loaded first and
    // every other option overrides it, whatever the order on the command line.
    std::optional<std::string> config_file;
    std::optional<uint16_t> port;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool no_log_file = false;
    bool enable_stats = false;
    std::optional<uint16_t> stats_port;

    auto parse_port = [](const std::string &value) -> std::optional<uint16_t> {
      auto port_opt = deadlock::util::SafeParsePort(value);
      if (!port_opt) {
        std::cerr << "Error: Invalid port number: " << value << std::endl;
        std::cerr << "Port must be a number between 1 and 65535" << std::endl;
      }
      return port_opt;
    };

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << deadlock::GetFullVersionString() << std::endl;
        std::cout << deadlock::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--config=") == 0) {
        config_file = arg.substr(9);
      } else if (arg == "-c" || arg == "-p") {
        if (i + 1 >= argc) {
          std::cerr << "Error: " << arg << " requires a value" << std::endl;
          print_usage(argv[0]);
          return 1;
        }
        std::string value = argv[++i];
        if (arg == "-c") {
          config_file = value;
        } else {
          port = parse_port(value);
          if (!port) {
            return 1;
          }
        }
      } else if (arg.find("--port=") == 0) {
        port = parse_port(arg.substr(7));
        if (!port) {
          return 1;
        }
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg == "--nologfile") {
        no_log_file = true;
      } else if (arg == "--stats") {
        enable_stats = true;
      } else if (arg.find("--statsport=") == 0) {
        stats_port = parse_port(arg.substr(12));
        if (!stats_port) {
          return 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    deadlock::app::AppConfig config;

    if (config_file) {
      std::string error;
      if (!deadlock::app::LoadConfigFile(*config_file, config, error)) {
        std::cerr << "Error: " << *config_file << ": " << error << std::endl;
        return 1;
      }
      std::cout << "Configuration loaded from " << *config_file << std::endl;
    }

    if (port) {
      config.tarpit.port = *port;
    }
    if (log_level) {
      config.logging.level = *log_level;
    }
    if (log_file) {
      config.logging.file_path = *log_file;
    }
    if (no_log_file) {
      config.logging.log_to_file = false;
    }
    if (enable_stats) {
      config.enable_http_stats = true;
    }
    if (stats_port) {
      config.stats.port = *stats_port;
    }

    if (auto err = deadlock::app::ValidateAppConfig(config)) {
      std::cerr << "Error: invalid configuration: " << *err << std::endl;
      return 1;
    }

    // Initialize logging system (console + rotating honeypot log)
    deadlock::util::LogManager::Initialize(config.logging);

    int exit_code = 0;

    // Create and initialize application
    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // This prevents race conditions where async callbacks try to log after logger is destroyed
    {
      deadlock::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        exit_code = 1;
      } else if (!app.start()) {
        LOG_ERROR("Failed to start application");
        exit_code = 1;
      } else {
        // Run until shutdown requested
        app.wait_for_shutdown();
      }

      // app destructor runs here, draining any remaining sessions
    }

    // Shutdown logging AFTER app is fully destroyed
    // This ensures no async callbacks are still running when logger is shut down
    deadlock::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    deadlock::util::LogManager::Shutdown();
    return 1;
  }
}

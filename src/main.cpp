// Copyright (c) 2025 The Offsync Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <filesystem>
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.offsync)\n"
      << "  --server=<url>       Sync server, e.g. http://localhost:8000/v1\n"
      << "                       (default: http://127.0.0.1:8000)\n"
      << "  --tokenfile=<path>   Read the bearer token from this file\n"
      << "                       (default: $OFFSYNC_AUTH_TOKEN)\n"
      << "  --timeout=<sec>      HTTP request timeout (default: 30)\n"
      << "\n"
      << "Sync:\n"
      << "  --interval=<min>     Periodic sync interval in minutes (default: 30)\n"
      << "  --debounce=<sec>     Delay after a local change before syncing (default: 5)\n"
      << "  --nobackgroundsync   Disable periodic and reachability syncs\n"
      << "  --noautosync         Disable syncing after local changes\n"
      << "  --nobatchedpull      Fetch the first pull in a single request\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: sync, queue, net, app, all\n"
      << "                       Can be comma-separated: --debug=sync,queue\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << "\n"
      << "Send SIGUSR1 to a running offsyncd to sync immediately.\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    offsync::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << offsync::GetFullVersionString() << std::endl;
        std::cout << offsync::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--server=") == 0) {
        auto endpoint = offsync::util::ParseHttpUrl(arg.substr(9));
        if (!endpoint) {
          std::cerr << "Error: Invalid server URL: " << arg.substr(9) << std::endl;
          std::cerr << "Expected http://host[:port][/path]" << std::endl;
          return 1;
        }
        config.transport_config.host = endpoint->host;
        config.transport_config.port = endpoint->port;
        config.transport_config.base_path = endpoint->base_path;
      } else if (arg.find("--tokenfile=") == 0) {
        config.token_file = arg.substr(12);
      } else if (arg.find("--timeout=") == 0) {
        auto secs = offsync::util::SafeParseInt(arg.substr(10), 1, 3600);
        if (!secs) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          std::cerr << "Timeout must be a number of seconds between 1 and 3600" << std::endl;
          return 1;
        }
        config.transport_config.timeout = std::chrono::seconds(*secs);
      } else if (arg.find("--interval=") == 0) {
        auto mins = offsync::util::SafeParseInt(arg.substr(11), 1, 24 * 60);
        if (!mins) {
          std::cerr << "Error: Invalid sync interval: " << arg.substr(11) << std::endl;
          std::cerr << "Interval must be a number of minutes between 1 and 1440" << std::endl;
          return 1;
        }
        config.scheduler_config.periodic_interval = std::chrono::minutes(*mins);
      } else if (arg.find("--debounce=") == 0) {
        auto secs = offsync::util::SafeParseInt(arg.substr(11), 0, 3600);
        if (!secs) {
          std::cerr << "Error: Invalid debounce: " << arg.substr(11) << std::endl;
          std::cerr << "Debounce must be a number of seconds between 0 and 3600" << std::endl;
          return 1;
        }
        config.scheduler_config.change_debounce = std::chrono::seconds(*secs);
      } else if (arg == "--nobackgroundsync") {
        config.scheduler_config.background_sync_enabled = false;
      } else if (arg == "--noautosync") {
        config.scheduler_config.auto_sync = false;
      } else if (arg == "--nobatchedpull") {
        config.client_config.batched_initial_pull = false;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=sync,queue
        for (const auto &component : offsync::util::SplitList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    if (!offsync::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory: " << config.datadir.string() << std::endl;
      return 1;
    }
    // Initialize logging system (enable file logging with debug.log)
    std::string log_file = (config.datadir / "debug.log").string();
    offsync::util::LogManager::Initialize(log_level, true, log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        offsync::util::LogManager::SetLogLevel("trace");
      } else if (component == "network") {
        offsync::util::LogManager::SetComponentLevel("net", "trace");
      } else {
        offsync::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // The sync worker may still be logging until the app is gone
    {
      offsync::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      // Run until shutdown requested
      app.wait_for_shutdown();
    }

    // Shutdown logging AFTER app is fully destroyed
    offsync::util::LogManager::Shutdown();

    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    offsync::util::LogManager::Shutdown();
    return 1;
  }
}

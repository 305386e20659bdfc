#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <system_error>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>        Data directory (default: ~/.floodchain)\n"
      << "  --port=<port>           Gossip TCP port (default: 9650)\n"
      << "  --discoveryport=<port>  LAN discovery UDP port (default: 9651)\n"
      << "  --beacon=<addr:port>    Also send discovery beacons to this address\n"
      << "                          Can be repeated\n"
      << "  --nomulticast           Discover peers through --beacon targets only\n"
      << "  --noconsole             Do not read commands from stdin\n"
      << "  --nosync                Skip the initial chain request after startup\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, chain, mining, app, all\n"
      << "                       Can be comma-separated: --debug=network,chain\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    floodchain::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << floodchain::GetFullVersionString() << std::endl;
        std::cout << floodchain::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = floodchain::util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.network_config.transport.listen_port = *port_opt;
      } else if (arg.find("--discoveryport=") == 0) {
        auto port_opt = floodchain::util::SafeParsePort(arg.substr(16));
        if (!port_opt) {
          std::cerr << "Error: Invalid discovery port: " << arg.substr(16) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.network_config.transport.discovery_port = *port_opt;
      } else if (arg.find("--beacon=") == 0) {
        // Checked when the transport starts
        config.network_config.transport.beacon_targets.push_back(arg.substr(9));
      } else if (arg == "--nomulticast") {
        config.network_config.transport.multicast_discovery = false;
      } else if (arg == "--noconsole") {
        config.interactive = false;
      } else if (arg == "--nosync") {
        config.network_config.initial_sync = false;
      } else if (arg == "--verbose") {
        config.verbose = true;
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,chain
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: cannot create data directory " << config.datadir
                << ": " << ec.message() << std::endl;
      return 1;
    }

    std::string log_file = (config.datadir / "debug.log").string();
    floodchain::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        floodchain::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        floodchain::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        floodchain::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // so no background thread logs into a destroyed logger
    {
      floodchain::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    floodchain::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    floodchain::util::LogManager::Shutdown();
    return 1;
  }
}

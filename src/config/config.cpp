#include "config/config.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace dnskv {
namespace config {

namespace {

bool parse_number(const std::string& text, unsigned long max, unsigned long& result) {
  try {
    std::size_t consumed = 0;
    unsigned long value = std::stoul(text, &consumed);
    if (consumed != text.size() || value > max) {
      return false;
    }
    result = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool parse_port(const std::string& text, uint16_t& port) {
  unsigned long value = 0;
  if (!parse_number(text, std::numeric_limits<uint16_t>::max(), value) || value == 0) {
    return false;
  }
  port = static_cast<uint16_t>(value);
  return true;
}

bool parse_level(const std::string& text, logging::severity_level& level) {
  auto parsed = logging::parse_severity(text);
  if (!parsed) {
    return false;
  }
  level = *parsed;
  return true;
}

// "host" or "host:port"
bool parse_server_endpoint(const std::string& text, std::string& host, uint16_t& port) {
  std::size_t colon = text.rfind(':');
  if (colon == std::string::npos) {
    host = text;
    return !host.empty();
  }
  host = text.substr(0, colon);
  return !host.empty() && parse_port(text.substr(colon + 1), port);
}

} // namespace

ServerOptions parse_server_arguments(int argc, const char* const argv[]) {
  ServerOptions options;
  const std::string program = argc > 0 ? argv[0] : "dnskv_server";

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag == "--help") {
      print_server_usage(program);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_server_usage(program);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-a" || flag == "--address") {
      options.config.address = value;
    } else if (flag == "-p" || flag == "--port") {
      if (!parse_port(value, options.config.port)) {
        std::cerr << "Error: Invalid port number: " << value << '\n';
        print_server_usage(program);
        return options;
      }
    } else if (flag == "-w" || flag == "--workers") {
      unsigned long workers = 0;
      if (!parse_number(value, 256, workers) || workers == 0) {
        std::cerr << "Error: Invalid worker count: " << value << '\n';
        print_server_usage(program);
        return options;
      }
      options.config.worker_threads = workers;
    } else if (flag == "-l" || flag == "--log-file") {
      options.config.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      if (!parse_level(value, options.config.log_level)) {
        std::cerr << "Error: Invalid log level: " << value << '\n';
        print_server_usage(program);
        return options;
      }
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_server_usage(program);
      return options;
    }
  }

  options.valid = true;
  return options;
}

ClientOptions parse_client_arguments(int argc, const char* const argv[]) {
  ClientOptions options;
  const std::string program = argc > 0 ? argv[0] : "dnskv_client";
  bool server_given = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "--help") {
      print_client_usage(program);
      return options;
    }

    if (arg == "-s" || arg == "--set") {
      if (i + 2 >= argc) {
        std::cerr << "Error: " << arg << " needs KEY and VALUE\n";
        print_client_usage(program);
        return options;
      }
      if (options.config.command != ClientCommand::NONE) {
        std::cerr << "Error: Only one of --get and --set may be given\n";
        print_client_usage(program);
        return options;
      }
      options.config.command = ClientCommand::SET;
      options.config.key = argv[++i];
      options.config.value = argv[++i];
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << arg << '\n';
        print_client_usage(program);
        return options;
      }
      const std::string value(argv[++i]);

      if (arg == "-g" || arg == "--get") {
        if (options.config.command != ClientCommand::NONE) {
          std::cerr << "Error: Only one of --get and --set may be given\n";
          print_client_usage(program);
          return options;
        }
        options.config.command = ClientCommand::GET;
        options.config.key = value;
      } else if (arg == "-t" || arg == "--timeout") {
        unsigned long timeout = 0;
        if (!parse_number(value, 600000, timeout) || timeout == 0) {
          std::cerr << "Error: Invalid timeout: " << value << '\n';
          print_client_usage(program);
          return options;
        }
        options.config.retry.timeout = std::chrono::milliseconds(timeout);
      } else if (arg == "-r" || arg == "--retries") {
        unsigned long attempts = 0;
        if (!parse_number(value, 100, attempts) || attempts == 0) {
          std::cerr << "Error: Invalid attempt count: " << value << '\n';
          print_client_usage(program);
          return options;
        }
        options.config.retry.max_attempts = attempts;
      } else if (arg == "-l" || arg == "--log-file") {
        options.config.log_file = value;
      } else if (arg == "-v" || arg == "--log-level") {
        if (!parse_level(value, options.config.log_level)) {
          std::cerr << "Error: Invalid log level: " << value << '\n';
          print_client_usage(program);
          return options;
        }
      } else {
        std::cerr << "Error: Unknown argument: " << arg << '\n';
        print_client_usage(program);
        return options;
      }
      continue;
    }

    // Positional server[:port]
    if (server_given ||
        !parse_server_endpoint(arg, options.config.server_address, options.config.server_port)) {
      std::cerr << "Error: Invalid server: " << arg << '\n';
      print_client_usage(program);
      return options;
    }
    server_given = true;
  }

  if (options.config.command == ClientCommand::NONE) {
    std::cerr << "Error: One of --get or --set is required\n";
    print_client_usage(program);
    return options;
  }
  if (options.config.key.empty()) {
    std::cerr << "Error: Key must not be empty\n";
    print_client_usage(program);
    return options;
  }

  options.valid = true;
  return options;
}

void print_server_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-a <address>] [-p <port>] [-w <workers>]"
            << " [-l <log file>] [-v <level>]\n"
            << "Optional arguments:\n"
            << "  -a, --address    Address to bind (default 0.0.0.0)\n"
            << "  -p, --port       UDP port (default " << DEFAULT_PORT << ")\n"
            << "  -w, --workers    Query worker threads (default 4)\n"
            << "  -l, --log-file   Also write the log to this file\n"
            << "  -v, --log-level  trace|debug|info|warning|error|fatal (default $DNSKV_LOG or info)\n"
            << "Example: " << program_name << " -a 127.0.0.1 -p 5353\n";
}

void print_client_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [server[:port]] (--get <key> | --set <key> <value>)"
            << " [-t <ms>] [-r <attempts>] [-l <log file>] [-v <level>]\n"
            << "Arguments:\n"
            << "  server[:port]    DNS server to query (default 127.0.0.1:" << DEFAULT_PORT << ")\n"
            << "  -g, --get        Print the value stored under key\n"
            << "  -s, --set        Store value under key\n"
            << "  -t, --timeout    Milliseconds to wait for each reply (default 2000)\n"
            << "  -r, --retries    Sends per query before giving up (default 3)\n"
            << "  -l, --log-file   Also write the log to this file\n"
            << "  -v, --log-level  trace|debug|info|warning|error|fatal (default $DNSKV_LOG or warning)\n"
            << "Example: " << program_name << " 127.0.0.1:5353 --set HELLO WORLD\n";
}

} // namespace config
} // namespace dnskv

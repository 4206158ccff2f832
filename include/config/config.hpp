#ifndef DNSKV_CONFIG_HPP
#define DNSKV_CONFIG_HPP

#include <cstdint>
#include <string>
#include "client/query_session.hpp"
#include "logger/logger.hpp"

namespace dnskv {
namespace config {

constexpr uint16_t DEFAULT_PORT = 5353;

struct ServerConfig {
  std::string address{"0.0.0.0"};
  uint16_t port{DEFAULT_PORT};
  std::size_t worker_threads{4};
  std::string log_file;
  logging::severity_level log_level{logging::severity_from_environment()};
};

enum class ClientCommand {
  NONE,
  GET,
  SET
};

struct ClientConfig {
  std::string server_address{"127.0.0.1"};
  uint16_t server_port{DEFAULT_PORT};
  client::RetryPolicy retry;
  std::string log_file;
  logging::severity_level log_level{logging::severity_from_environment(boost::log::trivial::warning)};
  ClientCommand command{ClientCommand::NONE};
  std::string key;
  std::string value;
};

struct ServerOptions {
  ServerConfig config;
  bool valid{false};
};

struct ClientOptions {
  ClientConfig config;
  bool valid{false};
};

// ---- COMMAND LINE PARSING ----
// Both print an error and the usage text to stderr when arguments are invalid
ServerOptions parse_server_arguments(int argc, const char* const argv[]);
ClientOptions parse_client_arguments(int argc, const char* const argv[]);

void print_server_usage(const std::string& program_name);
void print_client_usage(const std::string& program_name);

} // namespace config
} // namespace dnskv

#endif // DNSKV_CONFIG_HPP

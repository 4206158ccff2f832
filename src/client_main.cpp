#include "client/tunnel_client.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "network/tunnel_error.hpp"
#include <iostream>

int run_client(const dnskv::config::ClientConfig& config) {
  try {
    dnskv::client::TunnelClient client(config);

    switch (config.command) {
      case dnskv::config::ClientCommand::SET:
        client.set(config.key, config.value);
        std::cout << dnskv::client::set_confirmation(config.key) << '\n';
        return 0;
      case dnskv::config::ClientCommand::GET: {
        auto message = client.get(config.key);
        std::cout << message.value << '\n';
        return 0;
      }
      case dnskv::config::ClientCommand::NONE:
        break;
    }
    std::cerr << "Error: No command given\n";
    return 1;
  } catch (const dnskv::network::KeyNotFoundError&) {
    std::cerr << "Error: Key not found: " << config.key << '\n';
    return 1;
  } catch (const dnskv::network::TunnelError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: Client failed: " << e.what() << '\n';
    return 1;
  }
}

int main(int argc, char* argv[]) {
  const auto options = dnskv::config::parse_client_arguments(argc, argv);
  if (!options.valid) {
    return 1;
  }

  dnskv::logging::init_logging(options.config.log_file, options.config.log_level);
  return run_client(options.config);
}

#include "config/config.hpp"
#include "logger/logger.hpp"
#include "server/tunnel_server.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>

bool run_server(const dnskv::config::ServerConfig& config) {
  try {
    dnskv::server::TunnelServer server(config);
    if (!server.start()) {
      std::cerr << "Error: Failed to start server on " << config.address << ":" << config.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number << ", shutting down";
      }
    });
    signals_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Server failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = dnskv::config::parse_server_arguments(argc, argv);
  if (!options.valid) {
    return 1;
  }

  dnskv::logging::init_logging(options.config.log_file, options.config.log_level);
  return run_server(options.config) ? 0 : 1;
}

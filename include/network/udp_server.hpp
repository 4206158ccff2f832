#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dnskv {
namespace network {

// Returns the reply datagram, or nullopt to send nothing
using DatagramHandler = std::function<std::optional<std::vector<uint8_t>>(const std::vector<uint8_t>&)>;

class UDP_Server {
public:
  // Large enough for any DNS-over-UDP datagram, including EDNS payloads
  static constexpr std::size_t MAX_DATAGRAM_SIZE = 4096;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UDP_Server(const uint16_t port, const std::string& address, DatagramHandler handler,
             std::size_t worker_threads);
  ~UDP_Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Port actually bound, useful when constructed with port 0
  uint16_t local_port() const { return bound_port_; }
  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  std::atomic<uint16_t> bound_port_{0};

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};

  // Datagram handling
  DatagramHandler handler_;
  const std::size_t worker_threads_;
  std::unique_ptr<boost::asio::thread_pool> workers_;

  // Incoming datagram handlers
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::ip::udp::socket> socket_;
  boost::asio::ip::udp::endpoint remote_endpoint_;
  std::array<uint8_t, MAX_DATAGRAM_SIZE> receive_buffer_;


  // ---- DATAGRAM PROCESSING ----
  // Main receive loop, re-armed after every datagram
  void start_receive();
  // Runs the handler on a worker and hands the reply back to the io thread
  void dispatch(std::vector<uint8_t> datagram, boost::asio::ip::udp::endpoint sender);
  void send_reply(std::shared_ptr<std::vector<uint8_t>> reply, boost::asio::ip::udp::endpoint receiver);
};

} // namespace network
} // namespace dnskv

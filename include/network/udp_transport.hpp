#ifndef DNSKV_NETWORK_UDP_TRANSPORT_HPP
#define DNSKV_NETWORK_UDP_TRANSPORT_HPP

#include <boost/asio.hpp>
#include <array>
#include <string>
#include "network/transport.hpp"

namespace dnskv {
namespace network {

class UDP_Transport : public DatagramTransport {
public:
  static constexpr std::size_t MAX_DATAGRAM_SIZE = 4096;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Resolves the server and binds an ephemeral local port
  UDP_Transport(const std::string& server_address, uint16_t server_port);
  ~UDP_Transport() override;


  // ---- DATAGRAM EXCHANGE ----
  void send(const std::vector<uint8_t>& datagram) override;
  std::optional<std::vector<uint8_t>> receive(std::chrono::milliseconds timeout) override;

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  boost::asio::ip::udp::socket socket_;
  boost::asio::ip::udp::endpoint server_endpoint_;
  boost::asio::ip::udp::endpoint sender_endpoint_;
  std::array<uint8_t, MAX_DATAGRAM_SIZE> receive_buffer_;
};

} // namespace network
} // namespace dnskv

#endif // DNSKV_NETWORK_UDP_TRANSPORT_HPP

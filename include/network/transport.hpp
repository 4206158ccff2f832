#ifndef DNSKV_NETWORK_TRANSPORT_HPP
#define DNSKV_NETWORK_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace dnskv {
namespace network {

// Client side of a datagram exchange with one server
class DatagramTransport {
public:
  virtual ~DatagramTransport() = default;

  // Sends one datagram; throws TransportError on failure
  virtual void send(const std::vector<uint8_t>& datagram) = 0;
  // Waits up to timeout for the next datagram from the server; nullopt on
  // timeout, TransportError on socket failure
  virtual std::optional<std::vector<uint8_t>> receive(std::chrono::milliseconds timeout) = 0;
};

} // namespace network
} // namespace dnskv

#endif // DNSKV_NETWORK_TRANSPORT_HPP

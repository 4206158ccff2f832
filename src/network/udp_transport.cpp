#include "network/udp_transport.hpp"
#include "network/tunnel_error.hpp"
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UDP_Transport::UDP_Transport(const std::string& server_address, uint16_t server_port)
  : socket_(io_context_) {
  try {
    BOOST_LOG_TRIVIAL(debug) << "UDP transport: Resolving " << server_address << ":" << server_port;
    boost::asio::ip::udp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(boost::asio::ip::udp::v4(), server_address, std::to_string(server_port));
    server_endpoint_ = *endpoints.begin();

    socket_.open(boost::asio::ip::udp::v4());
    socket_.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), 0));
    BOOST_LOG_TRIVIAL(info) << "UDP transport: Bound " << socket_.local_endpoint()
                            << " for server " << server_endpoint_;
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "UDP transport: Failed to set up socket: " << e.what();
    throw TransportError("cannot reach " + server_address + ":" + std::to_string(server_port) +
                         ": " + e.what());
  }
}

UDP_Transport::~UDP_Transport() {
  boost::system::error_code ec;
  socket_.close(ec);
}


//==============================================
// DATAGRAM EXCHANGE
//==============================================

void UDP_Transport::send(const std::vector<uint8_t>& datagram) {
  boost::system::error_code ec;
  std::size_t sent = socket_.send_to(boost::asio::buffer(datagram), server_endpoint_, 0, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "UDP transport: Send failed: " << ec.message();
    throw TransportError("send to " + server_endpoint_.address().to_string() + " failed: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(trace) << "UDP transport: Sent " << sent << " bytes";
}

std::optional<std::vector<uint8_t>> UDP_Transport::receive(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return std::nullopt;
    }

    std::optional<boost::system::error_code> result;
    std::size_t bytes_received = 0;
    socket_.async_receive_from(
      boost::asio::buffer(receive_buffer_), sender_endpoint_,
      [&result, &bytes_received](const boost::system::error_code& error, std::size_t size) {
        result = error;
        bytes_received = size;
      });

    io_context_.restart();
    io_context_.run_for(deadline - now);

    if (!result) {
      // Deadline passed; cancel and drain the pending receive
      boost::system::error_code ec;
      socket_.cancel(ec);
      io_context_.restart();
      io_context_.run();
    }

    if (!result || *result == boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(debug) << "UDP transport: Receive timed out after " << timeout.count() << " ms";
      return std::nullopt;
    }
    if (*result) {
      BOOST_LOG_TRIVIAL(error) << "UDP transport: Receive failed: " << result->message();
      throw TransportError("receive failed: " + result->message());
    }

    if (sender_endpoint_ != server_endpoint_) {
      BOOST_LOG_TRIVIAL(debug) << "UDP transport: Ignoring datagram from " << sender_endpoint_;
      continue;
    }

    BOOST_LOG_TRIVIAL(trace) << "UDP transport: Received " << bytes_received << " bytes";
    return std::vector<uint8_t>(receive_buffer_.begin(), receive_buffer_.begin() + bytes_received);
  }
}

} // namespace network
} // namespace dnskv

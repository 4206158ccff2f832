#include "network/udp_server.hpp"

namespace dnskv {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UDP_Server::UDP_Server(const uint16_t port, const std::string& address, DatagramHandler handler,
                       std::size_t worker_threads)
  : port_(port)
  , address_(address)
  , handler_(std::move(handler))
  , worker_threads_(worker_threads == 0 ? 1 : worker_threads) {
  BOOST_LOG_TRIVIAL(info) << "UDP server: Initializing UDP server on " << address << ":" << port
                          << " with " << worker_threads_ << " workers";
}

UDP_Server::~UDP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool UDP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "UDP server: Server already running";
    return false;
  }

  try {
    io_context_ = std::make_unique<boost::asio::io_context>();
    workers_ = std::make_unique<boost::asio::thread_pool>(worker_threads_);

    // Create endpoint
    boost::asio::ip::udp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    // Open and bind socket
    socket_ = std::make_unique<boost::asio::ip::udp::socket>(*io_context_, endpoint);
    bound_port_ = socket_->local_endpoint().port();
    BOOST_LOG_TRIVIAL(debug) << "UDP server: Socket bound to port " << bound_port_;

    is_running_ = true;

    // Start receiving datagrams
    start_receive();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(*io_context_);
        io_context_->run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "UDP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "UDP server: Listening on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "UDP server: Failed to start server: " << e.what();
    socket_.reset();
    if (workers_) {
      workers_->join();
      workers_.reset();
    }
    io_context_.reset();
    return false;
  }
}

void UDP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "UDP server: Initiating server shutdown";

  is_running_ = false;

  // Stop io_context and wait for io_thread to finish
  io_context_->stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // Socket is no longer used by the io thread
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "UDP server: Error closing socket: " << ec.message();
    }
  }

  // Let in-flight handlers finish; their replies are discarded
  if (workers_) {
    workers_->join();
  }

  socket_.reset();
  workers_.reset();
  io_context_.reset();

  BOOST_LOG_TRIVIAL(info) << "UDP server: Server shutdown complete";
}


//==============================================
// DATAGRAM PROCESSING
//==============================================

void UDP_Server::start_receive() {
  if (!socket_ || !is_running_) {
    return;
  }

  socket_->async_receive_from(
    boost::asio::buffer(receive_buffer_), remote_endpoint_,
    [this](const boost::system::error_code& error, std::size_t bytes_received) {
      if (error == boost::asio::error::operation_aborted) {
        return;
      }

      if (!error) {
        BOOST_LOG_TRIVIAL(debug) << "UDP server: Received " << bytes_received << " bytes from "
                                 << remote_endpoint_;
        std::vector<uint8_t> datagram(receive_buffer_.begin(), receive_buffer_.begin() + bytes_received);
        dispatch(std::move(datagram), remote_endpoint_);
      } else {
        BOOST_LOG_TRIVIAL(error) << "UDP server: Receive error: " << error.message();
      }
      start_receive();  // Continue receiving datagrams
    });
}

void UDP_Server::dispatch(std::vector<uint8_t> datagram, boost::asio::ip::udp::endpoint sender) {
  boost::asio::post(*workers_, [this, datagram = std::move(datagram), sender]() {
    std::optional<std::vector<uint8_t>> reply;
    try {
      reply = handler_(datagram);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "UDP server: Handler failed for datagram from " << sender << ": " << e.what();
      return;
    }

    if (!reply) {
      BOOST_LOG_TRIVIAL(debug) << "UDP server: No reply for datagram from " << sender;
      return;
    }

    // Socket operations stay on the io thread
    auto shared_reply = std::make_shared<std::vector<uint8_t>>(std::move(*reply));
    boost::asio::post(*io_context_, [this, shared_reply, sender]() {
      send_reply(shared_reply, sender);
    });
  });
}

void UDP_Server::send_reply(std::shared_ptr<std::vector<uint8_t>> reply, boost::asio::ip::udp::endpoint receiver) {
  if (!socket_ || !socket_->is_open() || !is_running_) {
    return;
  }

  socket_->async_send_to(
    boost::asio::buffer(*reply), receiver,
    [reply, receiver](const boost::system::error_code& error, std::size_t bytes_sent) {
      if (error) {
        BOOST_LOG_TRIVIAL(warning) << "UDP server: Failed to send reply to " << receiver << ": " << error.message();
        return;
      }
      BOOST_LOG_TRIVIAL(debug) << "UDP server: Sent " << bytes_sent << " bytes to " << receiver;
    });
}

} // namespace network
} // namespace dnskv

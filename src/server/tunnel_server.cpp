#include "server/tunnel_server.hpp"
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace server {

TunnelServer::TunnelServer(const config::ServerConfig& config)
    : config_(config) {

    BOOST_LOG_TRIVIAL(info) << "Tunnel server: Initializing on " << config_.address << ":" << config_.port;

    try {
        // Stores first (no dependencies)
        pending_store_ = std::make_unique<store::MemoryStore>("pending");
        committed_store_ = std::make_unique<store::MemoryStore>("committed");
        outbound_store_ = std::make_unique<store::MemoryStore>("outbound");
        BOOST_LOG_TRIVIAL(debug) << "Tunnel server: Stores created successfully";

        reassembler_ = std::make_unique<UploadReassembler>(*pending_store_, *committed_store_);
        paginator_ = std::make_unique<DownloadPaginator>(*committed_store_, *outbound_store_);
        query_handler_ = std::make_unique<QueryHandler>(*reassembler_, *paginator_);
        BOOST_LOG_TRIVIAL(debug) << "Tunnel server: Protocol components created successfully";

        // UDP server last as it dispatches into the query handler
        QueryHandler* handler = query_handler_.get();
        udp_server_ = std::make_unique<network::UDP_Server>(
            config_.port, config_.address,
            [handler](const std::vector<uint8_t>& datagram) { return handler->handle_datagram(datagram); },
            config_.worker_threads);
        BOOST_LOG_TRIVIAL(debug) << "Tunnel server: UDP server created successfully";
    }
    catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Tunnel server: Failed to initialize components: " << e.what();
        throw;
    }
}

TunnelServer::~TunnelServer() {
    shutdown();
}

bool TunnelServer::start() {
    if (!udp_server_->start_listener()) {
        BOOST_LOG_TRIVIAL(error) << "Tunnel server: Failed to start UDP server";
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "Tunnel server: Serving on port " << udp_server_->local_port();
    return true;
}

void TunnelServer::shutdown() {
    // Stop receiving before the components the workers use go away
    if (udp_server_) {
        udp_server_->shutdown();
    }
}

} // namespace server
} // namespace dnskv

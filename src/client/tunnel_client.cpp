#include "client/tunnel_client.hpp"
#include "network/udp_transport.hpp"
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TunnelClient::TunnelClient(const config::ClientConfig& config)
  : owned_transport_(std::make_unique<network::UDP_Transport>(config.server_address, config.server_port)) {
  session_ = std::make_unique<QuerySession>(*owned_transport_, config.retry);
  encoder_ = std::make_unique<UploadEncoder>(*session_);
  collector_ = std::make_unique<DownloadCollector>(*session_);
  BOOST_LOG_TRIVIAL(debug) << "Tunnel client: Ready for " << config.server_address << ":" << config.server_port;
}

TunnelClient::TunnelClient(network::DatagramTransport& transport, const RetryPolicy& policy)
  : session_(std::make_unique<QuerySession>(transport, policy))
  , encoder_(std::make_unique<UploadEncoder>(*session_))
  , collector_(std::make_unique<DownloadCollector>(*session_)) {
}


//==============================================
// PROCESSING OF USER REQUESTS
//==============================================

void TunnelClient::set(const std::string& key, const std::string& value) {
  std::string transaction_id = encoder_->upload(key, value);
  BOOST_LOG_TRIVIAL(info) << "Tunnel client: Set key " << key << " in transaction " << transaction_id;
}

codec::Message TunnelClient::get(const std::string& key) {
  return collector_->download(key);
}

std::string set_confirmation(const std::string& key) {
  return "Set the key: \"" + key + "\" on the server!";
}

} // namespace client
} // namespace dnskv

#pragma once

#include <memory>
#include <string>
#include "client/download_collector.hpp"
#include "client/query_session.hpp"
#include "client/upload_encoder.hpp"
#include "codec/message.hpp"
#include "config/config.hpp"
#include "network/transport.hpp"

namespace dnskv {
namespace client {

class TunnelClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens a UDP transport towards the configured server
  explicit TunnelClient(const config::ClientConfig& config);
  // Uses an existing transport, which must outlive the client
  TunnelClient(network::DatagramTransport& transport, const RetryPolicy& policy);


  // ---- PROCESSING OF USER REQUESTS ----
  // Stores value under key on the server
  void set(const std::string& key, const std::string& value);
  // Retrieves the message stored under key
  codec::Message get(const std::string& key);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<network::DatagramTransport> owned_transport_;
  std::unique_ptr<QuerySession> session_;
  std::unique_ptr<UploadEncoder> encoder_;
  std::unique_ptr<DownloadCollector> collector_;
};

// Line printed after a successful set
std::string set_confirmation(const std::string& key);

} // namespace client
} // namespace dnskv

#pragma once

#include <memory>
#include "config/config.hpp"
#include "network/udp_server.hpp"
#include "server/download_paginator.hpp"
#include "server/query_handler.hpp"
#include "server/upload_reassembler.hpp"
#include "store/store.hpp"

namespace dnskv {
namespace server {

class TunnelServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TunnelServer(const config::ServerConfig& config);
  ~TunnelServer();

  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Starts the UDP listener
  bool start();
  // Stops the listener; stores keep their contents
  void shutdown();


  // ---- GETTERS ----
  store::KeyValueStore& get_committed_store() { return *committed_store_; }
  store::KeyValueStore& get_pending_store() { return *pending_store_; }
  store::KeyValueStore& get_outbound_store() { return *outbound_store_; }
  QueryHandler& get_query_handler() { return *query_handler_; }
  uint16_t local_port() const { return udp_server_->local_port(); }

private:
  // ---- PARAMETERS ----
  config::ServerConfig config_;

  // Stores
  std::unique_ptr<store::KeyValueStore> pending_store_;
  std::unique_ptr<store::KeyValueStore> committed_store_;
  std::unique_ptr<store::KeyValueStore> outbound_store_;

  // Protocol components
  std::unique_ptr<UploadReassembler> reassembler_;
  std::unique_ptr<DownloadPaginator> paginator_;
  std::unique_ptr<QueryHandler> query_handler_;
  std::unique_ptr<network::UDP_Server> udp_server_;
};

} // namespace server
} // namespace dnskv

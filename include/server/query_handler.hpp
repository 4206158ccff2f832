#ifndef DNSKV_SERVER_QUERY_HANDLER_HPP
#define DNSKV_SERVER_QUERY_HANDLER_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <vector>
#include "network/dns_packet.hpp"
#include "server/upload_reassembler.hpp"
#include "server/download_paginator.hpp"

namespace dnskv {
namespace server {

// Placeholder answers acknowledging upload queries
constexpr std::array<uint8_t, 4> ACK_ADDRESS_V4 = {41, 41, 41, 41};
constexpr std::array<uint8_t, 16> ACK_ADDRESS_V6 = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 41, 41, 41, 41};
constexpr uint32_t ANSWER_TTL = 2;

class QueryHandler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  QueryHandler(UploadReassembler& reassembler, DownloadPaginator& paginator);


  // ---- QUERY PROCESSING ----
  // Error boundary for one datagram: returns the serialized reply, or nullopt
  // when the datagram is dropped. Never throws.
  std::optional<std::vector<uint8_t>> handle_datagram(const std::vector<uint8_t>& datagram);
  // Answers the single question of a parsed query; throws PacketError for any
  // other question count and the component's error on a failed operation
  network::DnsPacket handle(const network::DnsPacket& query);

private:
  // ---- PARAMETERS ----
  UploadReassembler& reassembler_;
  DownloadPaginator& paginator_;


  // ---- QUESTION DISPATCH ----
  void answer_question(const network::DnsPacket& query, const network::DnsQuestion& question,
                       network::DnsPacket& reply);
};

} // namespace server
} // namespace dnskv

#endif // DNSKV_SERVER_QUERY_HANDLER_HPP

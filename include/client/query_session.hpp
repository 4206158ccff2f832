#ifndef DNSKV_CLIENT_QUERY_SESSION_HPP
#define DNSKV_CLIENT_QUERY_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "network/dns_packet.hpp"
#include "network/transport.hpp"

namespace dnskv {
namespace client {

struct RetryPolicy {
  // Wait for a reply to one send
  std::chrono::milliseconds timeout{2000};
  // Total sends of one query before giving up
  std::size_t max_attempts{3};
};

class QuerySession {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  QuerySession(network::DatagramTransport& transport, const RetryPolicy& policy);


  // ---- QUERY EXCHANGE ----
  // Sends one query and returns the matching reply. Retransmissions reuse the
  // query id so the server can recognise them. Throws TimeoutError once every
  // attempt timed out, TransportError on socket failure, MalformedNameError if
  // name cannot be encoded.
  network::DnsPacket exchange(const std::string& name, network::RecordType type);


  // Leaves one query id unused, so the next query never directly follows the
  // previous one. Marks the start of a new read sequence for the server.
  void skip_id() { ++next_id_; }


  // ---- GETTERS ----
  const RetryPolicy& get_policy() const { return policy_; }

private:
  // ---- PARAMETERS ----
  network::DatagramTransport& transport_;
  RetryPolicy policy_;
  uint16_t next_id_;


  // ---- REPLY MATCHING ----
  // Waits out one attempt; returns true and fills reply when a match arrives
  bool await_reply(uint16_t query_id, network::DnsPacket& reply);
};

} // namespace client
} // namespace dnskv

#endif // DNSKV_CLIENT_QUERY_SESSION_HPP

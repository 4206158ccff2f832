#include "client/query_session.hpp"
#include "network/tunnel_error.hpp"
#include <boost/log/trivial.hpp>
#include <random>

namespace dnskv {
namespace client {

namespace {

uint16_t generate_initial_query_id() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dis(0, 0xFFFF);
  return static_cast<uint16_t>(dis(gen));
}

} // namespace

QuerySession::QuerySession(network::DatagramTransport& transport, const RetryPolicy& policy)
  : transport_(transport)
  , policy_(policy)
  , next_id_(generate_initial_query_id()) {
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
  BOOST_LOG_TRIVIAL(debug) << "Query session: " << policy_.max_attempts << " attempts of "
                           << policy_.timeout.count() << " ms per query";
}

network::DnsPacket QuerySession::exchange(const std::string& name, network::RecordType type) {
  const uint16_t query_id = next_id_++;
  const std::vector<uint8_t> datagram =
    network::DnsCodec::serialize(network::make_query(query_id, name, type));

  for (std::size_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    BOOST_LOG_TRIVIAL(debug) << "Query session: Sending " << network::record_type_to_string(static_cast<uint16_t>(type))
                             << " query " << query_id << " for " << name
                             << " (attempt " << attempt << "/" << policy_.max_attempts << ")";
    transport_.send(datagram);

    network::DnsPacket reply;
    if (await_reply(query_id, reply)) {
      return reply;
    }
    BOOST_LOG_TRIVIAL(warning) << "Query session: No reply to query " << query_id << " for " << name
                               << " within " << policy_.timeout.count() << " ms";
  }

  throw network::TimeoutError("no reply for " + name + " after " + std::to_string(policy_.max_attempts) +
                              " attempts");
}

bool QuerySession::await_reply(uint16_t query_id, network::DnsPacket& reply) {
  const auto deadline = std::chrono::steady_clock::now() + policy_.timeout;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return false;
    }

    auto datagram = transport_.receive(remaining);
    if (!datagram) {
      return false;
    }

    try {
      reply = network::DnsCodec::deserialize(*datagram);
    }
    catch (const network::PacketError& e) {
      BOOST_LOG_TRIVIAL(debug) << "Query session: Ignoring unparsable datagram: " << e.what();
      continue;
    }

    if (reply.is_response() && reply.header.id == query_id) {
      return true;
    }
    // Late reply to an earlier attempt or query
    BOOST_LOG_TRIVIAL(debug) << "Query session: Ignoring reply " << reply.header.id
                             << " while waiting for " << query_id;
  }
}

} // namespace client
} // namespace dnskv

#include "server/query_handler.hpp"
#include "network/tunnel_error.hpp"
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace server {

QueryHandler::QueryHandler(UploadReassembler& reassembler, DownloadPaginator& paginator)
  : reassembler_(reassembler)
  , paginator_(paginator) {
  BOOST_LOG_TRIVIAL(debug) << "Query handler: Initialized";
}

std::optional<std::vector<uint8_t>> QueryHandler::handle_datagram(const std::vector<uint8_t>& datagram) {
  try {
    network::DnsPacket query = network::DnsCodec::deserialize(datagram);
    if (query.is_response()) {
      BOOST_LOG_TRIVIAL(debug) << "Query handler: Ignoring response packet " << query.header.id;
      return std::nullopt;
    }
    return network::DnsCodec::serialize(handle(query));
  }
  catch (const network::TunnelError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Query handler: Dropping datagram of " << datagram.size()
                               << " bytes [" << network::error_kind_to_string(e.kind()) << "]: " << e.what();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Query handler: Dropping datagram of " << datagram.size()
                             << " bytes: " << e.what();
  }
  return std::nullopt;
}

network::DnsPacket QueryHandler::handle(const network::DnsPacket& query) {
  // One operation per datagram, so a failure never leaves half of a query applied
  if (query.questions.size() != 1) {
    throw network::PacketError("query " + std::to_string(query.header.id) + " carries " +
                               std::to_string(query.questions.size()) + " questions, expected 1");
  }

  network::DnsPacket reply = network::make_reply(query);
  answer_question(query, query.questions.front(), reply);
  return reply;
}

void QueryHandler::answer_question(const network::DnsPacket& query, const network::DnsQuestion& question,
                                   network::DnsPacket& reply) {
  BOOST_LOG_TRIVIAL(debug) << "Query handler: " << network::record_type_to_string(question.type)
                           << " query " << query.header.id << " for " << question.name;

  switch (question.type) {
    case static_cast<uint16_t>(network::RecordType::A):
      reassembler_.commit(question.name, query.header.id);
      reply.answers.push_back(network::make_a_record(question.name, ACK_ADDRESS_V4, ANSWER_TTL));
      break;

    case static_cast<uint16_t>(network::RecordType::AAAA):
      reassembler_.append_chunk(question.name, query.header.id);
      reply.answers.push_back(network::make_aaaa_record(question.name, ACK_ADDRESS_V6, ANSWER_TTL));
      break;

    case static_cast<uint16_t>(network::RecordType::TXT): {
      auto slice = paginator_.read(question.name, query.header.id);
      if (!slice) {
        // Unknown key is reported out-of-band, never as a marker value
        reply.header.flags = static_cast<uint16_t>((reply.header.flags & ~network::RCODE_MASK) |
                                                   network::RCODE_NXDOMAIN);
        break;
      }
      reply.answers.push_back(network::make_txt_record(question.name, *slice, ANSWER_TTL));
      break;
    }

    default:
      throw network::UnsupportedQueryTypeError("type " + std::to_string(question.type) +
                                               " for " + question.name);
  }
}

} // namespace server
} // namespace dnskv

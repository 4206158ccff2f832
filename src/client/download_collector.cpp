#include "client/download_collector.hpp"
#include "codec/payload_codec.hpp"
#include "network/tunnel_error.hpp"
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace client {

DownloadCollector::DownloadCollector(QuerySession& session) : session_(session) {
  BOOST_LOG_TRIVIAL(debug) << "Download collector: Initialized";
}

codec::Message DownloadCollector::download(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Download collector: Reading key " << key;
  // Server restarts the pass when the first read does not follow an earlier one
  session_.skip_id();

  std::string incoming;
  std::size_t slices = 0;
  while (true) {
    std::string slice = read_slice(key);
    incoming += slice;
    ++slices;
    // Empty slice is terminal too
    if (slice.size() < FULL_SLICE) {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Download collector: Received " << incoming.size() << " characters in "
                          << slices << " slices for key " << key;
  return codec::PayloadCodec::decode(incoming);
}

std::string DownloadCollector::read_slice(const std::string& key) {
  network::DnsPacket reply = session_.exchange(key, network::RecordType::TXT);

  if (reply.rcode() == network::RCODE_NXDOMAIN) {
    throw network::KeyNotFoundError("server holds no value for " + key);
  }

  for (const auto& answer : reply.answers) {
    if (answer.type == static_cast<uint16_t>(network::RecordType::TXT)) {
      return network::txt_record_text(answer);
    }
  }
  throw network::FormatError("reply " + std::to_string(reply.header.id) + " for " + key +
                             " carries no TXT answer");
}

} // namespace client
} // namespace dnskv

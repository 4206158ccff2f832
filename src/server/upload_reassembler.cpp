#include "server/upload_reassembler.hpp"
#include "codec/payload_codec.hpp"
#include "network/dns_packet.hpp"
#include "network/tunnel_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace dnskv {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadReassembler::UploadReassembler(store::KeyValueStore& pending, store::KeyValueStore& committed)
  : pending_(pending)
  , committed_(committed) {
  BOOST_LOG_TRIVIAL(debug) << "Upload reassembler: Initialized";
}


//==============================================
// UPLOAD PROCESSING
//==============================================

void UploadReassembler::append_chunk(const std::string& name, uint16_t query_id) {
  std::vector<std::string> labels = network::DnsCodec::split_labels(name);
  if (labels.size() < 2) {
    BOOST_LOG_TRIVIAL(warning) << "Upload reassembler: Chunk name without transaction id: " << name;
    throw network::MalformedNameError("chunk name \"" + name + "\" needs <chunk>.<transaction id>");
  }

  const std::string& chunk = labels[0];
  const std::string transaction_id = store::fold_key(labels[1]);

  std::lock_guard<std::mutex> lock(mutex_);

  auto it = last_chunk_ids_.find(transaction_id);
  if (it != last_chunk_ids_.end() && it->second == query_id) {
    BOOST_LOG_TRIVIAL(debug) << "Upload reassembler: Ignoring retransmitted chunk " << query_id
                             << " for transaction " << transaction_id;
    return;
  }

  pending_.append(transaction_id, chunk);
  last_chunk_ids_[transaction_id] = query_id;
  BOOST_LOG_TRIVIAL(debug) << "Upload reassembler: Appended " << chunk.size()
                           << " characters to transaction " << transaction_id;
}

void UploadReassembler::commit(const std::string& name, uint16_t query_id) {
  const std::string transaction_id = store::fold_key(name);
  if (transaction_id.empty()) {
    throw network::MalformedNameError("commit query without transaction id");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (is_repeated_commit(transaction_id, query_id)) {
    BOOST_LOG_TRIVIAL(debug) << "Upload reassembler: Acknowledging retransmitted commit for transaction "
                             << transaction_id;
    return;
  }

  auto accumulated = pending_.take(transaction_id);
  last_chunk_ids_.erase(transaction_id);
  if (!accumulated) {
    BOOST_LOG_TRIVIAL(warning) << "Upload reassembler: Commit for unknown transaction " << transaction_id;
    throw network::DecodeError("no pending upload for transaction " + transaction_id);
  }

  codec::Message message = codec::PayloadCodec::decode(*accumulated);
  if (message.key.empty()) {
    throw network::DecodeError("transaction " + transaction_id + " carries an empty key");
  }

  committed_.set(message.key, message.value);
  remember_commit(transaction_id, query_id);
  BOOST_LOG_TRIVIAL(info) << "Upload reassembler: Committed " << message.value.size()
                          << " bytes under key " << store::fold_key(message.key)
                          << " from transaction " << transaction_id;
}


//==============================================
// RETRANSMISSION TRACKING
//==============================================

bool UploadReassembler::is_repeated_commit(const std::string& transaction_id, uint16_t query_id) const {
  return std::find(recent_commits_.begin(), recent_commits_.end(),
                   std::make_pair(transaction_id, query_id)) != recent_commits_.end();
}

void UploadReassembler::remember_commit(const std::string& transaction_id, uint16_t query_id) {
  recent_commits_.emplace_back(transaction_id, query_id);
  if (recent_commits_.size() > COMMIT_HISTORY) {
    recent_commits_.pop_front();
  }
}

} // namespace server
} // namespace dnskv

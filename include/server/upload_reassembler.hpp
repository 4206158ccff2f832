#ifndef DNSKV_SERVER_UPLOAD_REASSEMBLER_HPP
#define DNSKV_SERVER_UPLOAD_REASSEMBLER_HPP

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include "store/store.hpp"

namespace dnskv {
namespace server {

class UploadReassembler {
public:
  // Number of committed transactions remembered for retransmitted commits
  static constexpr std::size_t COMMIT_HISTORY = 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UploadReassembler(store::KeyValueStore& pending, store::KeyValueStore& committed);


  // ---- UPLOAD PROCESSING ----
  // Appends the chunk carried by a "<chunk>.<transaction id>" query name.
  // Throws network::MalformedNameError when either label is missing.
  void append_chunk(const std::string& name, uint16_t query_id);
  // Decodes the upload accumulated for the transaction id in name and installs
  // its value under the message key. Throws network::DecodeError when there is
  // no pending upload or it does not decode.
  void commit(const std::string& name, uint16_t query_id);

private:
  // ---- PARAMETERS ----
  store::KeyValueStore& pending_;
  store::KeyValueStore& committed_;
  std::mutex mutex_;
  // DNS id of the last chunk appended per transaction
  std::unordered_map<std::string, uint16_t> last_chunk_ids_;
  // Transaction id and DNS id of recent commits, oldest first
  std::deque<std::pair<std::string, uint16_t>> recent_commits_;


  // ---- RETRANSMISSION TRACKING ----
  bool is_repeated_commit(const std::string& transaction_id, uint16_t query_id) const;
  void remember_commit(const std::string& transaction_id, uint16_t query_id);
};

} // namespace server
} // namespace dnskv

#endif // DNSKV_SERVER_UPLOAD_REASSEMBLER_HPP

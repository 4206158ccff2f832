#ifndef DNSKV_CLIENT_UPLOAD_ENCODER_HPP
#define DNSKV_CLIENT_UPLOAD_ENCODER_HPP

#include <string>
#include <vector>
#include "client/query_session.hpp"

namespace dnskv {
namespace client {

class UploadEncoder {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit UploadEncoder(QuerySession& session);


  // ---- UPLOAD OPERATIONS ----
  // Uploads key/value under a fresh transaction id and returns that id
  std::string upload(const std::string& key, const std::string& value);
  // Sends every chunk of the encoded message, one AAAA query at a time, then
  // the A query that commits transaction_id
  void upload_with_id(const std::string& key, const std::string& value, const std::string& transaction_id);


  // ---- CHUNKING ----
  // Lowercase hex of a random 16-bit number from OpenSSL's CSPRNG
  static std::string generate_transaction_id();
  // Chunk length keeping "<chunk>.<transaction id>" within one 63-octet label budget
  static std::size_t chunk_size(const std::string& transaction_id);
  // Query names of every chunk, in send order
  static std::vector<std::string> build_chunk_names(const std::string& encoded,
                                                    const std::string& transaction_id);

private:
  // ---- PARAMETERS ----
  QuerySession& session_;
};

} // namespace client
} // namespace dnskv

#endif // DNSKV_CLIENT_UPLOAD_ENCODER_HPP

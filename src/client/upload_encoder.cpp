#include "client/upload_encoder.hpp"
#include "codec/payload_codec.hpp"
#include "network/tunnel_error.hpp"
#include <array>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <openssl/rand.h>

namespace dnskv {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadEncoder::UploadEncoder(QuerySession& session) : session_(session) {
  BOOST_LOG_TRIVIAL(debug) << "Upload encoder: Initialized";
}


//==============================================
// UPLOAD OPERATIONS
//==============================================

std::string UploadEncoder::upload(const std::string& key, const std::string& value) {
  std::string transaction_id = generate_transaction_id();
  upload_with_id(key, value, transaction_id);
  return transaction_id;
}

void UploadEncoder::upload_with_id(const std::string& key, const std::string& value,
                                   const std::string& transaction_id) {
  const std::string encoded = codec::PayloadCodec::encode(codec::Message{key, value});
  const std::vector<std::string> names = build_chunk_names(encoded, transaction_id);

  BOOST_LOG_TRIVIAL(info) << "Upload encoder: Uploading key " << key << " as " << names.size()
                          << " chunks in transaction " << transaction_id;

  // Strictly one chunk in flight; the reply only acknowledges receipt
  for (const auto& name : names) {
    session_.exchange(name, network::RecordType::AAAA);
  }

  session_.exchange(transaction_id, network::RecordType::A);
  BOOST_LOG_TRIVIAL(info) << "Upload encoder: Committed transaction " << transaction_id;
}


//==============================================
// CHUNKING
//==============================================

std::string UploadEncoder::generate_transaction_id() {
  std::array<uint8_t, 2> bytes;
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("Upload encoder: Failed to generate transaction id");
  }

  uint16_t id = static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
  std::stringstream ss;
  ss << std::hex << id;
  return ss.str();
}

std::size_t UploadEncoder::chunk_size(const std::string& transaction_id) {
  // Suffix is "." followed by the transaction id
  std::size_t suffix_length = transaction_id.size() + 1;
  if (transaction_id.empty() || suffix_length >= network::MAX_LABEL_LENGTH) {
    throw network::MalformedNameError("unusable transaction id \"" + transaction_id + "\"");
  }
  return network::MAX_LABEL_LENGTH - suffix_length;
}

std::vector<std::string> UploadEncoder::build_chunk_names(const std::string& encoded,
                                                          const std::string& transaction_id) {
  const std::size_t size = chunk_size(transaction_id);
  const std::string suffix = "." + transaction_id;

  std::vector<std::string> names;
  names.reserve((encoded.size() + size - 1) / size);
  for (std::size_t start = 0; start < encoded.size(); start += size) {
    names.push_back(encoded.substr(start, size) + suffix);
  }
  return names;
}

} // namespace client
} // namespace dnskv

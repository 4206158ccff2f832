#include "codec/payload_codec.hpp"
#include "codec/base32.hpp"
#include "network/tunnel_error.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>

namespace dnskv {
namespace codec {

//==============================================
// TEXT ENCODING
//==============================================

std::string PayloadCodec::encode(const Message& message) {
  std::string text = base32_encode(serialize(message));
  BOOST_LOG_TRIVIAL(debug) << "Payload codec: Encoded message for key " << message.key
                           << " into " << text.size() << " characters";
  return text;
}

Message PayloadCodec::decode(const std::string& text) {
  try {
    return deserialize(base32_decode(text));
  }
  catch (const network::FormatError& e) {
    BOOST_LOG_TRIVIAL(error) << "Payload codec: Failed to decode " << text.size()
                             << " characters: " << e.what();
    throw;
  }
}


//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::vector<uint8_t> PayloadCodec::serialize(const Message& message) {
  std::vector<uint8_t> output;
  output.reserve(2 * sizeof(uint64_t) + message.key.size() + message.value.size());
  write_field(output, message.key);
  write_field(output, message.value);
  return output;
}

Message PayloadCodec::deserialize(const std::vector<uint8_t>& bytes) {
  Message message;
  std::size_t offset = 0;
  message.key = read_field(bytes, offset);
  message.value = read_field(bytes, offset);

  if (offset != bytes.size()) {
    throw network::FormatError("Payload codec: " + std::to_string(bytes.size() - offset) +
                               " trailing bytes after message");
  }
  return message;
}


//==============================================
// FIELD OPERATIONS
//==============================================

void PayloadCodec::write_field(std::vector<uint8_t>& output, const std::string& field) {
  uint64_t wire_length = to_wire_order(static_cast<uint64_t>(field.size()));
  const auto* length_bytes = reinterpret_cast<const uint8_t*>(&wire_length);
  output.insert(output.end(), length_bytes, length_bytes + sizeof(wire_length));
  output.insert(output.end(), field.begin(), field.end());
}

std::string PayloadCodec::read_field(const std::vector<uint8_t>& input, std::size_t& offset) {
  uint64_t wire_length = 0;
  if (input.size() - offset < sizeof(wire_length)) {
    throw network::FormatError("Payload codec: truncated length prefix");
  }
  std::memcpy(&wire_length, input.data() + offset, sizeof(wire_length));
  offset += sizeof(wire_length);

  uint64_t length = from_wire_order(wire_length);
  if (length > input.size() - offset) {
    throw network::FormatError("Payload codec: field length " + std::to_string(length) +
                               " exceeds remaining " + std::to_string(input.size() - offset) + " bytes");
  }

  std::string field(input.begin() + offset, input.begin() + offset + length);
  offset += length;
  return field;
}

} // namespace codec
} // namespace dnskv

#ifndef DNSKV_CODEC_PAYLOAD_CODEC_HPP
#define DNSKV_CODEC_PAYLOAD_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "codec/message.hpp"

namespace dnskv {
namespace codec {

class PayloadCodec {
public:
  // ---- TEXT ENCODING ----
  // Serializes a message and maps the bytes to label-safe base-32 text
  static std::string encode(const Message& message);
  // Inverse of encode; throws network::FormatError on malformed text
  static Message decode(const std::string& text);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Each field is a little-endian u64 byte length followed by the raw bytes
  static std::vector<uint8_t> serialize(const Message& message);
  static Message deserialize(const std::vector<uint8_t>& bytes);

private:
  // ---- FIELD OPERATIONS ----
  static void write_field(std::vector<uint8_t>& output, const std::string& field);
  static std::string read_field(const std::vector<uint8_t>& input, std::size_t& offset);

  
  // ---- HOST TO WIRE BYTE ORDER CONVERSION ----
  static uint64_t to_wire_order(uint64_t host_value) {
    return boost::endian::native_to_little(host_value);
  }
  static uint64_t from_wire_order(uint64_t wire_value) {
    return boost::endian::little_to_native(wire_value);
  }
};

} // namespace codec
} // namespace dnskv

#endif // DNSKV_CODEC_PAYLOAD_CODEC_HPP

#include "codec/base32.hpp"
#include "network/tunnel_error.hpp"
#include <array>

namespace dnskv {
namespace codec {

namespace {

constexpr char ENCODE_TABLE[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr uint8_t INVALID = 0xFF;

std::array<uint8_t, 256> build_decode_table() {
  std::array<uint8_t, 256> table{};
  table.fill(INVALID);
  for (std::size_t i = 0; i < 32; ++i) {
    auto symbol = static_cast<uint8_t>(ENCODE_TABLE[i]);
    table[symbol] = static_cast<uint8_t>(i);
    // DNS names are case-insensitive on the wire
    if (symbol >= 'A' && symbol <= 'Z') {
      table[symbol - 'A' + 'a'] = static_cast<uint8_t>(i);
    }
  }
  return table;
}

const std::array<uint8_t, 256> DECODE_TABLE = build_decode_table();

} // namespace

std::string base32_encode(const std::vector<uint8_t>& data) {
  std::string out;
  out.reserve((data.size() * 8 + 4) / 5);

  uint32_t buffer = 0;
  int bits = 0;
  for (uint8_t byte : data) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      out.push_back(ENCODE_TABLE[(buffer >> (bits - 5)) & 0x1F]);
      bits -= 5;
    }
  }

  // Final partial group is left-aligned and zero filled
  if (bits > 0) {
    out.push_back(ENCODE_TABLE[(buffer << (5 - bits)) & 0x1F]);
  }
  return out;
}

std::vector<uint8_t> base32_decode(const std::string& text) {
  // 1, 3 and 6 symbols can never close a group of whole bytes
  std::size_t remainder = text.size() % 8;
  if (remainder == 1 || remainder == 3 || remainder == 6) {
    throw network::FormatError("Base32: invalid encoded length " + std::to_string(text.size()));
  }

  std::vector<uint8_t> out;
  out.reserve(text.size() * 5 / 8);

  uint32_t buffer = 0;
  int bits = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    uint8_t value = DECODE_TABLE[static_cast<uint8_t>(text[i])];
    if (value == INVALID) {
      throw network::FormatError("Base32: invalid symbol at offset " + std::to_string(i));
    }
    buffer = (buffer << 5) | value;
    bits += 5;
    if (bits >= 8) {
      out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
      bits -= 8;
    }
  }

  if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
    throw network::FormatError("Base32: non-zero trailing bits");
  }
  return out;
}

} // namespace codec
} // namespace dnskv

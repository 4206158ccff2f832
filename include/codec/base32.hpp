#ifndef DNSKV_CODEC_BASE32_HPP
#define DNSKV_CODEC_BASE32_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace dnskv {
namespace codec {

// RFC 4648 base-32 without padding. Output is uppercase A-Z2-7, which is safe
// inside a DNS label; decoding accepts either letter case.
std::string base32_encode(const std::vector<uint8_t>& data);

// Throws network::FormatError on foreign characters, impossible lengths or
// non-zero trailing bits
std::vector<uint8_t> base32_decode(const std::string& text);

} // namespace codec
} // namespace dnskv

#endif // DNSKV_CODEC_BASE32_HPP

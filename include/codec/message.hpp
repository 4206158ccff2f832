#ifndef DNSKV_CODEC_MESSAGE_HPP
#define DNSKV_CODEC_MESSAGE_HPP

#include <string>

namespace dnskv {
namespace codec {

// Logical unit of storage carried through the tunnel
struct Message {
    std::string key;
    std::string value;
};

inline bool operator==(const Message& lhs, const Message& rhs) {
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

inline bool operator!=(const Message& lhs, const Message& rhs) {
    return !(lhs == rhs);
}

} // namespace codec
} // namespace dnskv

#endif // DNSKV_CODEC_MESSAGE_HPP

#ifndef DNSKV_NETWORK_TUNNEL_ERROR_HPP
#define DNSKV_NETWORK_TUNNEL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dnskv {
namespace network {

enum class ErrorKind {
    MALFORMED_NAME = 0,
    DECODE,
    FORMAT,
    UNSUPPORTED_QUERY_TYPE,
    MALFORMED_PACKET,
    TRANSPORT,
    TIMEOUT,
    KEY_NOT_FOUND
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_NAME: return "Malformed name";
        case ErrorKind::DECODE: return "Decode error";
        case ErrorKind::FORMAT: return "Format error";
        case ErrorKind::UNSUPPORTED_QUERY_TYPE: return "Unsupported query type";
        case ErrorKind::MALFORMED_PACKET: return "Malformed packet";
        case ErrorKind::TRANSPORT: return "Transport error";
        case ErrorKind::TIMEOUT: return "Timeout";
        case ErrorKind::KEY_NOT_FOUND: return "Key not found";
        default: return "Undefined error";
    }
}

class TunnelError : public std::runtime_error {
public:
    TunnelError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class MalformedNameError : public TunnelError {
public:
    explicit MalformedNameError(const std::string& message)
        : TunnelError(ErrorKind::MALFORMED_NAME, message) {}
};

class DecodeError : public TunnelError {
public:
    explicit DecodeError(const std::string& message)
        : TunnelError(ErrorKind::DECODE, message) {}

protected:
    DecodeError(ErrorKind kind, const std::string& message)
        : TunnelError(kind, message) {}
};

// Alphabet or struct layout violation; catchable as a DecodeError
class FormatError : public DecodeError {
public:
    explicit FormatError(const std::string& message)
        : DecodeError(ErrorKind::FORMAT, message) {}
};

class UnsupportedQueryTypeError : public TunnelError {
public:
    explicit UnsupportedQueryTypeError(const std::string& message)
        : TunnelError(ErrorKind::UNSUPPORTED_QUERY_TYPE, message) {}
};

class PacketError : public TunnelError {
public:
    explicit PacketError(const std::string& message)
        : TunnelError(ErrorKind::MALFORMED_PACKET, message) {}
};

class TransportError : public TunnelError {
public:
    explicit TransportError(const std::string& message)
        : TunnelError(ErrorKind::TRANSPORT, message) {}
};

class TimeoutError : public TunnelError {
public:
    explicit TimeoutError(const std::string& message)
        : TunnelError(ErrorKind::TIMEOUT, message) {}
};

class KeyNotFoundError : public TunnelError {
public:
    explicit KeyNotFoundError(const std::string& message)
        : TunnelError(ErrorKind::KEY_NOT_FOUND, message) {}
};

} // namespace network
} // namespace dnskv

#endif // DNSKV_NETWORK_TUNNEL_ERROR_HPP

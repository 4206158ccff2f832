#ifndef DNSKV_NETWORK_DNS_PACKET_HPP
#define DNSKV_NETWORK_DNS_PACKET_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <boost/endian/conversion.hpp>

namespace dnskv {
namespace network {

// Record types the tunnel uses to signal an operation
enum class RecordType : uint16_t {
    A = 1,
    TXT = 16,
    AAAA = 28
};

const char* record_type_to_string(uint16_t type);

constexpr uint16_t CLASS_IN = 1;

// Header flag bits
constexpr uint16_t FLAG_QR = 0x8000;
constexpr uint16_t FLAG_AA = 0x0400;
constexpr uint16_t FLAG_TC = 0x0200;
constexpr uint16_t FLAG_RD = 0x0100;
constexpr uint16_t FLAG_RA = 0x0080;
constexpr uint16_t RCODE_MASK = 0x000F;

constexpr uint16_t RCODE_NOERROR = 0;
constexpr uint16_t RCODE_NXDOMAIN = 3;

constexpr std::size_t MAX_LABEL_LENGTH = 63;
constexpr std::size_t MAX_NAME_LENGTH = 255;
constexpr std::size_t MAX_CHARACTER_STRING = 255;

struct DnsHeader {
    uint16_t id = 0;
    uint16_t flags = 0;
    uint16_t qdcount = 0;
    uint16_t ancount = 0;
    uint16_t nscount = 0;
    uint16_t arcount = 0;
};

struct DnsQuestion {
    std::string name;
    uint16_t type = 0;
    uint16_t qclass = CLASS_IN;
};

struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = CLASS_IN;
    uint32_t ttl = 0;
    std::vector<uint8_t> rdata;
};

struct DnsPacket {
    DnsHeader header;
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;

    bool is_response() const { return (header.flags & FLAG_QR) != 0; }
    uint16_t rcode() const { return header.flags & RCODE_MASK; }
};

class DnsCodec {
public:
  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes header, questions and answers; counts are taken from the vectors
  static std::vector<uint8_t> serialize(const DnsPacket& packet);
  // Parses a datagram; throws PacketError if it is truncated or malformed.
  // Authority and additional sections are skipped.
  static DnsPacket deserialize(const std::vector<uint8_t>& datagram);


  // ---- NAME HANDLING ----
  // Splits a dotted name into labels; throws MalformedNameError on empty or
  // oversized labels or an oversized name
  static std::vector<std::string> split_labels(const std::string& name);

private:
  // ---- WRITE OPERATIONS ----
  static void write_u16(std::vector<uint8_t>& output, uint16_t value);
  static void write_u32(std::vector<uint8_t>& output, uint32_t value);
  static void write_name(std::vector<uint8_t>& output, const std::string& name);


  // ---- READ OPERATIONS ----
  static uint16_t read_u16(const std::vector<uint8_t>& input, std::size_t& offset);
  static uint32_t read_u32(const std::vector<uint8_t>& input, std::size_t& offset);
  // Follows compression pointers, bounded to avoid loops
  static std::string read_name(const std::vector<uint8_t>& input, std::size_t& offset);
  static DnsRecord read_record(const std::vector<uint8_t>& input, std::size_t& offset);
  static void require(const std::vector<uint8_t>& input, std::size_t offset, std::size_t size);
};


// ---- PACKET CONSTRUCTION ----
// Builds a recursion-desired query for one name
DnsPacket make_query(uint16_t id, const std::string& name, RecordType type);
// Builds an empty reply to a query: same id, questions echoed, RD copied
DnsPacket make_reply(const DnsPacket& query, uint16_t rcode = RCODE_NOERROR);

DnsRecord make_a_record(const std::string& name, const std::array<uint8_t, 4>& address, uint32_t ttl);
DnsRecord make_aaaa_record(const std::string& name, const std::array<uint8_t, 16>& address, uint32_t ttl);
// Splits text into character-strings of at most 255 bytes; empty text yields
// one empty character-string
DnsRecord make_txt_record(const std::string& name, const std::string& text, uint32_t ttl);

// Concatenates every character-string of a TXT record
std::string txt_record_text(const DnsRecord& record);

} // namespace network
} // namespace dnskv

#endif // DNSKV_NETWORK_DNS_PACKET_HPP

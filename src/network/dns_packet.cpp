#include "network/dns_packet.hpp"
#include "network/tunnel_error.hpp"
#include <algorithm>

namespace dnskv {
namespace network {

namespace {

constexpr std::size_t HEADER_SIZE = 12;
constexpr uint8_t POINTER_MASK = 0xC0;
constexpr int MAX_POINTER_JUMPS = 16;

} // namespace

const char* record_type_to_string(uint16_t type) {
  switch (type) {
    case static_cast<uint16_t>(RecordType::A): return "A";
    case static_cast<uint16_t>(RecordType::TXT): return "TXT";
    case static_cast<uint16_t>(RecordType::AAAA): return "AAAA";
    default: return "UNKNOWN";
  }
}

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::vector<uint8_t> DnsCodec::serialize(const DnsPacket& packet) {
  std::vector<uint8_t> output;
  output.reserve(512);

  write_u16(output, packet.header.id);
  write_u16(output, packet.header.flags);
  write_u16(output, static_cast<uint16_t>(packet.questions.size()));
  write_u16(output, static_cast<uint16_t>(packet.answers.size()));
  write_u16(output, 0);
  write_u16(output, 0);

  for (const auto& question : packet.questions) {
    write_name(output, question.name);
    write_u16(output, question.type);
    write_u16(output, question.qclass);
  }

  for (const auto& answer : packet.answers) {
    if (answer.rdata.size() > 0xFFFF) {
      throw PacketError("DNS codec: rdata of " + std::to_string(answer.rdata.size()) + " bytes");
    }
    write_name(output, answer.name);
    write_u16(output, answer.type);
    write_u16(output, answer.rclass);
    write_u32(output, answer.ttl);
    write_u16(output, static_cast<uint16_t>(answer.rdata.size()));
    output.insert(output.end(), answer.rdata.begin(), answer.rdata.end());
  }

  return output;
}

DnsPacket DnsCodec::deserialize(const std::vector<uint8_t>& datagram) {
  if (datagram.size() < HEADER_SIZE) {
    throw PacketError("DNS codec: datagram of " + std::to_string(datagram.size()) +
                      " bytes is shorter than a header");
  }

  DnsPacket packet;
  std::size_t offset = 0;
  packet.header.id = read_u16(datagram, offset);
  packet.header.flags = read_u16(datagram, offset);
  packet.header.qdcount = read_u16(datagram, offset);
  packet.header.ancount = read_u16(datagram, offset);
  packet.header.nscount = read_u16(datagram, offset);
  packet.header.arcount = read_u16(datagram, offset);

  for (uint16_t i = 0; i < packet.header.qdcount; ++i) {
    DnsQuestion question;
    question.name = read_name(datagram, offset);
    question.type = read_u16(datagram, offset);
    question.qclass = read_u16(datagram, offset);
    packet.questions.push_back(std::move(question));
  }

  for (uint16_t i = 0; i < packet.header.ancount; ++i) {
    packet.answers.push_back(read_record(datagram, offset));
  }

  return packet;
}


//==============================================
// NAME HANDLING
//==============================================

std::vector<std::string> DnsCodec::split_labels(const std::string& name) {
  std::vector<std::string> labels;
  if (name.empty() || name == ".") {
    return labels;
  }

  // A single trailing dot marks the root and is not a label
  std::string trimmed = name.back() == '.' ? name.substr(0, name.size() - 1) : name;

  std::size_t wire_length = 1;
  std::size_t start = 0;
  while (start <= trimmed.size()) {
    std::size_t dot = trimmed.find('.', start);
    if (dot == std::string::npos) {
      dot = trimmed.size();
    }

    std::string label = trimmed.substr(start, dot - start);
    if (label.empty()) {
      throw MalformedNameError("empty label in \"" + name + "\"");
    }
    if (label.size() > MAX_LABEL_LENGTH) {
      throw MalformedNameError("label of " + std::to_string(label.size()) +
                               " octets in \"" + name + "\"");
    }

    wire_length += label.size() + 1;
    labels.push_back(std::move(label));
    start = dot + 1;
  }

  if (wire_length > MAX_NAME_LENGTH) {
    throw MalformedNameError("name of " + std::to_string(wire_length) + " octets exceeds " +
                             std::to_string(MAX_NAME_LENGTH));
  }
  return labels;
}


//==============================================
// WRITE OPERATIONS
//==============================================

void DnsCodec::write_u16(std::vector<uint8_t>& output, uint16_t value) {
  uint16_t network_value = boost::endian::native_to_big(value);
  const auto* bytes = reinterpret_cast<const uint8_t*>(&network_value);
  output.insert(output.end(), bytes, bytes + sizeof(network_value));
}

void DnsCodec::write_u32(std::vector<uint8_t>& output, uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  const auto* bytes = reinterpret_cast<const uint8_t*>(&network_value);
  output.insert(output.end(), bytes, bytes + sizeof(network_value));
}

void DnsCodec::write_name(std::vector<uint8_t>& output, const std::string& name) {
  for (const auto& label : split_labels(name)) {
    output.push_back(static_cast<uint8_t>(label.size()));
    output.insert(output.end(), label.begin(), label.end());
  }
  output.push_back(0x00);
}


//==============================================
// READ OPERATIONS
//==============================================

void DnsCodec::require(const std::vector<uint8_t>& input, std::size_t offset, std::size_t size) {
  if (offset > input.size() || input.size() - offset < size) {
    throw PacketError("DNS codec: truncated datagram, need " + std::to_string(size) +
                      " bytes at offset " + std::to_string(offset));
  }
}

uint16_t DnsCodec::read_u16(const std::vector<uint8_t>& input, std::size_t& offset) {
  require(input, offset, sizeof(uint16_t));
  uint16_t value = static_cast<uint16_t>((input[offset] << 8) | input[offset + 1]);
  offset += sizeof(uint16_t);
  return value;
}

uint32_t DnsCodec::read_u32(const std::vector<uint8_t>& input, std::size_t& offset) {
  uint32_t high = read_u16(input, offset);
  uint32_t low = read_u16(input, offset);
  return (high << 16) | low;
}

std::string DnsCodec::read_name(const std::vector<uint8_t>& input, std::size_t& offset) {
  std::string name;
  std::size_t position = offset;
  bool jumped = false;
  int jumps = 0;

  while (true) {
    require(input, position, 1);
    uint8_t length = input[position];

    if ((length & POINTER_MASK) == POINTER_MASK) {
      require(input, position, 2);
      if (++jumps > MAX_POINTER_JUMPS) {
        throw PacketError("DNS codec: compression pointer loop");
      }
      std::size_t target = (static_cast<std::size_t>(length & ~POINTER_MASK) << 8) | input[position + 1];
      if (!jumped) {
        offset = position + 2;
        jumped = true;
      }
      position = target;
      continue;
    }

    if ((length & POINTER_MASK) != 0) {
      throw PacketError("DNS codec: unsupported label type " + std::to_string(length));
    }

    ++position;
    if (length == 0) {
      break;
    }

    require(input, position, length);
    if (!name.empty()) {
      name.push_back('.');
    }
    name.append(input.begin() + position, input.begin() + position + length);
    position += length;

    if (name.size() + 1 > MAX_NAME_LENGTH) {
      throw PacketError("DNS codec: name exceeds " + std::to_string(MAX_NAME_LENGTH) + " octets");
    }
  }

  if (!jumped) {
    offset = position;
  }
  return name;
}

DnsRecord DnsCodec::read_record(const std::vector<uint8_t>& input, std::size_t& offset) {
  DnsRecord record;
  record.name = read_name(input, offset);
  record.type = read_u16(input, offset);
  record.rclass = read_u16(input, offset);
  record.ttl = read_u32(input, offset);

  uint16_t rdlength = read_u16(input, offset);
  require(input, offset, rdlength);
  record.rdata.assign(input.begin() + offset, input.begin() + offset + rdlength);
  offset += rdlength;
  return record;
}


//==============================================
// PACKET CONSTRUCTION
//==============================================

DnsPacket make_query(uint16_t id, const std::string& name, RecordType type) {
  // Validate early so the caller sees a MalformedNameError before sending
  DnsCodec::split_labels(name);

  DnsPacket packet;
  packet.header.id = id;
  packet.header.flags = FLAG_RD;

  DnsQuestion question;
  question.name = name;
  question.type = static_cast<uint16_t>(type);
  question.qclass = CLASS_IN;
  packet.questions.push_back(question);
  return packet;
}

DnsPacket make_reply(const DnsPacket& query, uint16_t rcode) {
  DnsPacket reply;
  reply.header.id = query.header.id;
  reply.header.flags = static_cast<uint16_t>(FLAG_QR | FLAG_RA | (query.header.flags & FLAG_RD) |
                                             (rcode & RCODE_MASK));
  reply.questions = query.questions;
  return reply;
}

DnsRecord make_a_record(const std::string& name, const std::array<uint8_t, 4>& address, uint32_t ttl) {
  DnsRecord record;
  record.name = name;
  record.type = static_cast<uint16_t>(RecordType::A);
  record.ttl = ttl;
  record.rdata.assign(address.begin(), address.end());
  return record;
}

DnsRecord make_aaaa_record(const std::string& name, const std::array<uint8_t, 16>& address, uint32_t ttl) {
  DnsRecord record;
  record.name = name;
  record.type = static_cast<uint16_t>(RecordType::AAAA);
  record.ttl = ttl;
  record.rdata.assign(address.begin(), address.end());
  return record;
}

DnsRecord make_txt_record(const std::string& name, const std::string& text, uint32_t ttl) {
  DnsRecord record;
  record.name = name;
  record.type = static_cast<uint16_t>(RecordType::TXT);
  record.ttl = ttl;

  std::size_t start = 0;
  do {
    std::size_t length = std::min(MAX_CHARACTER_STRING, text.size() - start);
    record.rdata.push_back(static_cast<uint8_t>(length));
    record.rdata.insert(record.rdata.end(), text.begin() + start, text.begin() + start + length);
    start += length;
  } while (start < text.size());

  return record;
}

std::string txt_record_text(const DnsRecord& record) {
  if (record.type != static_cast<uint16_t>(RecordType::TXT)) {
    throw FormatError("expected a TXT record, got " + std::string(record_type_to_string(record.type)));
  }

  std::string text;
  std::size_t offset = 0;
  while (offset < record.rdata.size()) {
    std::size_t length = record.rdata[offset++];
    if (length > record.rdata.size() - offset) {
      throw FormatError("TXT character-string overruns rdata");
    }
    text.append(record.rdata.begin() + offset, record.rdata.begin() + offset + length);
    offset += length;
  }
  return text;
}

} // namespace network
} // namespace dnskv

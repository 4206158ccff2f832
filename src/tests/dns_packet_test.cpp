#include <gtest/gtest.h>
#include "network/dns_packet.hpp"
#include "network/tunnel_error.hpp"

using namespace dnskv::network;

class DnsPacketTest : public ::testing::Test {
protected:
  // Query for "ab.c" with id 0x1234, type A, recursion desired
  const std::vector<uint8_t> SIMPLE_QUERY = {
    0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x02, 'a', 'b', 0x01, 'c', 0x00,
    0x00, 0x01, 0x00, 0x01
  };

  // Appends a compressed A answer pointing back at the question name
  static std::vector<uint8_t> with_compressed_answer(std::vector<uint8_t> datagram) {
    datagram[2] |= 0x80;  // QR
    datagram[7] = 0x01;   // ANCOUNT
    const std::vector<uint8_t> answer = {
      0xC0, 0x0C, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x02,
      0x00, 0x04, 41, 41, 41, 41
    };
    datagram.insert(datagram.end(), answer.begin(), answer.end());
    return datagram;
  }
};

TEST_F(DnsPacketTest, SerializesQuery) {
  auto query = make_query(0x1234, "ab.c", RecordType::A);
  EXPECT_EQ(DnsCodec::serialize(query), SIMPLE_QUERY);
}

TEST_F(DnsPacketTest, ParsesQuery) {
  auto packet = DnsCodec::deserialize(SIMPLE_QUERY);
  EXPECT_EQ(packet.header.id, 0x1234);
  EXPECT_FALSE(packet.is_response());
  ASSERT_EQ(packet.questions.size(), 1u);
  EXPECT_EQ(packet.questions[0].name, "ab.c");
  EXPECT_EQ(packet.questions[0].type, static_cast<uint16_t>(RecordType::A));
  EXPECT_EQ(packet.questions[0].qclass, CLASS_IN);
  EXPECT_TRUE(packet.answers.empty());
}

TEST_F(DnsPacketTest, FollowsCompressionPointers) {
  auto packet = DnsCodec::deserialize(with_compressed_answer(SIMPLE_QUERY));
  EXPECT_TRUE(packet.is_response());
  ASSERT_EQ(packet.answers.size(), 1u);
  EXPECT_EQ(packet.answers[0].name, "ab.c");
  EXPECT_EQ(packet.answers[0].ttl, 2u);
  EXPECT_EQ(packet.answers[0].rdata, (std::vector<uint8_t>{41, 41, 41, 41}));
}

TEST_F(DnsPacketTest, RejectsPointerLoop) {
  std::vector<uint8_t> datagram(SIMPLE_QUERY.begin(), SIMPLE_QUERY.begin() + 12);
  // Name that points at itself
  datagram.push_back(0xC0);
  datagram.push_back(0x0C);
  datagram.insert(datagram.end(), {0x00, 0x01, 0x00, 0x01});
  EXPECT_THROW(DnsCodec::deserialize(datagram), PacketError);
}

TEST_F(DnsPacketTest, RejectsTruncatedDatagrams) {
  EXPECT_THROW(DnsCodec::deserialize({}), PacketError);
  EXPECT_THROW(DnsCodec::deserialize(std::vector<uint8_t>(SIMPLE_QUERY.begin(), SIMPLE_QUERY.begin() + 8)),
               PacketError);
  EXPECT_THROW(DnsCodec::deserialize(std::vector<uint8_t>(SIMPLE_QUERY.begin(), SIMPLE_QUERY.end() - 3)),
               PacketError);

  // Answer count larger than the answers present
  auto datagram = SIMPLE_QUERY;
  datagram[7] = 0x01;
  EXPECT_THROW(DnsCodec::deserialize(datagram), PacketError);
}

TEST_F(DnsPacketTest, SplitsAndValidatesLabels) {
  EXPECT_EQ(DnsCodec::split_labels("chunk.1a2b"), (std::vector<std::string>{"chunk", "1a2b"}));
  EXPECT_EQ(DnsCodec::split_labels("chunk.1a2b."), (std::vector<std::string>{"chunk", "1a2b"}));
  EXPECT_TRUE(DnsCodec::split_labels("").empty());

  EXPECT_NO_THROW(DnsCodec::split_labels(std::string(63, 'a')));
  EXPECT_THROW(DnsCodec::split_labels(std::string(64, 'a')), MalformedNameError);
  EXPECT_THROW(DnsCodec::split_labels("a..b"), MalformedNameError);
  EXPECT_THROW(DnsCodec::split_labels(".a"), MalformedNameError);

  // Four full labels need 257 octets on the wire
  const std::string label(63, 'a');
  EXPECT_NO_THROW(DnsCodec::split_labels(label + "." + label + "." + label));
  EXPECT_THROW(DnsCodec::split_labels(label + "." + label + "." + label + "." + label), MalformedNameError);
}

TEST_F(DnsPacketTest, QueryConstructionValidatesName) {
  EXPECT_THROW(make_query(1, std::string(64, 'a'), RecordType::AAAA), MalformedNameError);
}

TEST_F(DnsPacketTest, ReplyEchoesQuery) {
  auto query = make_query(0xBEEF, "KEY", RecordType::TXT);
  auto reply = make_reply(query, RCODE_NXDOMAIN);

  EXPECT_EQ(reply.header.id, 0xBEEF);
  EXPECT_TRUE(reply.is_response());
  EXPECT_EQ(reply.rcode(), RCODE_NXDOMAIN);
  EXPECT_NE(reply.header.flags & FLAG_RD, 0);
  ASSERT_EQ(reply.questions.size(), 1u);
  EXPECT_EQ(reply.questions[0].name, "KEY");

  auto parsed = DnsCodec::deserialize(DnsCodec::serialize(reply));
  EXPECT_EQ(parsed.header.id, 0xBEEF);
  EXPECT_EQ(parsed.rcode(), RCODE_NXDOMAIN);
}

TEST_F(DnsPacketTest, TxtRecordSplitsLongText) {
  const std::string text(300, 'Q');
  auto record = make_txt_record("KEY", text, 2);

  ASSERT_EQ(record.rdata.size(), 302u);
  EXPECT_EQ(record.rdata[0], 255);
  EXPECT_EQ(record.rdata[256], 45);
  EXPECT_EQ(txt_record_text(record), text);
}

TEST_F(DnsPacketTest, TxtRecordCarriesEmptyText) {
  auto record = make_txt_record("KEY", "", 2);
  EXPECT_EQ(record.rdata, std::vector<uint8_t>{0});
  EXPECT_EQ(txt_record_text(record), "");

  // Empty slice survives the wire
  auto reply = make_reply(make_query(7, "KEY", RecordType::TXT));
  reply.answers.push_back(record);
  auto parsed = DnsCodec::deserialize(DnsCodec::serialize(reply));
  ASSERT_EQ(parsed.answers.size(), 1u);
  EXPECT_EQ(txt_record_text(parsed.answers[0]), "");
}

TEST_F(DnsPacketTest, TxtTextRejectsBadRecords) {
  auto record = make_a_record("KEY", {1, 2, 3, 4}, 2);
  EXPECT_THROW(txt_record_text(record), FormatError);

  DnsRecord overrun;
  overrun.type = static_cast<uint16_t>(RecordType::TXT);
  overrun.rdata = {10, 'a', 'b'};
  EXPECT_THROW(txt_record_text(overrun), FormatError);
}

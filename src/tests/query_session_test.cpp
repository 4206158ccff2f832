#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "client/query_session.hpp"
#include "network/dns_packet.hpp"
#include "network/transport.hpp"
#include "network/tunnel_error.hpp"

using namespace dnskv;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class MockTransport : public network::DatagramTransport {
public:
  MOCK_METHOD(void, send, (const std::vector<uint8_t>& datagram), (override));
  MOCK_METHOD(std::optional<std::vector<uint8_t>>, receive, (std::chrono::milliseconds timeout), (override));
};

class QuerySessionTest : public ::testing::Test {
protected:
  ::testing::NiceMock<MockTransport> transport;
  client::RetryPolicy policy{std::chrono::milliseconds(20), 3};
  std::vector<network::DnsPacket> sent;

  void SetUp() override {
    ON_CALL(transport, send(_)).WillByDefault(Invoke([this](const std::vector<uint8_t>& datagram) {
      sent.push_back(network::DnsCodec::deserialize(datagram));
    }));
    ON_CALL(transport, receive(_)).WillByDefault(Return(std::nullopt));
  }

  // Serialized answer to the most recent query, with an optional id override
  std::vector<uint8_t> reply_to_last(std::optional<uint16_t> id = std::nullopt) {
    auto reply = network::make_reply(sent.back());
    if (id) {
      reply.header.id = *id;
    }
    reply.answers.push_back(network::make_txt_record(sent.back().questions[0].name, "slice", 2));
    return network::DnsCodec::serialize(reply);
  }
};

TEST_F(QuerySessionTest, ReturnsMatchingReply) {
  client::QuerySession session(transport, policy);
  EXPECT_CALL(transport, send(_)).Times(1);
  EXPECT_CALL(transport, receive(_)).WillOnce(Invoke([this](std::chrono::milliseconds) {
    return std::optional<std::vector<uint8_t>>(reply_to_last());
  }));

  auto reply = session.exchange("KEY", network::RecordType::TXT);
  EXPECT_EQ(reply.header.id, sent[0].header.id);
  ASSERT_EQ(reply.answers.size(), 1u);
  EXPECT_EQ(network::txt_record_text(reply.answers[0]), "slice");
}

TEST_F(QuerySessionTest, TimesOutAfterMaxAttempts) {
  client::QuerySession session(transport, policy);
  EXPECT_CALL(transport, send(_)).Times(3);

  EXPECT_THROW(session.exchange("KEY", network::RecordType::TXT), network::TimeoutError);

  // Every attempt carried the same query id
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[0].header.id, sent[1].header.id);
  EXPECT_EQ(sent[1].header.id, sent[2].header.id);
}

TEST_F(QuerySessionTest, RetriesUntilReplyArrives) {
  client::QuerySession session(transport, policy);
  EXPECT_CALL(transport, receive(_))
    .WillOnce(Return(std::nullopt))
    .WillOnce(Invoke([this](std::chrono::milliseconds) {
      return std::optional<std::vector<uint8_t>>(reply_to_last());
    }));

  EXPECT_NO_THROW(session.exchange("KEY", network::RecordType::TXT));
  EXPECT_EQ(sent.size(), 2u);
}

TEST_F(QuerySessionTest, IgnoresStaleAndGarbageReplies) {
  client::QuerySession session(transport, policy);
  EXPECT_CALL(transport, receive(_))
    .WillOnce(Return(std::optional<std::vector<uint8_t>>(std::vector<uint8_t>{0xDE, 0xAD})))
    .WillOnce(Invoke([this](std::chrono::milliseconds) {
      return std::optional<std::vector<uint8_t>>(reply_to_last(static_cast<uint16_t>(sent.back().header.id - 1)));
    }))
    .WillOnce(Invoke([this](std::chrono::milliseconds) {
      return std::optional<std::vector<uint8_t>>(reply_to_last());
    }));

  auto reply = session.exchange("KEY", network::RecordType::TXT);
  EXPECT_EQ(reply.header.id, sent.back().header.id);
  EXPECT_EQ(sent.size(), 1u) << "Ignored replies should not trigger a resend";
}

TEST_F(QuerySessionTest, ConsecutiveQueriesUseNewIds) {
  client::QuerySession session(transport, policy);
  ON_CALL(transport, receive(_)).WillByDefault(Invoke([this](std::chrono::milliseconds) {
    return std::optional<std::vector<uint8_t>>(reply_to_last());
  }));

  session.exchange("ONE", network::RecordType::TXT);
  session.exchange("TWO", network::RecordType::TXT);
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_NE(sent[0].header.id, sent[1].header.id);
}

TEST_F(QuerySessionTest, TransportFailurePropagates) {
  client::QuerySession session(transport, policy);
  EXPECT_CALL(transport, send(_)).WillOnce(Invoke([](const std::vector<uint8_t>&) {
    throw network::TransportError("network unreachable");
  }));

  EXPECT_THROW(session.exchange("KEY", network::RecordType::TXT), network::TransportError);
}

TEST_F(QuerySessionTest, MalformedNameIsRejectedBeforeSending) {
  client::QuerySession session(transport, policy);
  EXPECT_CALL(transport, send(_)).Times(0);

  EXPECT_THROW(session.exchange(std::string(64, 'a'), network::RecordType::TXT), network::MalformedNameError);
}

TEST_F(QuerySessionTest, ZeroAttemptsMeansOne) {
  client::QuerySession session(transport, client::RetryPolicy{std::chrono::milliseconds(10), 0});
  EXPECT_EQ(session.get_policy().max_attempts, 1u);
  EXPECT_CALL(transport, send(_)).Times(1);
  EXPECT_THROW(session.exchange("KEY", network::RecordType::TXT), network::TimeoutError);
}

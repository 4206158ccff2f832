#include <gtest/gtest.h>
#include <set>
#include "client/query_session.hpp"
#include "client/upload_encoder.hpp"
#include "codec/payload_codec.hpp"
#include "network/tunnel_error.hpp"
#include "test_utils.hpp"

using namespace dnskv;
using client::UploadEncoder;

class UploadEncoderTest : public ::testing::Test {
protected:
  ServerComponents components;
  LoopbackTransport transport{components.handler};
  client::QuerySession session{transport, client::RetryPolicy{std::chrono::milliseconds(10), 3}};
  UploadEncoder encoder{session};

  void SetUp() override {
    init_test_logging(boost::log::trivial::warning);
  }

  static void expect_valid_chunk_names(const std::vector<std::string>& names, const std::string& transaction_id) {
    for (const auto& name : names) {
      auto labels = network::DnsCodec::split_labels(name);
      ASSERT_EQ(labels.size(), 2u) << "Chunk name should have two labels: " << name;
      EXPECT_LE(name.size(), network::MAX_LABEL_LENGTH) << "Chunk name exceeds budget: " << name;
      EXPECT_EQ(labels[1], transaction_id);
    }
  }
};

TEST_F(UploadEncoderTest, ChunkSizeLeavesRoomForTransactionId) {
  EXPECT_EQ(UploadEncoder::chunk_size("1a2b"), 58u);
  EXPECT_EQ(UploadEncoder::chunk_size("f"), 61u);
  EXPECT_THROW(UploadEncoder::chunk_size(""), network::MalformedNameError);
  EXPECT_THROW(UploadEncoder::chunk_size(std::string(62, 'a')), network::MalformedNameError);
}

TEST_F(UploadEncoderTest, ChunkNamesCoverEncodedText) {
  const std::string encoded = codec::PayloadCodec::encode({"KEY", std::string(500, 'z')});
  auto names = UploadEncoder::build_chunk_names(encoded, "1a2b");

  expect_valid_chunk_names(names, "1a2b");
  EXPECT_EQ(names.size(), (encoded.size() + 57) / 58);

  std::string joined;
  for (const auto& name : names) {
    joined += name.substr(0, name.find('.'));
  }
  EXPECT_EQ(joined, encoded);
}

TEST_F(UploadEncoderTest, EmptyEncodingHasNoChunks) {
  EXPECT_TRUE(UploadEncoder::build_chunk_names("", "1a2b").empty());
}

TEST_F(UploadEncoderTest, TransactionIdsAreShortHex) {
  std::set<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    std::string id = UploadEncoder::generate_transaction_id();
    EXPECT_FALSE(id.empty());
    EXPECT_LE(id.size(), 4u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos) << "Not lowercase hex: " << id;
    ids.insert(id);
  }
  EXPECT_GT(ids.size(), 1u);
}

TEST_F(UploadEncoderTest, UploadCommitsOnServer) {
  std::string transaction_id = encoder.upload("HELLO", "WORLD");
  EXPECT_FALSE(transaction_id.empty());
  EXPECT_EQ(components.committed.get("HELLO"), std::optional<std::string>("WORLD"));
  EXPECT_EQ(components.pending.size(), 0u);
}

TEST_F(UploadEncoderTest, SendsOneQueryPerChunkPlusCommit) {
  const std::string value(300, 'p');
  auto names = UploadEncoder::build_chunk_names(codec::PayloadCodec::encode({"KEY", value}), "abc");

  encoder.upload_with_id("KEY", value, "abc");
  EXPECT_EQ(transport.sent_count, names.size() + 1);
  EXPECT_EQ(components.committed.get("KEY"), std::optional<std::string>(value));
}

TEST_F(UploadEncoderTest, LostAcknowledgementIsRetransmittedSafely) {
  const std::string value(400, 'q');
  transport.drop_replies = 1;

  encoder.upload_with_id("KEY", value, "d00d");
  EXPECT_EQ(components.committed.get("KEY"), std::optional<std::string>(value));
}

TEST_F(UploadEncoderTest, DuplicatedRepliesAreHarmless) {
  const std::string value(400, 'q');
  transport.duplicate_replies = true;

  encoder.upload_with_id("KEY", value, "d00e");
  encoder.upload_with_id("OTHER", "second", "d00f");
  EXPECT_EQ(components.committed.get("KEY"), std::optional<std::string>(value));
  EXPECT_EQ(components.committed.get("OTHER"), std::optional<std::string>("second"));
}

TEST_F(UploadEncoderTest, SilentServerTimesOut) {
  transport.drop_replies = 1000;
  EXPECT_THROW(encoder.upload("KEY", "VALUE"), network::TimeoutError);
  EXPECT_FALSE(components.committed.has("KEY"));
}

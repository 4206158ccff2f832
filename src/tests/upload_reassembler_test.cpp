#include <gtest/gtest.h>
#include "client/upload_encoder.hpp"
#include "codec/payload_codec.hpp"
#include "network/tunnel_error.hpp"
#include "server/upload_reassembler.hpp"
#include "store/store.hpp"

using namespace dnskv;
using server::UploadReassembler;

class UploadReassemblerTest : public ::testing::Test {
protected:
  store::MemoryStore pending{"pending"};
  store::MemoryStore committed{"committed"};
  UploadReassembler reassembler{pending, committed};
  uint16_t next_query_id = 100;

  // Feeds every chunk of the message and returns the number of chunks
  std::size_t send_chunks(const codec::Message& message, const std::string& transaction_id) {
    auto names = client::UploadEncoder::build_chunk_names(codec::PayloadCodec::encode(message), transaction_id);
    for (const auto& name : names) {
      reassembler.append_chunk(name, next_query_id++);
    }
    return names.size();
  }
};

TEST_F(UploadReassemblerTest, CommitsReassembledMessage) {
  send_chunks({"HELLO", "WORLD"}, "1a2b");
  EXPECT_TRUE(pending.has("1A2B"));
  EXPECT_FALSE(committed.has("HELLO"));

  reassembler.commit("1a2b", next_query_id++);

  EXPECT_EQ(committed.get("HELLO"), std::optional<std::string>("WORLD"));
  EXPECT_FALSE(pending.has("1a2b")) << "Commit should consume the pending upload";
}

TEST_F(UploadReassemblerTest, ReassemblesManyChunks) {
  const std::string value(2000, 'v');
  EXPECT_GT(send_chunks({"BIG", value}, "ff"), 10u);

  reassembler.commit("FF", next_query_id++);
  EXPECT_EQ(committed.get("big"), std::optional<std::string>(value));
}

TEST_F(UploadReassemblerTest, CommitOverwritesPreviousValue) {
  send_chunks({"KEY", "first"}, "a1");
  reassembler.commit("a1", next_query_id++);
  send_chunks({"key", "second"}, "a2");
  reassembler.commit("a2", next_query_id++);

  EXPECT_EQ(committed.get("KEY"), std::optional<std::string>("second"));
  EXPECT_EQ(committed.size(), 1u);
}

TEST_F(UploadReassemblerTest, InterleavedTransactionsStayApart) {
  auto first = client::UploadEncoder::build_chunk_names(codec::PayloadCodec::encode({"ONE", std::string(200, '1')}), "b1");
  auto second = client::UploadEncoder::build_chunk_names(codec::PayloadCodec::encode({"TWO", std::string(200, '2')}), "b2");
  ASSERT_EQ(first.size(), second.size());

  for (std::size_t i = 0; i < first.size(); ++i) {
    reassembler.append_chunk(first[i], next_query_id++);
    reassembler.append_chunk(second[i], next_query_id++);
  }
  reassembler.commit("b2", next_query_id++);
  reassembler.commit("b1", next_query_id++);

  EXPECT_EQ(committed.get("ONE"), std::optional<std::string>(std::string(200, '1')));
  EXPECT_EQ(committed.get("TWO"), std::optional<std::string>(std::string(200, '2')));
}

TEST_F(UploadReassemblerTest, RetransmittedChunkIsAppendedOnce) {
  auto names = client::UploadEncoder::build_chunk_names(codec::PayloadCodec::encode({"HELLO", "WORLD"}), "c3");
  for (const auto& name : names) {
    uint16_t id = next_query_id++;
    reassembler.append_chunk(name, id);
    reassembler.append_chunk(name, id);
  }

  reassembler.commit("c3", next_query_id++);
  EXPECT_EQ(committed.get("HELLO"), std::optional<std::string>("WORLD"));
}

TEST_F(UploadReassemblerTest, RetransmittedCommitIsAcknowledged) {
  send_chunks({"HELLO", "WORLD"}, "d4");
  uint16_t commit_id = next_query_id++;
  reassembler.commit("d4", commit_id);

  EXPECT_NO_THROW(reassembler.commit("d4", commit_id));
  EXPECT_EQ(committed.get("HELLO"), std::optional<std::string>("WORLD"));

  // A new commit for the same id is not a retransmission
  EXPECT_THROW(reassembler.commit("d4", next_query_id++), network::DecodeError);
}

TEST_F(UploadReassemblerTest, ChunkWithoutTransactionIdIsRejected) {
  EXPECT_THROW(reassembler.append_chunk("CHUNKONLY", 1), network::MalformedNameError);
  EXPECT_EQ(pending.size(), 0u);
}

TEST_F(UploadReassemblerTest, CommitWithoutUploadIsRejected) {
  EXPECT_THROW(reassembler.commit("beef", 1), network::DecodeError);
  EXPECT_EQ(committed.size(), 0u);
}

TEST_F(UploadReassemblerTest, UndecodableUploadIsDiscarded) {
  reassembler.append_chunk("NOTAVALIDPAYLOAD.e5", 1);
  EXPECT_THROW(reassembler.commit("e5", 2), network::DecodeError);
  EXPECT_FALSE(pending.has("e5"));
  EXPECT_EQ(committed.size(), 0u);
}

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include "network/memory_session.hpp"
#include "network/store_session.hpp"
#include "test_utils.hpp"

using namespace blobstore::network;
using namespace blobstore::types;

TEST(MemorySessionTest, StoreThenQuery) {
  init_logging();
  MemorySession session;
  Chunk chunk(random_bytes(500));

  session.send_cmd(MessageFrame::store_chunk(chunk));
  EXPECT_TRUE(session.has(chunk.address()));
  EXPECT_EQ(session.size(), 1u);

  MessageFrame response = session.send_query(MessageFrame::get_chunk(chunk.address()));
  EXPECT_EQ(response.message_type, MessageType::GET_CHUNK);
  EXPECT_EQ(response.error, NetworkError::SUCCESS);
  ASSERT_NE(response.chunk, nullptr);
  EXPECT_EQ(response.chunk->value(), chunk.value());
}

TEST(MemorySessionTest, MissingChunkAnswersNotFound) {
  MemorySession session;
  Chunk chunk(random_bytes(10));

  MessageFrame response = session.send_query(MessageFrame::get_chunk(chunk.address()));
  EXPECT_EQ(response.error, NetworkError::NOT_FOUND);
  EXPECT_EQ(response.chunk, nullptr);

  session.send_cmd(MessageFrame::store_chunk(chunk));
  EXPECT_TRUE(session.remove(chunk.address()));
  EXPECT_FALSE(session.remove(chunk.address()));
  EXPECT_EQ(session.send_query(MessageFrame::get_chunk(chunk.address())).error, NetworkError::NOT_FOUND);
}

TEST(MemorySessionTest, RejectsInvalidCommand) {
  MemorySession session;
  MessageFrame cmd = MessageFrame::get_chunk(hash_content(Bytes{1}));
  EXPECT_THROW(session.send_cmd(cmd), CmdError);
}

TEST(MemorySessionTest, OperationIdsIncrease) {
  MemorySession session(std::chrono::milliseconds(1));
  ContentHash address = hash_content(Bytes{2});
  uint64_t first = session.send_query(MessageFrame::get_chunk(address)).operation_id;
  uint64_t second = session.send_query(MessageFrame::get_chunk(address)).operation_id;
  EXPECT_LT(first, second);
}

class StoreSessionTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    init_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("store_session_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(StoreSessionTest, PersistsChunks) {
  Chunk chunk(random_bytes(2048));
  {
    StoreSession session(test_dir);
    session.send_cmd(MessageFrame::store_chunk(chunk));
    // Identical content is accepted again
    EXPECT_NO_THROW(session.send_cmd(MessageFrame::store_chunk(chunk)));
    EXPECT_EQ(session.get_store().count(), 1u);
  }

  // A new session over the same directory sees the chunk
  StoreSession reopened(test_dir);
  MessageFrame response = reopened.send_query(MessageFrame::get_chunk(chunk.address()));
  EXPECT_EQ(response.error, NetworkError::SUCCESS);
  ASSERT_NE(response.chunk, nullptr);
  EXPECT_EQ(response.chunk->address(), chunk.address());
}

TEST_F(StoreSessionTest, MissingChunkAnswersNotFound) {
  StoreSession session(test_dir);
  MessageFrame response = session.send_query(MessageFrame::get_chunk(hash_content(Bytes{3})));
  EXPECT_EQ(response.error, NetworkError::NOT_FOUND);
  EXPECT_THROW(session.send_cmd(MessageFrame::get_chunk(hash_content(Bytes{3}))), CmdError);
}

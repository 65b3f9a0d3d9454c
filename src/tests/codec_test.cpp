#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include "client/codec.hpp"
#include "test_utils.hpp"

using namespace blobstore::client;
using namespace blobstore::types;
using blobstore::self_encryption::DecodeKey;

class CodecTest : public ::testing::Test {
protected:
  Codec codec;

  static ChunkKey make_key(uint64_t index, uint8_t fill) {
    ChunkKey key;
    key.index = index;
    key.dst_hash.fill(fill);
    key.src_hash.fill(static_cast<uint8_t>(fill + 1));
    key.src_size = 1000 + index;
    return key;
  }

  SecretKey sample_key(SecretKeyLevel level = SecretKeyLevel::FirstLevel) const {
    return SecretKey{level, DecodeKey({make_key(0, 0x10), make_key(1, 0x20), make_key(2, 0x30)})};
  }
};

TEST_F(CodecTest, SecretKeyWireLayoutIsLittleEndian) {
  Bytes bytes = codec.encode(sample_key(SecretKeyLevel::AdditionalLevel));

  ASSERT_EQ(bytes.size(), Codec::SECRET_KEY_HEADER_SIZE + 3 * Codec::CHUNK_KEY_SIZE);
  // variant = 1
  EXPECT_THAT(Bytes(bytes.begin(), bytes.begin() + 4), ::testing::ElementsAre(1, 0, 0, 0));
  // count = 3
  EXPECT_THAT(Bytes(bytes.begin() + 4, bytes.begin() + 12), ::testing::ElementsAre(3, 0, 0, 0, 0, 0, 0, 0));
  // first key: index 0, dst hash, src hash, src_size 1000 = 0x03e8
  EXPECT_EQ(bytes[12], 0);
  EXPECT_EQ(bytes[20], 0x10);
  EXPECT_EQ(bytes[52], 0x11);
  EXPECT_EQ(bytes[84], 0xe8);
  EXPECT_EQ(bytes[85], 0x03);
}

TEST_F(CodecTest, SecretKeyRoundTrip) {
  for (auto level : {SecretKeyLevel::FirstLevel, SecretKeyLevel::AdditionalLevel}) {
    SecretKey original = sample_key(level);
    SecretKey decoded = codec.deserialize_secret_key(codec.encode(original));
    EXPECT_EQ(decoded, original);
    EXPECT_EQ(decoded.is_first_level(), level == SecretKeyLevel::FirstLevel);
  }
}

TEST_F(CodecTest, StreamSerializeReportsSize) {
  std::stringstream output;
  size_t written = codec.serialize(sample_key(), output);
  EXPECT_EQ(written, output.str().size());

  std::stringstream chunk_output;
  Chunk chunk(random_bytes(100));
  EXPECT_EQ(codec.serialize(chunk, chunk_output), 108u);
}

TEST_F(CodecTest, RejectsMalformedSecretKeys) {
  Bytes valid = codec.encode(sample_key());

  Bytes truncated(valid.begin(), valid.end() - 1);
  EXPECT_THROW(codec.deserialize_secret_key(truncated), SerializationError);

  Bytes trailing = valid;
  trailing.push_back(0);
  EXPECT_THROW(codec.deserialize_secret_key(trailing), SerializationError);

  Bytes bad_variant = valid;
  bad_variant[0] = 7;
  EXPECT_THROW(codec.deserialize_secret_key(bad_variant), SerializationError);

  // A count far beyond the record must not trigger a huge allocation
  Bytes huge_count = valid;
  huge_count[11] = 0xff;
  EXPECT_THROW(codec.deserialize_secret_key(huge_count), SerializationError);

  EXPECT_THROW(codec.deserialize_secret_key(Bytes{0, 0, 0}), SerializationError);
}

TEST_F(CodecTest, ChunkRecord) {
  Chunk chunk(random_bytes(300));
  Bytes bytes = codec.encode(chunk);

  ASSERT_EQ(bytes.size(), 308u);
  EXPECT_THAT(Bytes(bytes.begin(), bytes.begin() + 8), ::testing::ElementsAre(0x2c, 0x01, 0, 0, 0, 0, 0, 0));

  Chunk decoded = codec.deserialize_chunk(bytes);
  EXPECT_EQ(decoded.address(), chunk.address());
  EXPECT_EQ(decoded.value(), chunk.value());

  EXPECT_THROW(codec.deserialize_chunk(Bytes(bytes.begin(), bytes.end() - 1)), SerializationError);
  bytes.push_back(0);
  EXPECT_THROW(codec.deserialize_chunk(bytes), SerializationError);
  EXPECT_THROW(codec.deserialize_chunk(Bytes{1, 2}), SerializationError);
}

TEST_F(CodecTest, EmptyChunkRecord) {
  Chunk empty(Bytes{});
  Bytes bytes = codec.encode(empty);
  ASSERT_EQ(bytes.size(), 8u);
  EXPECT_TRUE(codec.deserialize_chunk(bytes).value().empty());
}

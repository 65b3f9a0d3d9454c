#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <set>
#include "crypto/crypto_error.hpp"
#include "self_encryption/self_encryptor.hpp"
#include "test_utils.hpp"

using namespace blobstore::self_encryption;
using namespace blobstore::types;

namespace {

std::vector<EncryptedChunk> to_encrypted(const std::vector<Chunk>& chunks) {
  std::vector<EncryptedChunk> encrypted;
  for (size_t i = 0; i < chunks.size(); ++i) {
    encrypted.push_back(EncryptedChunk{i, chunks[i].value()});
  }
  return encrypted;
}

} // namespace

class SelfEncryptorTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  SelfEncryptor encryptor;
  // Small layout so multi-chunk files stay cheap
  SelfEncryptor small{ChunkLayout{256, 1024}};
};

TEST_F(SelfEncryptorTest, RejectsDataBelowMinimum) {
  EXPECT_THROW(encryptor.encrypt(random_bytes(3071)), SelfEncryptionError);
  EXPECT_NO_THROW(encryptor.encrypt(random_bytes(3072)));
}

TEST_F(SelfEncryptorTest, RejectsInvalidLayout) {
  EXPECT_THROW(SelfEncryptor(ChunkLayout{1024, 1500}), SelfEncryptionError);
  EXPECT_THROW(SelfEncryptor(ChunkLayout{0, 1024}), SelfEncryptionError);
}

TEST_F(SelfEncryptorTest, SmallFileSplitsIntoThreeChunks) {
  Bytes data = random_bytes(3000 + 72);
  auto [key, chunks] = encryptor.encrypt(data);

  ASSERT_EQ(chunks.size(), 3u);
  ASSERT_EQ(key.keys().size(), 3u);
  EXPECT_EQ(key.file_size(), data.size());
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(key.keys()[i].index, i);
    EXPECT_EQ(key.keys()[i].dst_hash, chunks[i].address());
  }
  EXPECT_EQ(key.keys()[0].src_size, 1024u);
  EXPECT_EQ(key.keys()[2].src_size, data.size() - 2048u);
}

TEST_F(SelfEncryptorTest, EncryptionIsDeterministicAndHidesPlaintext) {
  Bytes data = random_bytes(8192);
  auto [key1, chunks1] = encryptor.encrypt(data);
  auto [key2, chunks2] = encryptor.encrypt(data);

  EXPECT_EQ(key1, key2);
  ASSERT_EQ(chunks1.size(), chunks2.size());
  for (size_t i = 0; i < chunks1.size(); ++i) {
    EXPECT_EQ(chunks1[i].address(), chunks2[i].address());
    // No chunk carries its plaintext slice
    EXPECT_NE(chunks1[i].address(), key1.keys()[i].src_hash);
  }
}

TEST_F(SelfEncryptorTest, DecodeFullRestoresData) {
  Bytes data = random_bytes(20000);
  auto [key, chunks] = small.encrypt(data);
  EXPECT_EQ(chunks.size(), 20u);

  auto encrypted = to_encrypted(chunks);
  // Arrival order does not matter
  std::reverse(encrypted.begin(), encrypted.end());
  EXPECT_EQ(small.decode_full(key, encrypted), data);
}

TEST_F(SelfEncryptorTest, DecodeFullFailsOnMissingOrTamperedChunk) {
  Bytes data = random_bytes(5000);
  auto [key, chunks] = encryptor.encrypt(data);
  auto encrypted = to_encrypted(chunks);

  auto missing = encrypted;
  missing.erase(missing.begin() + 1);
  EXPECT_THROW(encryptor.decode_full(key, missing), SelfEncryptionError);

  auto tampered = encrypted;
  tampered[2].content[0] ^= 0x01;
  EXPECT_THROW(encryptor.decode_full(key, tampered), blobstore::crypto::DecryptionError);
}

TEST_F(SelfEncryptorTest, LargeFileLayoutBalancesShortTail) {
  // Tail of 100 bytes is below min_chunk_size and borrows from its neighbour
  const uint64_t file_size = 5 * 1024 + 100;
  ASSERT_EQ(small.num_chunks(file_size), 6u);
  EXPECT_EQ(small.chunk_size(file_size, 0), 1024u);
  EXPECT_EQ(small.chunk_size(file_size, 4), 1024u - 256u);
  EXPECT_EQ(small.chunk_size(file_size, 5), 256u + 100u);

  uint64_t total = 0;
  for (size_t i = 0; i < 6; ++i) {
    EXPECT_EQ(small.chunk_start(file_size, i), total);
    EXPECT_GE(small.chunk_size(file_size, i), 256u);
    total += small.chunk_size(file_size, i);
  }
  EXPECT_EQ(total, file_size);
}

TEST_F(SelfEncryptorTest, ComputeRangeMapsWindowToChunks) {
  const uint64_t file_size = 3072;
  SeekInfo info = encryptor.compute_range(file_size, 1000, 100);
  EXPECT_EQ(info.first_index, 0u);
  EXPECT_EQ(info.last_index, 1u);
  EXPECT_EQ(info.relative_pos, 1000u);

  info = encryptor.compute_range(file_size, 1024, 1024);
  EXPECT_EQ(info.first_index, 1u);
  EXPECT_EQ(info.last_index, 1u);
  EXPECT_EQ(info.relative_pos, 0u);

  // End is clamped to the file
  info = encryptor.compute_range(file_size, 3000, 500);
  EXPECT_EQ(info.last_index, 2u);

  EXPECT_THROW(encryptor.compute_range(file_size, 0, 0), SelfEncryptionError);
  EXPECT_THROW(encryptor.compute_range(file_size, 3072, 1), SelfEncryptionError);
}

TEST_F(SelfEncryptorTest, DecodeRangeFromChunkSubset) {
  Bytes data = random_bytes(20000, 7);
  auto [key, chunks] = small.encrypt(data);

  const uint64_t position = 4000;
  const uint64_t length = 2500;
  SeekInfo info = small.compute_range(data.size(), position, length);

  std::vector<EncryptedChunk> subset;
  for (size_t i = info.first_index; i <= info.last_index; ++i) {
    subset.push_back(EncryptedChunk{i, chunks[i].value()});
  }

  Bytes window = small.decode_range(key, subset, info.relative_pos, length);
  EXPECT_EQ(window, Bytes(data.begin() + position, data.begin() + position + length));

  // A gap in the subset is rejected
  subset.erase(subset.begin() + 1);
  EXPECT_THROW(small.decode_range(key, subset, info.relative_pos, length), SelfEncryptionError);
}

TEST_F(SelfEncryptorTest, DecodeRangeRejectsMismatchedLayout) {
  Bytes data = random_bytes(20000, 9);
  auto [key, chunks] = small.encrypt(data);

  // Same key read back under a different layout
  SelfEncryptor other{ChunkLayout{256, 2048}};
  std::vector<EncryptedChunk> subset{EncryptedChunk{0, chunks[0].value()}};
  EXPECT_THROW(other.decode_range(key, subset, 0, 10), SelfEncryptionError);
}

TEST_F(SelfEncryptorTest, ValidateRejectsSizesOutsideLayout) {
  auto [key, chunks] = encryptor.encrypt(random_bytes(3072));
  EXPECT_NO_THROW(encryptor.validate(key));

  std::vector<EncryptedChunk> encrypted;
  for (size_t i = 0; i < chunks.size(); ++i) {
    encrypted.push_back(EncryptedChunk{i, chunks[i].value()});
  }

  for (uint64_t forged : {uint64_t{1} << 62, UINT64_MAX, uint64_t{2000}}) {
    std::vector<ChunkKey> keys = key.keys();
    keys[0].src_size = forged;
    DecodeKey forged_key(keys);
    EXPECT_THROW(encryptor.validate(forged_key), SelfEncryptionError) << forged;
    EXPECT_THROW(encryptor.decode_full(forged_key, encrypted), SelfEncryptionError) << forged;
  }

  // A middle entry that disagrees with the layout of a many-chunk file
  auto [large_key, large_chunks] = small.encrypt(random_bytes(20000, 4));
  std::vector<ChunkKey> keys = large_key.keys();
  keys[5].src_size = 1000;
  EXPECT_THROW(small.validate(DecodeKey(keys)), SelfEncryptionError);
  // Two keys cannot describe any file
  keys.resize(2);
  EXPECT_THROW(small.validate(DecodeKey(keys)), SelfEncryptionError);
}

#include <gtest/gtest.h>
#include <map>
#include <boost/asio/thread_pool.hpp>
#include "client/codec.hpp"
#include "client/data_chunks.hpp"
#include "client/head_chunk_resolver.hpp"
#include "network/network_error.hpp"
#include "test_utils.hpp"

using namespace blobstore::client;
using namespace blobstore::types;
using blobstore::crypto::DecryptionError;
using blobstore::crypto::OwnerEncryption;
using blobstore::crypto::OwnerKey;
using blobstore::self_encryption::ChunkLayout;
using blobstore::self_encryption::SelfEncryptor;

class HeadChunkResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  // Packs data and keeps every chunk in the local network map
  BlobAddress pack(const Bytes& data, const OwnerEncryption* owner, size_t max_head_size = 1024) {
    auto [address, chunks] = get_data_chunks(data, owner, encryptor, max_head_size, 8);
    for (const auto& chunk : chunks) {
      network.emplace(chunk.address(), chunk);
    }
    return address;
  }

  HeadChunk head_of(const BlobAddress& address) const {
    return HeadChunk{network.at(address.name()), address};
  }

  FetchFn fetch_from_network() {
    return [this](const ContentHash& address) {
      auto it = network.find(address);
      if (it == network.end()) {
        throw blobstore::network::QueryError(blobstore::network::NetworkError::NOT_FOUND, to_hex(address));
      }
      return it->second;
    };
  }

  SelfEncryptor encryptor{ChunkLayout{256, 1024}};
  boost::asio::thread_pool pool{4};
  std::map<ContentHash, Chunk> network;
  OwnerEncryption owner{OwnerKey::from_hex(std::string(64, '1'))};
  Codec codec;
};

TEST_F(HeadChunkResolverTest, SmallKeyFitsInHead) {
  Bytes data = random_bytes(3000);
  auto [expected_key, data_chunks] = encryptor.encrypt(data);
  BlobAddress address = pack(data, nullptr);

  // Three data chunks plus the head
  EXPECT_EQ(network.size(), 4u);
  EXPECT_TRUE(address.is_public());
  EXPECT_EQ(codec.deserialize_secret_key(network.at(address.name()).value()),
            SecretKey::first_level(expected_key));

  ChunkFetcher fetcher(pool, fetch_from_network());
  HeadChunkResolver resolver(fetcher, encryptor, 8);
  EXPECT_EQ(resolver.unpack_head_chunk(head_of(address), nullptr), expected_key);
}

TEST_F(HeadChunkResolverTest, LargeKeyMovesBehindAdditionalLevel) {
  Bytes data = random_bytes(20000);
  auto [expected_key, data_chunks] = encryptor.encrypt(data);
  BlobAddress address = pack(data, nullptr);

  SecretKey head = codec.deserialize_secret_key(network.at(address.name()).value());
  EXPECT_FALSE(head.is_first_level());
  // 20 data chunks, 3 chunks for the serialized first-level record, the head
  EXPECT_EQ(network.size(), 24u);

  ChunkFetcher fetcher(pool, fetch_from_network());
  HeadChunkResolver resolver(fetcher, encryptor, 8);
  EXPECT_EQ(resolver.unpack_head_chunk(head_of(address), nullptr), expected_key);
}

TEST_F(HeadChunkResolverTest, PrivateHeadsAreWrappedAtEveryLevel) {
  Bytes data = random_bytes(20000);
  auto [expected_key, data_chunks] = encryptor.encrypt(data);
  BlobAddress address = pack(data, &owner);
  EXPECT_TRUE(address.is_private());

  // The head record is not readable without the owner's key
  EXPECT_THROW(codec.deserialize_secret_key(network.at(address.name()).value()), SerializationError);
  SecretKey head = codec.deserialize_secret_key(owner.unwrap(network.at(address.name()).value()));
  ASSERT_FALSE(head.is_first_level());

  // Nor is the record stored behind the additional level
  ChunkFetcher fetcher(pool, fetch_from_network());
  Bytes record = encryptor.decode_full(head.key, fetcher.try_get_chunks(head.key.keys()));
  Chunk inner = codec.deserialize_chunk(record);
  EXPECT_THROW(codec.deserialize_secret_key(inner.value()), SerializationError);

  HeadChunkResolver resolver(fetcher, encryptor, 8);
  EXPECT_EQ(resolver.unpack_head_chunk(head_of(address), &owner), expected_key);
}

TEST_F(HeadChunkResolverTest, PrivateHeadNeedsMatchingOwner) {
  BlobAddress address = pack(random_bytes(3000), &owner);
  ChunkFetcher fetcher(pool, fetch_from_network());
  HeadChunkResolver resolver(fetcher, encryptor, 8);

  EXPECT_THROW(resolver.unpack_head_chunk(head_of(address), nullptr), ClientError);

  OwnerEncryption stranger(OwnerKey::from_hex(std::string(64, '2')));
  EXPECT_THROW(resolver.unpack_head_chunk(head_of(address), &stranger), DecryptionError);
}

TEST_F(HeadChunkResolverTest, DepthLimitIsEnforced) {
  BlobAddress address = pack(random_bytes(20000), nullptr);
  ChunkFetcher fetcher(pool, fetch_from_network());
  HeadChunkResolver resolver(fetcher, encryptor, 0);

  try {
    resolver.unpack_head_chunk(head_of(address), nullptr);
    FAIL() << "Expected IndirectionTooDeep";
  } catch (const IndirectionTooDeep& e) {
    EXPECT_EQ(e.limit(), 0u);
  }
}

TEST_F(HeadChunkResolverTest, PackingRespectsDepthLimit) {
  EXPECT_THROW(get_data_chunks(random_bytes(20000), nullptr, encryptor, 1024, 0), IndirectionTooDeep);
}

TEST_F(HeadChunkResolverTest, PackingRejectsHeadLimitBelowLevelMinimum) {
  // 500 bytes cannot hold the head record and is too small to self-encrypt as a level
  EXPECT_THROW(get_data_chunks(random_bytes(7000), nullptr, encryptor, 500, 8), ClientError);

  BlobAddress address = pack(random_bytes(20000, 6), nullptr, encryptor.layout().min_encryptable_bytes());
  ChunkFetcher fetcher(pool, fetch_from_network());
  HeadChunkResolver resolver(fetcher, encryptor, 8);
  EXPECT_EQ(resolver.unpack_head_chunk(head_of(address), nullptr), encryptor.encrypt(random_bytes(20000, 6)).first);
}

TEST_F(HeadChunkResolverTest, MissingIndirectionChunkFailsResolution) {
  BlobAddress address = pack(random_bytes(20000), nullptr);
  SecretKey head = codec.deserialize_secret_key(network.at(address.name()).value());
  network.erase(head.key.keys()[1].dst_hash);

  ChunkFetcher fetcher(pool, fetch_from_network());
  HeadChunkResolver resolver(fetcher, encryptor, 8);
  EXPECT_THROW(resolver.unpack_head_chunk(head_of(address), nullptr), NotEnoughChunks);
}

#ifndef BLOBSTORE_CLIENT_HEAD_CHUNK_RESOLVER_HPP
#define BLOBSTORE_CLIENT_HEAD_CHUNK_RESOLVER_HPP

#include <cstddef>
#include "client/chunk_fetcher.hpp"
#include "client/codec.hpp"
#include "crypto/owner_encryption.hpp"
#include "self_encryption/self_encryptor.hpp"
#include "types/blob_address.hpp"
#include "types/chunk.hpp"

namespace blobstore::client {

// Head chunk as fetched, with the address that carries its scope
struct HeadChunk {
  types::Chunk chunk;
  types::BlobAddress address;
};

// Unwraps head-chunk indirection levels until the first-level decode key
class HeadChunkResolver {
public:
  HeadChunkResolver(const ChunkFetcher& fetcher, const self_encryption::SelfEncryptor& encryptor,
                    size_t max_indirection_depth);

  // `owner` is required for private addresses and ignored for public ones.
  // Throws DecryptionError, SerializationError, NotEnoughChunks or
  // IndirectionTooDeep.
  self_encryption::DecodeKey unpack_head_chunk(HeadChunk head, const crypto::OwnerEncryption* owner) const;

private:
  const ChunkFetcher& fetcher_;
  const self_encryption::SelfEncryptor& encryptor_;
  Codec codec_;
  size_t max_indirection_depth_;
};

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_HEAD_CHUNK_RESOLVER_HPP

#include "client/head_chunk_resolver.hpp"
#include <boost/log/trivial.hpp>

namespace blobstore::client {

HeadChunkResolver::HeadChunkResolver(const ChunkFetcher& fetcher,
                                     const self_encryption::SelfEncryptor& encryptor,
                                     size_t max_indirection_depth)
  : fetcher_(fetcher)
  , encryptor_(encryptor)
  , max_indirection_depth_(max_indirection_depth) {}

self_encryption::DecodeKey HeadChunkResolver::unpack_head_chunk(HeadChunk head,
                                                                const crypto::OwnerEncryption* owner) const {
  const types::BlobAddress address = head.address;
  if (address.is_private() && !owner) {
    throw ClientError("Head chunk resolver: Private blob requires an encryption capability");
  }

  types::Chunk chunk = std::move(head.chunk);
  size_t depth = 0;

  while (true) {
    // Private blobs carry an owner-encrypted record at every level
    types::Bytes bytes = address.is_public() ? chunk.value() : owner->unwrap(chunk.value());

    SecretKey secret_key = codec_.deserialize_secret_key(bytes);
    if (secret_key.is_first_level()) {
      // Head records come from the network, their sizes are checked before any use
      encryptor_.validate(secret_key.key);
      BOOST_LOG_TRIVIAL(debug) << "Head chunk resolver: Resolved " << address << " after " << depth
                               << " additional levels";
      return std::move(secret_key.key);
    }

    if (++depth > max_indirection_depth_) {
      BOOST_LOG_TRIVIAL(error) << "Head chunk resolver: Indirection of " << address << " exceeds "
                               << max_indirection_depth_ << " levels";
      throw IndirectionTooDeep(max_indirection_depth_);
    }

    BOOST_LOG_TRIVIAL(debug) << "Head chunk resolver: Following additional level " << depth << " of " << address
                             << " through " << secret_key.key.keys().size() << " chunks";

    // The next head record is itself stored as a self-encrypted chunk set
    auto encrypted_chunks = fetcher_.try_get_chunks(secret_key.key.keys());
    types::Bytes serialized_chunk = encryptor_.decode_full(secret_key.key, encrypted_chunks);
    chunk = codec_.deserialize_chunk(serialized_chunk);
  }
}

} // namespace blobstore::client

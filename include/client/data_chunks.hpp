#ifndef BLOBSTORE_CLIENT_DATA_CHUNKS_HPP
#define BLOBSTORE_CLIENT_DATA_CHUNKS_HPP

#include <cstddef>
#include <utility>
#include <vector>
#include "crypto/owner_encryption.hpp"
#include "self_encryption/self_encryptor.hpp"
#include "types/blob_address.hpp"
#include "types/chunk.hpp"

namespace blobstore::client {

// Self-encrypts `data` and packs its decode key into a head chunk. A key
// whose head record exceeds `max_head_size` is itself self-encrypted and
// referenced from an additional level, repeatedly, up to `max_depth` levels.
// With `owner` set the blob is private and every head record is wrapped.
// Throws ClientError when `max_head_size` is below the layout's
// min_encryptable_bytes().
//
// Returns the blob address and every chunk to store, head chunk last.
std::pair<types::BlobAddress, std::vector<types::Chunk>> get_data_chunks(
  const types::Bytes& data,
  const crypto::OwnerEncryption* owner,
  const self_encryption::SelfEncryptor& encryptor,
  size_t max_head_size,
  size_t max_depth);

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_DATA_CHUNKS_HPP

#ifndef BLOBSTORE_CLIENT_CONFIG_HPP
#define BLOBSTORE_CLIENT_CONFIG_HPP

#include <cstddef>
#include "self_encryption/self_encryptor.hpp"

namespace blobstore::client {

struct ClientConfig {
  // Upper bound on concurrently running chunk fetches and stores
  size_t worker_threads = 8;
  // Additional head-chunk levels a read will follow before failing
  size_t max_indirection_depth = 8;
  // Must match the layout the blob was written with
  self_encryption::ChunkLayout layout;
  // Largest head-chunk payload before the record moves behind another level.
  // At least layout.min_encryptable_bytes().
  size_t max_head_size = 1024 * 1024;
};

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_CONFIG_HPP

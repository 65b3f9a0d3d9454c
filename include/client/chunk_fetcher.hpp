#ifndef BLOBSTORE_CLIENT_CHUNK_FETCHER_HPP
#define BLOBSTORE_CLIENT_CHUNK_FETCHER_HPP

#include <functional>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "client/client_error.hpp"
#include "client/manifest.hpp"
#include "types/chunk.hpp"

namespace blobstore::client {

// Retrieves one chunk by content address; throws network::QueryError when
// the chunk cannot be obtained
using FetchFn = std::function<types::Chunk(const types::ContentHash&)>;

// Concurrent, partial-failure-tolerant retrieval of a chunk set.
// Must not be called from a thread of its own pool.
class ChunkFetcher {
public:
  // ---- CONSTRUCTOR ----
  ChunkFetcher(boost::asio::thread_pool& pool, FetchFn fetch);


  // ---- FETCH OPERATIONS ----
  // Fetches every key concurrently and waits for all of them. Failed fetches
  // are logged and counted as missing; if any is missing the whole batch
  // fails with NotEnoughChunks. Errors other than fetch failures are
  // rethrown once every fetch has settled.
  std::vector<types::EncryptedChunk> try_get_chunks(const std::vector<types::ChunkKey>& keys,
                                                    FetchManifest* manifest = nullptr) const;

private:
  // ---- PARAMETERS ----
  boost::asio::thread_pool& pool_;
  FetchFn fetch_;
};

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_CHUNK_FETCHER_HPP

#include "client/chunk_fetcher.hpp"
#include <exception>
#include <future>
#include <memory>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include "network/network_error.hpp"

namespace blobstore::client {

ChunkFetcher::ChunkFetcher(boost::asio::thread_pool& pool, FetchFn fetch)
  : pool_(pool)
  , fetch_(std::move(fetch)) {}

std::vector<types::EncryptedChunk> ChunkFetcher::try_get_chunks(const std::vector<types::ChunkKey>& keys,
                                                                FetchManifest* manifest) const {
  const size_t expected_count = keys.size();
  BOOST_LOG_TRIVIAL(debug) << "Chunk fetcher: Fetching " << expected_count << " chunks";

  // Fan out: one unit of work per key
  std::vector<std::future<types::Chunk>> pending;
  pending.reserve(expected_count);
  for (const auto& key : keys) {
    auto task = std::make_shared<std::packaged_task<types::Chunk()>>(
      [fetch = fetch_, address = key.dst_hash]() { return fetch(address); });
    pending.push_back(task->get_future());
    boost::asio::post(pool_, [task]() { (*task)(); });
  }

  // Fan in: every unit settles before any decision is taken
  FetchManifest outcomes;
  std::vector<types::EncryptedChunk> encrypted_chunks;
  std::exception_ptr fatal;

  for (size_t i = 0; i < expected_count; ++i) {
    const auto& key = keys[i];
    try {
      types::Chunk chunk = pending[i].get();
      if (chunk.address() != key.dst_hash) {
        BOOST_LOG_TRIVIAL(warning) << "Chunk fetcher: Chunk " << types::to_hex(key.dst_hash)
                                   << " arrived with mismatching content " << types::to_hex(chunk.address());
        outcomes.record_failure(key.index, key.dst_hash, "content does not match address");
        continue;
      }
      encrypted_chunks.push_back(types::EncryptedChunk{key.index, chunk.value()});
      outcomes.record_success(key.index, key.dst_hash);
    } catch (const network::QueryError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk fetcher: Reading chunk " << types::to_hex(key.dst_hash)
                                 << " from network resulted in error: " << e.what();
      outcomes.record_failure(key.index, key.dst_hash, e.what());
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Chunk fetcher: Fatal error fetching chunk " << types::to_hex(key.dst_hash) << ": " << e.what();
      outcomes.record_failure(key.index, key.dst_hash, e.what());
      if (!fatal) {
        fatal = std::current_exception();
      }
    }
  }

  if (manifest) {
    *manifest = outcomes;
  }

  if (fatal) {
    std::rethrow_exception(fatal);
  }

  if (encrypted_chunks.size() < expected_count) {
    BOOST_LOG_TRIVIAL(error) << "Chunk fetcher: Retrieved " << encrypted_chunks.size() << " of "
                             << expected_count << " chunks";
    throw NotEnoughChunks(expected_count, encrypted_chunks.size());
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk fetcher: Retrieved all " << expected_count << " chunks";
  return encrypted_chunks;
}

} // namespace blobstore::client

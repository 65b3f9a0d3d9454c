#ifndef BLOBSTORE_CLIENT_CLIENT_HPP
#define BLOBSTORE_CLIENT_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "client/chunk_fetcher.hpp"
#include "client/client_config.hpp"
#include "client/client_error.hpp"
#include "client/head_chunk_resolver.hpp"
#include "client/manifest.hpp"
#include "crypto/owner_encryption.hpp"
#include "network/session.hpp"
#include "self_encryption/self_encryptor.hpp"
#include "types/blob_address.hpp"
#include "types/chunk.hpp"

namespace blobstore::client {

// Stores and retrieves blobs as self-encrypted chunk sets over a network
// session. All chunk operations of one call run on the client's worker pool.
class Client {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Client(network::SessionPtr session, crypto::OwnerKey owner_key, ClientConfig config = ClientConfig());
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- BLOB OPERATIONS ----
  // Packs and stores `data`, returning its address once every chunk store
  // has settled. Individual store failures are logged, not raised.
  types::BlobAddress write_to_network(const types::Bytes& data, types::Scope scope);
  // Stores every chunk concurrently and reports per-chunk outcomes
  StoreManifest store_chunks(const std::vector<types::Chunk>& chunks);

  types::Bytes read_blob(const types::BlobAddress& address);
  // Reads `length` bytes starting at `position`; throws RangeError past the end
  types::Bytes read_blob_from(const types::BlobAddress& address, uint64_t position, uint64_t length);


  // ---- CHUNK OPERATIONS ----
  // Fetches a single chunk by content address
  types::Chunk read_from_network(const types::ContentHash& name);


  // ---- ACCESSORS ----
  const crypto::OwnerKey& owner_key() const { return owner_key_; }
  const ClientConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  network::SessionPtr session_;
  crypto::OwnerKey owner_key_;
  ClientConfig config_;
  self_encryption::SelfEncryptor encryptor_;
  std::unique_ptr<boost::asio::thread_pool> thread_pool_;
  std::unique_ptr<ChunkFetcher> fetcher_;
  std::unique_ptr<HeadChunkResolver> resolver_;


  // ---- HELPERS ----
  self_encryption::DecodeKey resolve(const types::BlobAddress& address);
};

// Fetches `name` through `session`, validating the response against the query
types::Chunk fetch_chunk(network::Session& session, const types::ContentHash& name);

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_CLIENT_HPP

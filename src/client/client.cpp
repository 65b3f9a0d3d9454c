#include "client/client.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include "client/data_chunks.hpp"
#include "network/network_error.hpp"

namespace blobstore::client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(network::SessionPtr session, crypto::OwnerKey owner_key, ClientConfig config)
  : session_(std::move(session))
  , owner_key_(owner_key)
  , config_(config)
  , encryptor_(config.layout)
  , thread_pool_(std::make_unique<boost::asio::thread_pool>(std::max<size_t>(1, config.worker_threads))) {
  if (!session_) {
    throw ClientError("Client: A network session is required");
  }
  if (config_.max_head_size < encryptor_.layout().min_encryptable_bytes()) {
    BOOST_LOG_TRIVIAL(error) << "Client: Head size limit " << config_.max_head_size << " is below the minimum of "
                             << encryptor_.layout().min_encryptable_bytes() << " bytes";
    throw ClientError("Client: max_head_size must be at least " +
                      std::to_string(encryptor_.layout().min_encryptable_bytes()) + " bytes");
  }

  // Units of work hold their own reference to the session
  network::SessionPtr session_ref = session_;
  fetcher_ = std::make_unique<ChunkFetcher>(*thread_pool_, [session_ref](const types::ContentHash& name) {
    return fetch_chunk(*session_ref, name);
  });
  resolver_ = std::make_unique<HeadChunkResolver>(*fetcher_, encryptor_, config_.max_indirection_depth);

  BOOST_LOG_TRIVIAL(info) << "Client: Initialized with " << config_.worker_threads << " worker threads";
}

Client::~Client() {
  thread_pool_->join();
  BOOST_LOG_TRIVIAL(debug) << "Client: Worker pool stopped";
}


//==============================================
// BLOB OPERATIONS
//==============================================

types::BlobAddress Client::write_to_network(const types::Bytes& data, types::Scope scope) {
  BOOST_LOG_TRIVIAL(info) << "Client: Writing " << data.size() << " bytes as a "
                          << types::scope_to_string(scope) << " blob";

  auto owner = crypto::encryption_for(scope, owner_key_);
  auto [address, chunks] = get_data_chunks(data, owner.get(), encryptor_,
                                           config_.max_head_size, config_.max_indirection_depth);

  StoreManifest manifest = store_chunks(chunks);
  if (!manifest.complete()) {
    BOOST_LOG_TRIVIAL(warning) << "Client: " << manifest.failed_count() << " of " << manifest.size()
                               << " chunk stores failed for " << address;
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Wrote blob " << address;
  return address;
}

StoreManifest Client::store_chunks(const std::vector<types::Chunk>& chunks) {
  std::vector<std::future<void>> pending;
  pending.reserve(chunks.size());

  for (const auto& chunk : chunks) {
    auto task = std::make_shared<std::packaged_task<void()>>(
      [session = session_, frame = network::MessageFrame::store_chunk(chunk)]() { session->send_cmd(frame); });
    pending.push_back(task->get_future());
    boost::asio::post(*thread_pool_, [task]() { (*task)(); });
  }

  StoreManifest manifest;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& address = chunks[i].address();
    try {
      pending[i].get();
      manifest.record_success(i, address);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Storing chunk " << types::to_hex(address) << " failed: " << e.what();
      manifest.record_failure(i, address, e.what());
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Client: Stored " << manifest.succeeded_count() << " of " << manifest.size()
                           << " chunks";
  return manifest;
}

types::Bytes Client::read_blob(const types::BlobAddress& address) {
  BOOST_LOG_TRIVIAL(info) << "Client: Reading blob " << address;

  self_encryption::DecodeKey key = resolve(address);
  auto encrypted_chunks = fetcher_->try_get_chunks(key.keys());
  types::Bytes data = encryptor_.decode_full(key, encrypted_chunks);

  BOOST_LOG_TRIVIAL(info) << "Client: Read " << data.size() << " bytes from " << address;
  return data;
}

types::Bytes Client::read_blob_from(const types::BlobAddress& address, uint64_t position, uint64_t length) {
  BOOST_LOG_TRIVIAL(info) << "Client: Reading " << length << " bytes at " << position << " from " << address;

  self_encryption::DecodeKey key = resolve(address);
  const uint64_t file_size = key.file_size();
  if (position > file_size || length > file_size - position) {
    throw RangeError(position, length, file_size);
  }
  if (length == 0) {
    return {};
  }

  self_encryption::SeekInfo seek = encryptor_.compute_range(file_size, position, length);
  const auto& keys = key.keys();
  if (seek.last_index >= keys.size()) {
    throw SerializationError("decode key holds " + std::to_string(keys.size()) +
                             " chunks but the range needs chunk " + std::to_string(seek.last_index));
  }

  std::vector<types::ChunkKey> wanted(keys.begin() + seek.first_index, keys.begin() + seek.last_index + 1);
  auto encrypted_chunks = fetcher_->try_get_chunks(wanted);
  return encryptor_.decode_range(key, encrypted_chunks, seek.relative_pos, static_cast<size_t>(length));
}


//==============================================
// CHUNK OPERATIONS
//==============================================

types::Chunk Client::read_from_network(const types::ContentHash& name) {
  return fetch_chunk(*session_, name);
}

types::Chunk fetch_chunk(network::Session& session, const types::ContentHash& name) {
  network::MessageFrame response = session.send_query(network::MessageFrame::get_chunk(name));

  if (response.message_type != network::MessageType::GET_CHUNK) {
    throw UnexpectedResponseKind(std::string("expected GET_CHUNK, got ") +
                                 network::message_type_to_string(response.message_type));
  }
  if (response.error != network::NetworkError::SUCCESS) {
    throw network::QueryError(response.error, "chunk " + types::to_hex(name));
  }
  if (!response.chunk) {
    throw UnexpectedResponseKind("GET_CHUNK response carries no chunk");
  }
  if (response.chunk->address() != name) {
    throw network::QueryError(network::NetworkError::TRANSFER_FAILED,
                              "chunk " + types::to_hex(name) + " answered with " +
                              types::to_hex(response.chunk->address()));
  }

  BOOST_LOG_TRIVIAL(trace) << "Client: Fetched chunk " << types::to_hex(name) << " (" << response.chunk->size() << " bytes)";
  return *response.chunk;
}


//==============================================
// HELPERS
//==============================================

self_encryption::DecodeKey Client::resolve(const types::BlobAddress& address) {
  types::Chunk head_chunk = read_from_network(address.name());
  auto owner = crypto::encryption_for(address.scope(), owner_key_);
  return resolver_->unpack_head_chunk(HeadChunk{std::move(head_chunk), address}, owner.get());
}

} // namespace blobstore::client

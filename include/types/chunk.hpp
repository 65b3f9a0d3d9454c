#ifndef BLOBSTORE_TYPES_CHUNK_HPP
#define BLOBSTORE_TYPES_CHUNK_HPP

#include <cstdint>
#include <vector>
#include "types/content_hash.hpp"

namespace blobstore::types {

// Atomic network-stored unit. The address is always derived from the
// payload, so a chunk cannot carry an address that does not match its bytes.
class Chunk {
public:
  // ---- CONSTRUCTOR ----
  explicit Chunk(Bytes payload)
    : payload_(std::move(payload))
    , address_(hash_content(payload_)) {}


  // ---- GETTERS ----
  const ContentHash& address() const { return address_; }
  const Bytes& value() const { return payload_; }
  size_t size() const { return payload_.size(); }

  bool operator==(const Chunk& other) const { return address_ == other.address_; }
  bool operator!=(const Chunk& other) const { return !(*this == other); }
  bool operator<(const Chunk& other) const { return address_ < other.address_; }

private:
  // ---- PARAMETERS ----
  Bytes payload_;
  ContentHash address_;
};

// Locates one self-encrypted chunk and its place in the original data
struct ChunkKey {
  uint64_t index{0};
  ContentHash dst_hash{};  // content address of the encrypted chunk
  ContentHash src_hash{};  // hash of the plaintext slice
  uint64_t src_size{0};

  bool operator==(const ChunkKey& other) const {
    return index == other.index && dst_hash == other.dst_hash &&
           src_hash == other.src_hash && src_size == other.src_size;
  }
  bool operator!=(const ChunkKey& other) const { return !(*this == other); }
};

// Fetched chunk content tagged with its position in the original sequence
struct EncryptedChunk {
  uint64_t index{0};
  Bytes content;
};

} // namespace blobstore::types

#endif // BLOBSTORE_TYPES_CHUNK_HPP

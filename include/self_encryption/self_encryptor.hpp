#ifndef BLOBSTORE_SELF_ENCRYPTOR_HPP
#define BLOBSTORE_SELF_ENCRYPTOR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "types/chunk.hpp"
#include "types/content_hash.hpp"

namespace blobstore::self_encryption {

class SelfEncryptionError : public std::runtime_error {
public:
  explicit SelfEncryptionError(const std::string& message)
    : std::runtime_error("Self-encryption error: " + message) {}
};

// Chunk size bounds shared by the writer and every reader of a blob
struct ChunkLayout {
  size_t min_chunk_size = 1024;
  size_t max_chunk_size = 1024 * 1024;

  // Smallest input that splits into three chunks of at least min_chunk_size
  size_t min_encryptable_bytes() const { return 3 * min_chunk_size; }
};

// Self-encryption chunk-layout metadata: the ordered chunk keys of one blob.
// Not a cryptographic identity key.
class DecodeKey {
public:
  DecodeKey() = default;
  explicit DecodeKey(std::vector<types::ChunkKey> keys) : keys_(std::move(keys)) {}

  const std::vector<types::ChunkKey>& keys() const { return keys_; }
  // Total size of the original data
  uint64_t file_size() const;

  bool operator==(const DecodeKey& other) const { return keys_ == other.keys_; }
  bool operator!=(const DecodeKey& other) const { return !(*this == other); }

private:
  std::vector<types::ChunkKey> keys_;
};

// Chunks covering a byte window: indices first..last inclusive, and the
// offset of the window's first byte inside chunk `first`
struct SeekInfo {
  size_t first_index{0};
  size_t last_index{0};
  size_t relative_pos{0};
};

class SelfEncryptor {
public:
  // ---- CONSTRUCTOR ----
  explicit SelfEncryptor(ChunkLayout layout = ChunkLayout());


  // ---- ENCODING ----
  // Splits data into content-derived encrypted chunks, ordered by index.
  // Throws SelfEncryptionError below min_encryptable_bytes.
  std::pair<DecodeKey, std::vector<types::Chunk>> encrypt(const types::Bytes& data) const;


  // ---- DECODING ----
  // Reassembles the whole file; chunk order in `chunks` is irrelevant
  types::Bytes decode_full(const DecodeKey& key, const std::vector<types::EncryptedChunk>& chunks) const;
  // Decodes a contiguous run of chunks and returns `length` bytes from `relative_pos`
  types::Bytes decode_range(const DecodeKey& key, const std::vector<types::EncryptedChunk>& chunks,
                            size_t relative_pos, size_t length) const;


  // ---- LAYOUT ----
  // Maps a byte window onto the chunks holding it; length must be non-zero
  SeekInfo compute_range(uint64_t file_size, uint64_t position, uint64_t length) const;
  size_t num_chunks(uint64_t file_size) const;
  size_t chunk_size(uint64_t file_size, size_t index) const;
  uint64_t chunk_start(uint64_t file_size, size_t index) const;

  // Checks that key indices run 0..n-1 and that chunk count and sizes follow
  // this layout for the key's total size. Throws SelfEncryptionError otherwise.
  void validate(const DecodeKey& key) const;

  const ChunkLayout& layout() const { return layout_; }

private:
  // ---- PARAMETERS ----
  ChunkLayout layout_;


  // ---- CHUNK CIPHER ----
  types::Bytes encrypt_chunk(size_t index, const types::Bytes& slice,
                             const std::vector<types::ContentHash>& src_hashes) const;
  types::Bytes decrypt_chunk(const DecodeKey& key, size_t index, const types::Bytes& content) const;

  size_t index_of(uint64_t file_size, uint64_t position) const;
};

} // namespace blobstore::self_encryption

#endif // BLOBSTORE_SELF_ENCRYPTOR_HPP

#include "self_encryption/self_encryptor.hpp"
#include "crypto/cipher.hpp"
#include <algorithm>
#include <cstdint>
#include <map>
#include <boost/log/trivial.hpp>

namespace blobstore::self_encryption {

using types::Bytes;
using types::Chunk;
using types::ChunkKey;
using types::ContentHash;
using types::EncryptedChunk;

namespace {

// Obfuscation pad bound to a chunk and both of its key-providing neighbours
std::array<uint8_t, 64> make_pad(const ContentHash& own, const ContentHash& n_1, const ContentHash& n_2) {
  Bytes material;
  material.reserve(3 * types::HASH_SIZE);
  material.insert(material.end(), own.begin(), own.end());
  material.insert(material.end(), n_1.begin(), n_1.end());
  material.insert(material.end(), n_2.begin(), n_2.end());
  return types::hash_512(material);
}

void xor_with_pad(Bytes& data, const std::array<uint8_t, 64>& pad) {
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] ^= pad[i % pad.size()];
  }
}

} // namespace

uint64_t DecodeKey::file_size() const {
  uint64_t total = 0;
  for (const auto& key : keys_) {
    total += key.src_size;
  }
  return total;
}

//==============================================
// CONSTRUCTOR
//==============================================

SelfEncryptor::SelfEncryptor(ChunkLayout layout) : layout_(layout) {
  if (layout_.min_chunk_size == 0 || layout_.max_chunk_size < layout_.min_chunk_size * 2) {
    throw SelfEncryptionError("Invalid chunk layout: min " + std::to_string(layout_.min_chunk_size) +
                              ", max " + std::to_string(layout_.max_chunk_size));
  }
}

//==============================================
// ENCODING
//==============================================

std::pair<DecodeKey, std::vector<Chunk>> SelfEncryptor::encrypt(const Bytes& data) const {
  if (data.size() < layout_.min_encryptable_bytes()) {
    BOOST_LOG_TRIVIAL(error) << "Self encryptor: Data of " << data.size() << " bytes is below the minimum of "
                             << layout_.min_encryptable_bytes() << " bytes";
    throw SelfEncryptionError("Data too small for self-encryption: " + std::to_string(data.size()) + " bytes");
  }

  const uint64_t file_size = data.size();
  const size_t count = num_chunks(file_size);
  BOOST_LOG_TRIVIAL(debug) << "Self encryptor: Splitting " << file_size << " bytes into " << count << " chunks";

  // First pass: hash every plaintext slice, the keys of each chunk depend on its neighbours
  std::vector<ContentHash> src_hashes;
  src_hashes.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    uint64_t start = chunk_start(file_size, i);
    src_hashes.push_back(types::hash_content(data.data() + start, chunk_size(file_size, i)));
  }

  std::vector<ChunkKey> keys;
  std::vector<Chunk> chunks;
  keys.reserve(count);
  chunks.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    uint64_t start = chunk_start(file_size, i);
    size_t size = chunk_size(file_size, i);
    Bytes slice(data.begin() + start, data.begin() + start + size);

    Chunk chunk(encrypt_chunk(i, slice, src_hashes));

    ChunkKey key;
    key.index = i;
    key.dst_hash = chunk.address();
    key.src_hash = src_hashes[i];
    key.src_size = size;

    keys.push_back(key);
    chunks.push_back(std::move(chunk));
  }

  return {DecodeKey(std::move(keys)), std::move(chunks)};
}

//==============================================
// DECODING
//==============================================

Bytes SelfEncryptor::decode_full(const DecodeKey& key, const std::vector<EncryptedChunk>& chunks) const {
  validate(key);

  std::map<uint64_t, const EncryptedChunk*> by_index;
  for (const auto& chunk : chunks) {
    by_index[chunk.index] = &chunk;
  }

  Bytes output;
  output.reserve(key.file_size());

  for (const auto& chunk_key : key.keys()) {
    auto it = by_index.find(chunk_key.index);
    if (it == by_index.end()) {
      throw SelfEncryptionError("Missing chunk with index " + std::to_string(chunk_key.index));
    }
    Bytes plain = decrypt_chunk(key, chunk_key.index, it->second->content);
    output.insert(output.end(), plain.begin(), plain.end());
  }

  BOOST_LOG_TRIVIAL(debug) << "Self encryptor: Decoded " << output.size() << " bytes from "
                           << key.keys().size() << " chunks";
  return output;
}

Bytes SelfEncryptor::decode_range(const DecodeKey& key, const std::vector<EncryptedChunk>& chunks,
                                  size_t relative_pos, size_t length) const {
  validate(key);

  std::vector<const EncryptedChunk*> ordered;
  ordered.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    ordered.push_back(&chunk);
  }
  std::sort(ordered.begin(), ordered.end(),
            [](const EncryptedChunk* a, const EncryptedChunk* b) { return a->index < b->index; });

  Bytes window;
  for (size_t i = 0; i < ordered.size(); ++i) {
    const auto* chunk = ordered[i];
    if (i > 0 && chunk->index != ordered[i - 1]->index + 1) {
      throw SelfEncryptionError("Chunks for a range read must be contiguous, gap before index " +
                                std::to_string(chunk->index));
    }
    if (chunk->index >= key.keys().size()) {
      throw SelfEncryptionError("Chunk index " + std::to_string(chunk->index) + " outside decode key");
    }
    Bytes plain = decrypt_chunk(key, chunk->index, chunk->content);
    window.insert(window.end(), plain.begin(), plain.end());
  }

  if (relative_pos > window.size() || length > window.size() - relative_pos) {
    throw SelfEncryptionError("Requested " + std::to_string(length) + " bytes at offset " +
                              std::to_string(relative_pos) + " of a " + std::to_string(window.size()) +
                              " byte window");
  }

  return Bytes(window.begin() + relative_pos, window.begin() + relative_pos + length);
}

//==============================================
// LAYOUT
//==============================================

size_t SelfEncryptor::num_chunks(uint64_t file_size) const {
  if (file_size < layout_.min_encryptable_bytes()) {
    return 0;
  }
  if (file_size < 3 * layout_.max_chunk_size) {
    return 3;
  }
  return file_size / layout_.max_chunk_size + (file_size % layout_.max_chunk_size == 0 ? 0 : 1);
}

size_t SelfEncryptor::chunk_size(uint64_t file_size, size_t index) const {
  const size_t count = num_chunks(file_size);
  if (index >= count) {
    return 0;
  }

  if (file_size < 3 * layout_.max_chunk_size) {
    return index < 2 ? file_size / 3 : file_size - 2 * (file_size / 3);
  }

  const size_t max = layout_.max_chunk_size;
  const size_t remainder = file_size % max;
  if (index < count - 2 || remainder == 0) {
    return max;
  }
  // A short tail borrows from the chunk before it to stay above the minimum
  if (remainder < layout_.min_chunk_size) {
    return index == count - 2 ? max - layout_.min_chunk_size : layout_.min_chunk_size + remainder;
  }
  return index == count - 2 ? max : remainder;
}

uint64_t SelfEncryptor::chunk_start(uint64_t file_size, size_t index) const {
  const size_t count = num_chunks(file_size);
  if (count == 0) {
    return 0;
  }
  if (index + 1 >= count) {
    return file_size - chunk_size(file_size, count - 1);
  }
  // Every chunk but the last two has the size of the first
  return static_cast<uint64_t>(index) * chunk_size(file_size, 0);
}

size_t SelfEncryptor::index_of(uint64_t file_size, uint64_t position) const {
  const size_t count = num_chunks(file_size);
  size_t index = std::min<uint64_t>(position / chunk_size(file_size, 0), count - 1);

  while (index > 0 && position < chunk_start(file_size, index)) {
    --index;
  }
  while (index + 1 < count && position >= chunk_start(file_size, index + 1)) {
    ++index;
  }
  return index;
}

SeekInfo SelfEncryptor::compute_range(uint64_t file_size, uint64_t position, uint64_t length) const {
  if (num_chunks(file_size) == 0) {
    throw SelfEncryptionError("File size " + std::to_string(file_size) + " has no chunk layout");
  }
  if (length == 0 || position >= file_size) {
    throw SelfEncryptionError("Empty or out of bounds range at position " + std::to_string(position));
  }

  uint64_t end = std::min(position + length, file_size);

  SeekInfo info;
  info.first_index = index_of(file_size, position);
  info.last_index = index_of(file_size, end - 1);
  info.relative_pos = position - chunk_start(file_size, info.first_index);

  BOOST_LOG_TRIVIAL(trace) << "Self encryptor: Range [" << position << ", " << end << ") maps to chunks "
                           << info.first_index << ".." << info.last_index
                           << " at relative offset " << info.relative_pos;
  return info;
}

//==============================================
// CHUNK CIPHER
//==============================================

Bytes SelfEncryptor::encrypt_chunk(size_t index, const Bytes& slice,
                                   const std::vector<ContentHash>& src_hashes) const {
  const size_t count = src_hashes.size();
  const ContentHash& n_1 = src_hashes[(index + count - 1) % count];
  const ContentHash& n_2 = src_hashes[(index + count - 2) % count];

  crypto::Cipher cipher(n_1.data(), n_1.size(), n_2.data(), crypto::Cipher::IV_SIZE);
  Bytes content = cipher.encrypt(slice);
  xor_with_pad(content, make_pad(src_hashes[index], n_1, n_2));
  return content;
}

Bytes SelfEncryptor::decrypt_chunk(const DecodeKey& key, size_t index, const Bytes& content) const {
  const auto& keys = key.keys();
  const size_t count = keys.size();
  const ChunkKey& own = keys[index];

  if (types::hash_content(content) != own.dst_hash) {
    throw crypto::DecryptionError("Content of chunk " + std::to_string(index) + " does not match its address");
  }

  const ContentHash& n_1 = keys[(index + count - 1) % count].src_hash;
  const ContentHash& n_2 = keys[(index + count - 2) % count].src_hash;

  Bytes data = content;
  xor_with_pad(data, make_pad(own.src_hash, n_1, n_2));

  crypto::Cipher cipher(n_1.data(), n_1.size(), n_2.data(), crypto::Cipher::IV_SIZE);
  Bytes plain = cipher.decrypt(data);

  if (plain.size() != own.src_size || types::hash_content(plain) != own.src_hash) {
    throw crypto::DecryptionError("Chunk " + std::to_string(index) + " failed its integrity check");
  }
  return plain;
}

void SelfEncryptor::validate(const DecodeKey& key) const {
  const auto& keys = key.keys();
  if (keys.size() < 3) {
    throw SelfEncryptionError("Decode key lists " + std::to_string(keys.size()) + " chunks, at least 3 required");
  }

  uint64_t file_size = 0;
  for (size_t i = 0; i < keys.size(); ++i) {
    if (keys[i].index != i) {
      throw SelfEncryptionError("Decode key entry " + std::to_string(i) + " carries index " +
                                std::to_string(keys[i].index));
    }
    if (keys[i].src_size > layout_.max_chunk_size || file_size > UINT64_MAX - keys[i].src_size) {
      throw SelfEncryptionError("Decode key entry " + std::to_string(i) + " has an invalid size of " +
                                std::to_string(keys[i].src_size) + " bytes");
    }
    file_size += keys[i].src_size;
  }

  if (num_chunks(file_size) != keys.size()) {
    throw SelfEncryptionError("Decode key lists " + std::to_string(keys.size()) + " chunks for " +
                              std::to_string(file_size) + " bytes");
  }
  for (size_t i = 0; i < keys.size(); ++i) {
    if (keys[i].src_size != chunk_size(file_size, i)) {
      BOOST_LOG_TRIVIAL(error) << "Self encryptor: Decode key entry " << i << " holds " << keys[i].src_size
                               << " bytes, layout expects " << chunk_size(file_size, i);
      throw SelfEncryptionError("Decode key does not match the configured chunk layout");
    }
  }
}

} // namespace blobstore::self_encryption

#include "client/codec.hpp"
#include <sstream>
#include <string>
#include <boost/log/trivial.hpp>

namespace blobstore::client {

using types::Bytes;
using types::Chunk;
using types::ChunkKey;

//==============================================
// SERIALIZATION
//==============================================

std::size_t Codec::serialize(const SecretKey& secret_key, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw SerializationError("Invalid output stream");
  }

  std::size_t total_bytes = 0;

  uint32_t variant = to_wire_order(static_cast<uint32_t>(secret_key.level));
  write_bytes(output, &variant, sizeof(variant));
  total_bytes += sizeof(variant);

  const auto& keys = secret_key.key.keys();
  uint64_t count = to_wire_order(static_cast<uint64_t>(keys.size()));
  write_bytes(output, &count, sizeof(count));
  total_bytes += sizeof(count);

  for (const ChunkKey& key : keys) {
    uint64_t index = to_wire_order(key.index);
    write_bytes(output, &index, sizeof(index));
    write_bytes(output, key.dst_hash.data(), key.dst_hash.size());
    write_bytes(output, key.src_hash.data(), key.src_hash.size());
    uint64_t src_size = to_wire_order(key.src_size);
    write_bytes(output, &src_size, sizeof(src_size));
    total_bytes += CHUNK_KEY_SIZE;
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized secret key with " << keys.size()
                           << " chunk keys into " << total_bytes << " bytes";
  return total_bytes;
}

std::size_t Codec::serialize(const Chunk& chunk, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw SerializationError("Invalid output stream");
  }

  uint64_t length = to_wire_order(static_cast<uint64_t>(chunk.size()));
  write_bytes(output, &length, sizeof(length));
  write_bytes(output, chunk.value().data(), chunk.size());

  return sizeof(length) + chunk.size();
}

Bytes Codec::encode(const SecretKey& secret_key) const {
  std::stringstream output;
  serialize(secret_key, output);
  const std::string buffer = output.str();
  return Bytes(buffer.begin(), buffer.end());
}

Bytes Codec::encode(const Chunk& chunk) const {
  std::stringstream output;
  serialize(chunk, output);
  const std::string buffer = output.str();
  return Bytes(buffer.begin(), buffer.end());
}

//==============================================
// DESERIALIZATION
//==============================================

SecretKey Codec::deserialize_secret_key(const Bytes& bytes) const {
  if (bytes.size() < SECRET_KEY_HEADER_SIZE) {
    throw SerializationError("Secret key record of " + std::to_string(bytes.size()) + " bytes is truncated");
  }

  std::istringstream input(std::string(bytes.begin(), bytes.end()));

  uint32_t variant;
  read_bytes(input, &variant, sizeof(variant));
  variant = from_wire_order(variant);
  if (variant != static_cast<uint32_t>(SecretKeyLevel::FirstLevel) &&
      variant != static_cast<uint32_t>(SecretKeyLevel::AdditionalLevel)) {
    throw SerializationError("Unknown secret key variant: " + std::to_string(variant));
  }

  uint64_t count;
  read_bytes(input, &count, sizeof(count));
  count = from_wire_order(count);

  // Reject counts the remaining bytes cannot hold before allocating anything
  if (count != (bytes.size() - SECRET_KEY_HEADER_SIZE) / CHUNK_KEY_SIZE ||
      (bytes.size() - SECRET_KEY_HEADER_SIZE) % CHUNK_KEY_SIZE != 0) {
    throw SerializationError("Secret key declares " + std::to_string(count) + " chunk keys in a record of " +
                             std::to_string(bytes.size()) + " bytes");
  }

  std::vector<ChunkKey> keys;
  keys.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    ChunkKey key;
    uint64_t index;
    read_bytes(input, &index, sizeof(index));
    key.index = from_wire_order(index);
    read_bytes(input, key.dst_hash.data(), key.dst_hash.size());
    read_bytes(input, key.src_hash.data(), key.src_hash.size());
    uint64_t src_size;
    read_bytes(input, &src_size, sizeof(src_size));
    key.src_size = from_wire_order(src_size);
    keys.push_back(key);
  }
  expect_end(input);

  BOOST_LOG_TRIVIAL(trace) << "Codec: Deserialized " << (variant == 0 ? "first" : "additional")
                           << " level secret key with " << keys.size() << " chunk keys";
  return SecretKey{static_cast<SecretKeyLevel>(variant), self_encryption::DecodeKey(std::move(keys))};
}

Chunk Codec::deserialize_chunk(const Bytes& bytes) const {
  if (bytes.size() < sizeof(uint64_t)) {
    throw SerializationError("Chunk record of " + std::to_string(bytes.size()) + " bytes is truncated");
  }

  std::istringstream input(std::string(bytes.begin(), bytes.end()));

  uint64_t length;
  read_bytes(input, &length, sizeof(length));
  length = from_wire_order(length);

  if (length != bytes.size() - sizeof(uint64_t)) {
    throw SerializationError("Chunk record declares " + std::to_string(length) + " payload bytes, carries " +
                             std::to_string(bytes.size() - sizeof(uint64_t)));
  }

  Bytes payload(length);
  if (length > 0) {
    read_bytes(input, payload.data(), payload.size());
  }
  expect_end(input);

  return Chunk(std::move(payload));
}

//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) const {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw SerializationError("Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) const {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Failed to read " << size << " bytes from input stream";
    throw SerializationError("Unexpected end of input");
  }
}

void Codec::expect_end(std::istream& input) const {
  if (input.peek() != std::char_traits<char>::eof()) {
    throw SerializationError("Trailing bytes after record");
  }
}

} // namespace blobstore::client

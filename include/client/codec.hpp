#ifndef BLOBSTORE_CLIENT_CODEC_HPP
#define BLOBSTORE_CLIENT_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "client/client_error.hpp"
#include "client/secret_key.hpp"
#include "types/chunk.hpp"

namespace blobstore::client {

// Binary format of head-chunk records, compatible with bincode's default
// little-endian fixed-width encoding:
//
//   SecretKey := u32 variant | u64 count | count * ChunkKey
//   ChunkKey  := u64 index | 32 bytes dst_hash | 32 bytes src_hash | u64 src_size
//   Chunk     := u64 length | length bytes payload
class Codec {
public:
  static constexpr size_t CHUNK_KEY_SIZE = 8 + 32 + 32 + 8;
  static constexpr size_t SECRET_KEY_HEADER_SIZE = 4 + 8;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Each returns the number of bytes written
  std::size_t serialize(const SecretKey& secret_key, std::ostream& output) const;
  std::size_t serialize(const types::Chunk& chunk, std::ostream& output) const;

  // Throw SerializationError on malformed, truncated or over-long input
  SecretKey deserialize_secret_key(const types::Bytes& bytes) const;
  types::Chunk deserialize_chunk(const types::Bytes& bytes) const;

  // Byte-buffer conveniences over the stream forms
  types::Bytes encode(const SecretKey& secret_key) const;
  types::Bytes encode(const types::Chunk& chunk) const;

private:
  // ---- STREAM OPERATIONS ----
  void write_bytes(std::ostream& output, const void* data, std::size_t size) const;
  void read_bytes(std::istream& input, void* data, std::size_t size) const;
  // Fails unless the stream has been consumed completely
  void expect_end(std::istream& input) const;


  // ---- HOST TO WIRE BYTE ORDER CONVERSION ----
  static uint32_t to_wire_order(uint32_t host_value) {
    return boost::endian::native_to_little(host_value);
  }
  static uint64_t to_wire_order(uint64_t host_value) {
    return boost::endian::native_to_little(host_value);
  }


  // ---- WIRE TO HOST BYTE ORDER CONVERSION ----
  static uint32_t from_wire_order(uint32_t wire_value) {
    return boost::endian::little_to_native(wire_value);
  }
  static uint64_t from_wire_order(uint64_t wire_value) {
    return boost::endian::little_to_native(wire_value);
  }
};

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_CODEC_HPP

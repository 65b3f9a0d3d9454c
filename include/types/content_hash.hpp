#ifndef BLOBSTORE_TYPES_CONTENT_HASH_HPP
#define BLOBSTORE_TYPES_CONTENT_HASH_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace blobstore::types {

using Bytes = std::vector<uint8_t>;

static constexpr size_t HASH_SIZE = 32;

// SHA-256 digest used as a content address
using ContentHash = std::array<uint8_t, HASH_SIZE>;

// ---- HASHING ----
// SHA-256 of the given bytes using OpenSSL EVP
ContentHash hash_content(const uint8_t* data, size_t size);
ContentHash hash_content(const Bytes& data);
// SHA-512 of the given bytes, used for self-encryption pads
std::array<uint8_t, 64> hash_512(const Bytes& data);


// ---- TEXT CONVERSION ----
std::string to_hex(const ContentHash& hash);
std::string to_hex(const uint8_t* data, size_t size);
// Throws std::invalid_argument on wrong length or non-hex characters
ContentHash hash_from_hex(const std::string& hex);
Bytes bytes_from_hex(const std::string& hex);

std::ostream& operator<<(std::ostream& os, const ContentHash& hash);

} // namespace blobstore::types

namespace std {

template<>
struct hash<blobstore::types::ContentHash> {
  size_t operator()(const blobstore::types::ContentHash& hash) const noexcept {
    // Digest bytes are already uniformly distributed
    size_t value;
    std::memcpy(&value, hash.data(), sizeof(value));
    return value;
  }
};

} // namespace std

#endif // BLOBSTORE_TYPES_CONTENT_HASH_HPP

#ifndef BLOBSTORE_CLIENT_SECRET_KEY_HPP
#define BLOBSTORE_CLIENT_SECRET_KEY_HPP

#include <cstdint>
#include "self_encryption/self_encryptor.hpp"

namespace blobstore::client {

// Variant tags, as they appear on the wire
enum class SecretKeyLevel : uint32_t {
  FirstLevel = 0,      // key maps directly to the user's data
  AdditionalLevel = 1  // key maps to the serialized record of the next head chunk
};

// Head-chunk record: one indirection level of a blob's decode key
struct SecretKey {
  SecretKeyLevel level{SecretKeyLevel::FirstLevel};
  self_encryption::DecodeKey key;

  static SecretKey first_level(self_encryption::DecodeKey key) {
    return SecretKey{SecretKeyLevel::FirstLevel, std::move(key)};
  }
  static SecretKey additional_level(self_encryption::DecodeKey key) {
    return SecretKey{SecretKeyLevel::AdditionalLevel, std::move(key)};
  }

  bool is_first_level() const { return level == SecretKeyLevel::FirstLevel; }

  bool operator==(const SecretKey& other) const { return level == other.level && key == other.key; }
  bool operator!=(const SecretKey& other) const { return !(*this == other); }
};

} // namespace blobstore::client

#endif // BLOBSTORE_CLIENT_SECRET_KEY_HPP

#ifndef BLOBSTORE_CRYPTO_OWNER_ENCRYPTION_HPP
#define BLOBSTORE_CRYPTO_OWNER_ENCRYPTION_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"
#include "types/blob_address.hpp"

namespace blobstore::crypto {

// Secret key material of a blob owner
class OwnerKey {
public:
  static constexpr size_t KEY_SIZE = 32;

  // ---- FACTORIES ----
  // Draws a fresh key from the OpenSSL CSPRNG
  static OwnerKey generate();
  // Throws std::invalid_argument unless given exactly 64 hex characters
  static OwnerKey from_hex(const std::string& hex);

  explicit OwnerKey(const std::array<uint8_t, KEY_SIZE>& secret) : secret_(secret) {}

  const std::array<uint8_t, KEY_SIZE>& secret() const { return secret_; }
  std::string to_hex() const;

private:
  std::array<uint8_t, KEY_SIZE> secret_;
};

// Deterministic authenticated encryption of head-chunk records.
// The IV is a MAC of the plaintext, so identical records under the same
// owner produce identical ciphertext and therefore identical addresses.
class OwnerEncryption {
public:
  explicit OwnerEncryption(const OwnerKey& owner);

  // Returns iv || AES-256-CBC(plaintext)
  std::vector<uint8_t> wrap(const std::vector<uint8_t>& plaintext) const;
  // Throws DecryptionError on wrong key, truncation or tampering
  std::vector<uint8_t> unwrap(const std::vector<uint8_t>& ciphertext) const;

private:
  // ---- PARAMETERS ----
  std::array<uint8_t, 32> encryption_key_;
  std::array<uint8_t, 32> mac_key_;

  // Synthetic IV derived from the plaintext
  std::vector<uint8_t> derive_iv(const std::vector<uint8_t>& plaintext) const;
};

// Encryption capability for the given scope: the owner's for Private, none for Public
std::unique_ptr<OwnerEncryption> encryption_for(types::Scope scope, const OwnerKey& owner);

} // namespace blobstore::crypto

#endif // BLOBSTORE_CRYPTO_OWNER_ENCRYPTION_HPP

#include "crypto/owner_encryption.hpp"
#include "crypto/cipher.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace blobstore::crypto {

namespace {

// Domain separation labels for keys derived from the owner secret
constexpr char ENCRYPTION_LABEL[] = "blobstore:owner:encryption";
constexpr char MAC_LABEL[] = "blobstore:owner:mac";

std::array<uint8_t, 32> hmac_sha256(const uint8_t* key, size_t key_size,
                                    const uint8_t* data, size_t size) {
  std::array<uint8_t, 32> out;
  unsigned int out_len = 0;
  if (!HMAC(EVP_sha256(), key, static_cast<int>(key_size), data, size, out.data(), &out_len) ||
      out_len != out.size()) {
    throw CryptoError("Owner encryption: HMAC computation failed");
  }
  return out;
}

} // namespace

//==============================================
// OWNER KEY
//==============================================

OwnerKey OwnerKey::generate() {
  std::array<uint8_t, KEY_SIZE> secret;
  if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
    throw CryptoError("Owner key: Failed to generate random key");
  }
  BOOST_LOG_TRIVIAL(debug) << "Owner key: Generated new owner key";
  return OwnerKey(secret);
}

OwnerKey OwnerKey::from_hex(const std::string& hex) {
  types::Bytes bytes = types::bytes_from_hex(hex);
  if (bytes.size() != KEY_SIZE) {
    throw std::invalid_argument("Owner key: Expected " + std::to_string(KEY_SIZE) + " bytes, got " +
                                std::to_string(bytes.size()));
  }
  std::array<uint8_t, KEY_SIZE> secret;
  std::copy(bytes.begin(), bytes.end(), secret.begin());
  return OwnerKey(secret);
}

std::string OwnerKey::to_hex() const {
  return types::to_hex(secret_.data(), secret_.size());
}

//==============================================
// OWNER ENCRYPTION
//==============================================

OwnerEncryption::OwnerEncryption(const OwnerKey& owner) {
  const auto& secret = owner.secret();
  encryption_key_ = hmac_sha256(secret.data(), secret.size(),
                                reinterpret_cast<const uint8_t*>(ENCRYPTION_LABEL), std::strlen(ENCRYPTION_LABEL));
  mac_key_ = hmac_sha256(secret.data(), secret.size(),
                         reinterpret_cast<const uint8_t*>(MAC_LABEL), std::strlen(MAC_LABEL));
}

std::vector<uint8_t> OwnerEncryption::derive_iv(const std::vector<uint8_t>& plaintext) const {
  auto mac = hmac_sha256(mac_key_.data(), mac_key_.size(), plaintext.data(), plaintext.size());
  return std::vector<uint8_t>(mac.begin(), mac.begin() + Cipher::IV_SIZE);
}

std::vector<uint8_t> OwnerEncryption::wrap(const std::vector<uint8_t>& plaintext) const {
  std::vector<uint8_t> iv = derive_iv(plaintext);
  Cipher cipher(encryption_key_.data(), encryption_key_.size(), iv.data(), iv.size());
  std::vector<uint8_t> ciphertext = cipher.encrypt(plaintext);

  std::vector<uint8_t> output;
  output.reserve(iv.size() + ciphertext.size());
  output.insert(output.end(), iv.begin(), iv.end());
  output.insert(output.end(), ciphertext.begin(), ciphertext.end());

  BOOST_LOG_TRIVIAL(trace) << "Owner encryption: Wrapped " << plaintext.size() << " bytes";
  return output;
}

std::vector<uint8_t> OwnerEncryption::unwrap(const std::vector<uint8_t>& ciphertext) const {
  if (ciphertext.size() < Cipher::IV_SIZE + Cipher::BLOCK_SIZE) {
    throw DecryptionError("Owner encryption: Ciphertext too short (" + std::to_string(ciphertext.size()) + " bytes)");
  }

  std::vector<uint8_t> iv(ciphertext.begin(), ciphertext.begin() + Cipher::IV_SIZE);
  std::vector<uint8_t> body(ciphertext.begin() + Cipher::IV_SIZE, ciphertext.end());

  Cipher cipher(encryption_key_.data(), encryption_key_.size(), iv.data(), iv.size());
  std::vector<uint8_t> plaintext = cipher.decrypt(body);

  // The IV doubles as the authentication tag of the plaintext
  std::vector<uint8_t> expected_iv = derive_iv(plaintext);
  if (CRYPTO_memcmp(expected_iv.data(), iv.data(), iv.size()) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Owner encryption: Authentication check failed";
    throw DecryptionError("Owner encryption: Authentication check failed");
  }

  return plaintext;
}

std::unique_ptr<OwnerEncryption> encryption_for(types::Scope scope, const OwnerKey& owner) {
  if (scope == types::Scope::Public) {
    return nullptr;
  }
  return std::make_unique<OwnerEncryption>(owner);
}

} // namespace blobstore::crypto

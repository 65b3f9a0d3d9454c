#ifndef BLOBSTORE_CRYPTO_CIPHER_HPP
#define BLOBSTORE_CRYPTO_CIPHER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <vector>
#include "crypto_error.hpp"

namespace blobstore::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-CBC over in-memory buffers
class Cipher {
public:

  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws InitializationError when key or IV have the wrong size
  Cipher(const uint8_t* key, size_t key_size, const uint8_t* iv, size_t iv_size);
  Cipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);
  ~Cipher();

  Cipher(const Cipher&) = delete;
  Cipher& operator=(const Cipher&) = delete;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext);
  // Throws DecryptionError on bad padding
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext);

  // Returns size of data + padding bytes from encryption
  static size_t padded_size(size_t original_size);

private:
  // ---- PARAMETERS ----
  std::array<uint8_t, KEY_SIZE> key_;
  std::array<uint8_t, IV_SIZE> iv_;
  std::unique_ptr<CipherContext> context_;
  static constexpr size_t BUFFER_SIZE = 8192;


  // ---- BUFFER PROCESSING ----
  // Runs the whole input through the cipher in BUFFER_SIZE blocks
  std::vector<uint8_t> process(const std::vector<uint8_t>& input, bool encrypting);
  // Encrypts or decrypts a single block of data using the configured cipher
  size_t process_block(const uint8_t* inbuf, size_t length, uint8_t* outbuf, bool encrypting);
  // Handles the final block with padding
  size_t process_final_block(uint8_t* outbuf, bool encrypting);
};

} // namespace blobstore::crypto

#endif // BLOBSTORE_CRYPTO_CIPHER_HPP

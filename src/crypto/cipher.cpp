#include "crypto/cipher.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace blobstore::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Cipher::Cipher(const uint8_t* key, size_t key_size, const uint8_t* iv, size_t iv_size) {
  if (key_size != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Invalid key size: " << key_size << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }
  if (iv_size != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Invalid IV size: " << iv_size << " bytes (expected " << IV_SIZE << " bytes)";
    throw InitializationError("Invalid IV size");
  }

  std::copy(key, key + KEY_SIZE, key_.begin());
  std::copy(iv, iv + IV_SIZE, iv_.begin());
  context_ = std::make_unique<CipherContext>();
}

Cipher::Cipher(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv)
  : Cipher(key.data(), key.size(), iv.data(), iv.size()) {}

Cipher::~Cipher() = default;

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::vector<uint8_t> Cipher::encrypt(const std::vector<uint8_t>& plaintext) {
  return process(plaintext, true);
}

std::vector<uint8_t> Cipher::decrypt(const std::vector<uint8_t>& ciphertext) {
  if (ciphertext.empty() || ciphertext.size() % BLOCK_SIZE != 0) {
    throw DecryptionError("Cipher: Ciphertext length " + std::to_string(ciphertext.size()) +
                          " is not a positive multiple of the block size");
  }
  return process(ciphertext, false);
}

size_t Cipher::padded_size(size_t original_size) {
  // PKCS#7 always adds at least one byte of padding
  return (original_size / BLOCK_SIZE + 1) * BLOCK_SIZE;
}

//==============================================
// BUFFER PROCESSING
//==============================================

std::vector<uint8_t> Cipher::process(const std::vector<uint8_t>& input, bool encrypting) {
  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw EncryptionError("Cipher: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw DecryptionError("Cipher: Failed to initialize decryption context");
    }
  }

  std::vector<uint8_t> output(input.size() + BLOCK_SIZE);
  size_t written = 0;
  size_t offset = 0;

  // Feed the input through the cipher in bounded blocks
  while (offset < input.size()) {
    size_t length = std::min(BUFFER_SIZE, input.size() - offset);
    written += process_block(input.data() + offset, length, output.data() + written, encrypting);
    offset += length;
  }

  written += process_final_block(output.data() + written, encrypting);
  output.resize(written);

  BOOST_LOG_TRIVIAL(trace) << "Cipher: " << (encrypting ? "Encrypted " : "Decrypted ")
                           << input.size() << " bytes into " << written << " bytes";
  return output;
}

size_t Cipher::process_block(const uint8_t* inbuf, size_t length, uint8_t* outbuf, bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(length))) {
      throw EncryptionError("Cipher: Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), outbuf, &outlen, inbuf, static_cast<int>(length))) {
      throw DecryptionError("Cipher: Failed to decrypt data block");
    }
  }
  return static_cast<size_t>(outlen);
}

size_t Cipher::process_final_block(uint8_t* outbuf, bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw EncryptionError("Cipher: Failed to finalize encryption");
    }
  } else {
    // Fails on wrong key or tampered data through a padding mismatch
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw DecryptionError("Cipher: Failed to finalize decryption");
    }
  }
  return static_cast<size_t>(outlen);
}

} // namespace blobstore::crypto

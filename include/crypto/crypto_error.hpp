#ifndef BLOBSTORE_CRYPTO_ERROR_HPP
#define BLOBSTORE_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobstore::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Wrong key, tampered ciphertext or a plaintext that fails its integrity check
class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

} // namespace blobstore::crypto

#endif // BLOBSTORE_CRYPTO_ERROR_HPP

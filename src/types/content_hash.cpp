#include "types/content_hash.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace blobstore::types {

namespace {

// Runs a one-shot EVP digest over the input, throwing on any OpenSSL failure
void digest(const EVP_MD* md, const uint8_t* data, size_t size, uint8_t* out, unsigned int expected_len) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("Content hash: Failed to create hash context");
  }

  unsigned int hash_len = 0;
  if (!EVP_DigestInit_ex(ctx, md, nullptr) ||
      !EVP_DigestUpdate(ctx, data, size) ||
      !EVP_DigestFinal_ex(ctx, out, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("Content hash: Failed to compute digest");
  }
  EVP_MD_CTX_free(ctx);

  if (hash_len != expected_len) {
    throw std::runtime_error("Content hash: Unexpected digest length");
  }
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// HASHING
//==============================================

ContentHash hash_content(const uint8_t* data, size_t size) {
  ContentHash hash;
  digest(EVP_sha256(), data, size, hash.data(), static_cast<unsigned int>(hash.size()));
  return hash;
}

ContentHash hash_content(const Bytes& data) {
  return hash_content(data.data(), data.size());
}

std::array<uint8_t, 64> hash_512(const Bytes& data) {
  std::array<uint8_t, 64> hash;
  digest(EVP_sha512(), data.data(), data.size(), hash.data(), static_cast<unsigned int>(hash.size()));
  return hash;
}


//==============================================
// TEXT CONVERSION
//==============================================

std::string to_hex(const uint8_t* data, size_t size) {
  std::stringstream ss;
  for (size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string to_hex(const ContentHash& hash) {
  return to_hex(hash.data(), hash.size());
}

Bytes bytes_from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Content hash: Hex string has odd length");
  }

  Bytes bytes;
  bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hex_value(hex[i]);
    int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("Content hash: Invalid hex character");
    }
    bytes.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return bytes;
}

ContentHash hash_from_hex(const std::string& hex) {
  if (hex.size() != HASH_SIZE * 2) {
    throw std::invalid_argument("Content hash: Expected " + std::to_string(HASH_SIZE * 2) +
                                " hex characters, got " + std::to_string(hex.size()));
  }

  Bytes bytes = bytes_from_hex(hex);
  ContentHash hash;
  std::copy(bytes.begin(), bytes.end(), hash.begin());
  return hash;
}

std::ostream& operator<<(std::ostream& os, const ContentHash& hash) {
  return os << to_hex(hash);
}

} // namespace blobstore::types

#include <gtest/gtest.h>
#include <vector>
#include "crypto/cipher.hpp"
#include "test_utils.hpp"

using namespace blobstore::crypto;

class CipherTest : public ::testing::Test {
protected:
  std::vector<uint8_t> key;
  std::vector<uint8_t> iv;

  void SetUp() override {
    // Initialize with test key and IV
    key.resize(Cipher::KEY_SIZE, 0x42);
    iv.resize(Cipher::IV_SIZE, 0x24);
  }
};

TEST_F(CipherTest, BasicEncryptDecrypt) {
  const std::string text = "Hello, World! This is a test of buffer encryption.";
  std::vector<uint8_t> plaintext(text.begin(), text.end());

  Cipher cipher(key, iv);
  std::vector<uint8_t> ciphertext = cipher.encrypt(plaintext);

  EXPECT_EQ(ciphertext.size(), Cipher::padded_size(plaintext.size()));
  EXPECT_NE(ciphertext, plaintext);
  EXPECT_EQ(cipher.decrypt(ciphertext), plaintext);
}

TEST_F(CipherTest, SpansMultipleBuffers) {
  // Larger than the internal buffer and not block aligned
  auto plaintext = random_bytes(3 * 8192 + 5);

  Cipher cipher(key, iv);
  auto ciphertext = cipher.encrypt(plaintext);
  EXPECT_EQ(ciphertext.size(), Cipher::padded_size(plaintext.size()));
  EXPECT_EQ(cipher.decrypt(ciphertext), plaintext);
}

TEST_F(CipherTest, EmptyInputStillPads) {
  Cipher cipher(key, iv);
  auto ciphertext = cipher.encrypt({});
  EXPECT_EQ(ciphertext.size(), Cipher::BLOCK_SIZE);
  EXPECT_TRUE(cipher.decrypt(ciphertext).empty());
}

TEST_F(CipherTest, SameKeyAndIvAreDeterministic) {
  auto plaintext = random_bytes(1000);
  Cipher first(key, iv);
  Cipher second(key, iv);
  EXPECT_EQ(first.encrypt(plaintext), second.encrypt(plaintext));

  std::vector<uint8_t> other_iv(Cipher::IV_SIZE, 0x25);
  Cipher third(key, other_iv);
  EXPECT_NE(first.encrypt(plaintext), third.encrypt(plaintext));
}

TEST_F(CipherTest, InvalidParameters) {
  std::vector<uint8_t> short_key(16, 0x42);
  std::vector<uint8_t> short_iv(8, 0x24);
  EXPECT_THROW((Cipher{short_key, iv}), InitializationError);
  EXPECT_THROW((Cipher{key, short_iv}), InitializationError);
}

TEST_F(CipherTest, RejectsMalformedCiphertext) {
  Cipher cipher(key, iv);
  EXPECT_THROW(cipher.decrypt({}), DecryptionError);
  EXPECT_THROW(cipher.decrypt(std::vector<uint8_t>(17, 0)), DecryptionError);
}

TEST_F(CipherTest, PaddedSize) {
  EXPECT_EQ(Cipher::padded_size(0), 16u);
  EXPECT_EQ(Cipher::padded_size(15), 16u);
  EXPECT_EQ(Cipher::padded_size(16), 32u);
  EXPECT_EQ(Cipher::padded_size(17), 32u);
}

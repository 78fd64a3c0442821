#include "crypto/cipher.h"
#include "crypto/keys.h"
#include <algorithm>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace clique {
namespace crypto {

namespace {

constexpr size_t AES_256_KEY_SIZE = 32;

Result<std::vector<uint8_t>> derive_key(const std::string &password,
                                        const uint8_t *salt) {
  if (password.empty()) {
    return Result<std::vector<uint8_t>>("Empty password");
  }

  std::vector<uint8_t> key(AES_256_KEY_SIZE);
  if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.length()),
                        salt, CIPHER_SALT_SIZE, CIPHER_PBKDF2_ITERATIONS,
                        EVP_sha256(), static_cast<int>(key.size()),
                        key.data()) != 1) {
    return Result<std::vector<uint8_t>>("Key derivation failed");
  }
  return Result<std::vector<uint8_t>>(std::move(key));
}

} // namespace

Result<std::vector<uint8_t>> encrypt(const std::string &password,
                                     const std::vector<uint8_t> &plaintext) {
  auto salt_iv = random_bytes(CIPHER_SALT_SIZE + CIPHER_IV_SIZE);
  if (salt_iv.is_err()) {
    return salt_iv;
  }
  const auto &prefix = salt_iv.value();

  auto key = derive_key(password, prefix.data());
  if (key.is_err()) {
    return key;
  }

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    return Result<std::vector<uint8_t>>("Failed to create cipher context");
  }

  const uint8_t *iv = prefix.data() + CIPHER_SALT_SIZE;
  if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key.value().data(),
                         iv) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    return Result<std::vector<uint8_t>>("Failed to initialize encryption");
  }

  std::vector<uint8_t> out(prefix.size() + plaintext.size() + CIPHER_TAG_SIZE);
  std::copy(prefix.begin(), prefix.end(), out.begin());
  uint8_t *body = out.data() + prefix.size();

  int len = 0;
  int body_len = 0;
  if (EVP_EncryptUpdate(ctx, body, &len, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    return Result<std::vector<uint8_t>>("Encryption failed");
  }
  body_len = len;

  if (EVP_EncryptFinal_ex(ctx, body + body_len, &len) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    return Result<std::vector<uint8_t>>("Encryption finalization failed");
  }
  body_len += len;

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, CIPHER_TAG_SIZE,
                          body + body_len) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    return Result<std::vector<uint8_t>>("Failed to get authentication tag");
  }

  EVP_CIPHER_CTX_free(ctx);
  out.resize(prefix.size() + body_len + CIPHER_TAG_SIZE);
  return Result<std::vector<uint8_t>>(std::move(out));
}

Result<std::vector<uint8_t>> decrypt(const std::string &password,
                                     const std::vector<uint8_t> &data) {
  const size_t overhead = CIPHER_SALT_SIZE + CIPHER_IV_SIZE + CIPHER_TAG_SIZE;
  if (data.size() < overhead) {
    return Result<std::vector<uint8_t>>("Invalid ciphertext size");
  }

  auto key = derive_key(password, data.data());
  if (key.is_err()) {
    return key;
  }

  const uint8_t *iv = data.data() + CIPHER_SALT_SIZE;
  const uint8_t *encrypted = iv + CIPHER_IV_SIZE;
  const size_t encrypted_size = data.size() - overhead;
  const uint8_t *tag = data.data() + data.size() - CIPHER_TAG_SIZE;

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    return Result<std::vector<uint8_t>>("Failed to create cipher context");
  }

  if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key.value().data(),
                         iv) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    return Result<std::vector<uint8_t>>("Failed to initialize decryption");
  }

  std::vector<uint8_t> plaintext(encrypted_size + CIPHER_TAG_SIZE);
  int len = 0;
  int plaintext_len = 0;
  if (EVP_DecryptUpdate(ctx, plaintext.data(), &len, encrypted,
                        static_cast<int>(encrypted_size)) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    return Result<std::vector<uint8_t>>("Decryption failed");
  }
  plaintext_len = len;

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, CIPHER_TAG_SIZE,
                          const_cast<uint8_t *>(tag)) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    return Result<std::vector<uint8_t>>("Failed to set authentication tag");
  }

  // Verifies the tag
  if (EVP_DecryptFinal_ex(ctx, plaintext.data() + plaintext_len, &len) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return Result<std::vector<uint8_t>>(
        "Decryption verification failed (wrong password or corrupted data)");
  }
  plaintext_len += len;

  EVP_CIPHER_CTX_free(ctx);
  plaintext.resize(plaintext_len);
  return Result<std::vector<uint8_t>>(std::move(plaintext));
}

} // namespace crypto
} // namespace clique

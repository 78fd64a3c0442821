#include "crypto/keys.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace clique {
namespace crypto {

Hash sha256(const std::vector<uint8_t> &data) {
  Hash hash(SHA256_DIGEST_LENGTH);

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return Hash();
  }

  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    return Hash();
  }

  EVP_MD_CTX_free(ctx);
  return hash;
}

Result<std::vector<uint8_t>> random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    return Result<std::vector<uint8_t>>("Failed to generate secure random bytes");
  }
  return Result<std::vector<uint8_t>>(std::move(bytes));
}

Result<PrivateKey> generate_random_private_key() {
  return random_bytes(ED25519_PRIVATE_KEY_SIZE);
}

Result<PublicKey> derive_public_key(const PrivateKey &private_key) {
  if (private_key.size() != ED25519_PRIVATE_KEY_SIZE) {
    return Result<PublicKey>("Invalid private key size");
  }

  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size());
  if (!pkey) {
    return Result<PublicKey>("Failed to load Ed25519 private key");
  }

  PublicKey public_key(ED25519_PUBLIC_KEY_SIZE);
  size_t len = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &len) != 1 ||
      len != ED25519_PUBLIC_KEY_SIZE) {
    EVP_PKEY_free(pkey);
    return Result<PublicKey>("Failed to derive Ed25519 public key");
  }

  EVP_PKEY_free(pkey);
  return Result<PublicKey>(std::move(public_key));
}

Result<KeyPair> generate_keypair() {
  auto private_key = generate_random_private_key();
  if (private_key.is_err()) {
    return Result<KeyPair>(private_key.error());
  }
  auto public_key = derive_public_key(private_key.value());
  if (public_key.is_err()) {
    return Result<KeyPair>(public_key.error());
  }
  KeyPair pair;
  pair.private_key = std::move(private_key).value();
  pair.public_key = std::move(public_key).value();
  return Result<KeyPair>(std::move(pair));
}

Result<Signature> sign(const std::vector<uint8_t> &message,
                       const PrivateKey &private_key) {
  if (private_key.size() != ED25519_PRIVATE_KEY_SIZE) {
    return Result<Signature>("Invalid private key size");
  }

  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size());
  if (!pkey) {
    return Result<Signature>("Failed to load Ed25519 private key");
  }

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    EVP_PKEY_free(pkey);
    return Result<Signature>("Failed to create signing context");
  }

  if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey) != 1) {
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return Result<Signature>("Failed to initialize signing");
  }

  Signature signature(ED25519_SIGNATURE_SIZE);
  size_t sig_len = signature.size();
  if (EVP_DigestSign(ctx, signature.data(), &sig_len, message.data(),
                     message.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return Result<Signature>("Ed25519 signing failed");
  }

  EVP_MD_CTX_free(ctx);
  EVP_PKEY_free(pkey);
  return Result<Signature>(std::move(signature));
}

bool verify(const std::vector<uint8_t> &message, const Signature &signature,
            const PublicKey &public_key) {
  if (signature.size() != ED25519_SIGNATURE_SIZE ||
      public_key.size() != ED25519_PUBLIC_KEY_SIZE) {
    return false;
  }

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return false;
  }

  EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key(
      EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size());
  if (!pkey) {
    EVP_MD_CTX_free(ctx);
    return false;
  }

  if (EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) != 1) {
    EVP_PKEY_free(pkey);
    EVP_MD_CTX_free(ctx);
    return false;
  }

  int result = EVP_DigestVerify(ctx, signature.data(), signature.size(),
                                message.data(), message.size());

  EVP_PKEY_free(pkey);
  EVP_MD_CTX_free(ctx);

  return result == 1;
}

} // namespace crypto
} // namespace clique

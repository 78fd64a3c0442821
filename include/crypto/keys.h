#pragma once

#include "common/types.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace clique {
namespace crypto {

using namespace clique::common;

constexpr size_t ED25519_PRIVATE_KEY_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;
constexpr size_t SHA256_SIZE = 32;

/**
 * Ed25519 key pair
 */
struct KeyPair {
  PrivateKey private_key;
  PublicKey public_key;

  bool operator==(const KeyPair &other) const {
    return private_key == other.private_key && public_key == other.public_key;
  }
};

/**
 * Compute SHA256 hash of data
 */
Hash sha256(const std::vector<uint8_t> &data);

/**
 * Cryptographically secure random bytes (OpenSSL RAND_bytes)
 */
Result<std::vector<uint8_t>> random_bytes(size_t count);

/**
 * Generate a fresh random private key
 */
Result<PrivateKey> generate_random_private_key();

/**
 * Derive the Ed25519 public key for a 32-byte private key
 */
Result<PublicKey> derive_public_key(const PrivateKey &private_key);

/**
 * Generate a fresh key pair
 */
Result<KeyPair> generate_keypair();

/**
 * Sign message with Ed25519
 */
Result<Signature> sign(const std::vector<uint8_t> &message,
                       const PrivateKey &private_key);

/**
 * Verify Ed25519 signature
 * @return true if signature is valid for message under public_key
 */
bool verify(const std::vector<uint8_t> &message, const Signature &signature,
            const PublicKey &public_key);

} // namespace crypto
} // namespace clique

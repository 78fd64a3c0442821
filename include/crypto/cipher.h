#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace clique {
namespace crypto {

using namespace clique::common;

constexpr size_t CIPHER_SALT_SIZE = 16;
constexpr size_t CIPHER_IV_SIZE = 12; // GCM standard IV size
constexpr size_t CIPHER_TAG_SIZE = 16;
constexpr uint32_t CIPHER_PBKDF2_ITERATIONS = 10000;

/**
 * Password-based authenticated encryption for key material on disk
 *
 * The key is derived with PBKDF2-HMAC-SHA256 over a random salt, then the
 * payload is sealed with AES-256-GCM. Layout of the output:
 *
 *   salt (16) | iv (12) | ciphertext | tag (16)
 */
Result<std::vector<uint8_t>> encrypt(const std::string &password,
                                     const std::vector<uint8_t> &plaintext);

/**
 * Reverse of encrypt(). Fails on a wrong password or tampered data.
 */
Result<std::vector<uint8_t>> decrypt(const std::string &password,
                                     const std::vector<uint8_t> &data);

} // namespace crypto
} // namespace clique

#pragma once

#include "common/types.h"
#include "models/ids.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace clique {
namespace consensus {

using namespace clique::common;

/// Staking address -> (public key, private key)
using StakingKeys = std::map<models::Address, std::pair<PublicKey, PrivateKey>>;

/// Password protecting staking key files in tests
constexpr const char *TEST_PASSWORD = "PASSWORD";

/**
 * @brief Load staking keys from an encrypted key file
 *
 * The file holds a JSON array of hex-encoded Ed25519 private keys, encrypted
 * with crypto::encrypt. A missing file is not an error and yields no keys.
 *
 * @return keys indexed by address, or an error if the file cannot be
 *         decrypted or parsed
 */
Result<StakingKeys> load_initial_staking_keys(const std::string &path,
                                              const std::string &password);

/**
 * @brief Encrypt and write staking keys, replacing any existing file
 */
Result<bool> save_staking_keys(const std::string &path,
                               const std::string &password,
                               const std::vector<PrivateKey> &keys);

/// Derive the address and public key of each private key
Result<StakingKeys> staking_keys_from_private(const std::vector<PrivateKey> &keys);

} // namespace consensus
} // namespace clique

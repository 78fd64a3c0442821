#include "consensus/staking_keys.h"
#include "common/logging.h"
#include "crypto/cipher.h"
#include "crypto/keys.h"
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

namespace clique {
namespace consensus {

Result<StakingKeys>
staking_keys_from_private(const std::vector<PrivateKey> &keys) {
  StakingKeys staking_keys;
  for (const auto &private_key : keys) {
    auto public_key = crypto::derive_public_key(private_key);
    if (public_key.is_err()) {
      return Result<StakingKeys>("Invalid staking key: " + public_key.error());
    }
    auto address = models::Address::from_public_key(public_key.value());
    staking_keys[address] =
        std::make_pair(std::move(public_key).value(), private_key);
  }
  return Result<StakingKeys>(std::move(staking_keys));
}

Result<StakingKeys> load_initial_staking_keys(const std::string &path,
                                              const std::string &password) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    LOG_DEBUG("staking", "No staking key file at ", path);
    return Result<StakingKeys>(StakingKeys{});
  }

  std::vector<uint8_t> encrypted((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());

  auto plaintext = crypto::decrypt(password, encrypted);
  if (plaintext.is_err()) {
    return Result<StakingKeys>("Cannot decrypt staking keys in " + path +
                               ": " + plaintext.error());
  }

  std::vector<PrivateKey> keys;
  try {
    auto json = nlohmann::json::parse(plaintext.value());
    if (!json.is_array()) {
      return Result<StakingKeys>("Staking key file " + path +
                                 " is not a JSON array");
    }
    for (const auto &entry : json) {
      auto key = from_hex(entry.get<std::string>());
      if (key.is_err()) {
        return Result<StakingKeys>("Malformed staking key: " + key.error());
      }
      keys.push_back(std::move(key).value());
    }
  } catch (const nlohmann::json::exception &e) {
    return Result<StakingKeys>("Cannot parse staking keys in " + path + ": " +
                               e.what());
  }

  auto staking_keys = staking_keys_from_private(keys);
  if (staking_keys.is_ok()) {
    LOG_INFO("staking", "Loaded ", staking_keys.value().size(),
             " staking keys from ", path);
  }
  return staking_keys;
}

Result<bool> save_staking_keys(const std::string &path,
                               const std::string &password,
                               const std::vector<PrivateKey> &keys) {
  nlohmann::json json = nlohmann::json::array();
  for (const auto &key : keys) {
    json.push_back(to_hex(key));
  }
  std::string text = json.dump();

  auto encrypted = crypto::encrypt(
      password, std::vector<uint8_t>(text.begin(), text.end()));
  if (encrypted.is_err()) {
    return Result<bool>("Cannot encrypt staking keys: " + encrypted.error());
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return Result<bool>("Cannot open staking key file " + path);
  }
  const auto &bytes = encrypted.value();
  file.write(reinterpret_cast<const char *>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  if (!file.good()) {
    return Result<bool>("Cannot write staking key file " + path);
  }
  return Result<bool>(true);
}

} // namespace consensus
} // namespace clique

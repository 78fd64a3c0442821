#include "consensus/config.h"
#include "common/logging.h"
#include "crypto/keys.h"
#include "models/slot.h"
#include <fstream>

namespace clique {
namespace consensus {

ConsensusConfig ConsensusConfigLoader::create_default() {
  ConsensusConfig config;
  config.genesis_timestamp_ms = models::now_millis();

  auto key = crypto::generate_random_private_key();
  if (key.is_ok()) {
    config.genesis_key = std::move(key).value();
  } else {
    LOG_ERROR("config", "Could not generate genesis key: ", key.error());
  }
  return config;
}

std::string ConsensusConfigLoader::validate_config(const ConsensusConfig &config) {
  if (config.thread_count == 0 ||
      (config.thread_count & (config.thread_count - 1)) != 0) {
    return "Thread count must be a non-zero power of two";
  }

  if (config.t0_ms < config.thread_count) {
    return "t0 must be at least one millisecond per thread";
  }

  if (config.genesis_key.size() != crypto::ED25519_PRIVATE_KEY_SIZE) {
    return "Genesis key must be a 32-byte Ed25519 private key";
  }

  if (config.channel_size == 0) {
    return "Channel size must be greater than zero";
  }

  if (config.worker_poll_interval_ms == 0) {
    return "Worker poll interval must be greater than zero";
  }

  if (config.max_future_processing_blocks == 0 ||
      config.max_dependency_blocks == 0) {
    return "Block processing limits must be greater than zero";
  }

  return ""; // Valid
}

std::optional<ConsensusConfig>
ConsensusConfigLoader::load_from_file(const std::string &config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    LOG_ERROR("config", "Failed to open config file: ", config_path);
    return std::nullopt;
  }

  try {
    nlohmann::json json;
    file >> json;
    return load_from_json(json);
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("config", "Failed to parse config file ", config_path, ": ",
              e.what());
    return std::nullopt;
  }
}

bool ConsensusConfigLoader::save_to_file(const ConsensusConfig &config,
                                         const std::string &config_path) {
  std::ofstream file(config_path);
  if (!file.is_open()) {
    LOG_ERROR("config", "Failed to open config file for writing: ",
              config_path);
    return false;
  }
  file << to_json(config).dump(2);
  return file.good();
}

std::optional<ConsensusConfig>
ConsensusConfigLoader::load_from_json(const nlohmann::json &json) {
  ConsensusConfig config;

  try {
    config.thread_count = json.value("thread_count", config.thread_count);
    config.t0_ms = json.value("t0_ms", config.t0_ms);
    config.genesis_timestamp_ms =
        json.value("genesis_timestamp_ms", config.genesis_timestamp_ms);
    config.staking_keys_path =
        json.value("staking_keys_path", config.staking_keys_path);
    config.future_block_processing_max_periods =
        json.value("future_block_processing_max_periods",
                   config.future_block_processing_max_periods);
    config.max_future_processing_blocks = json.value(
        "max_future_processing_blocks", config.max_future_processing_blocks);
    config.max_dependency_blocks =
        json.value("max_dependency_blocks", config.max_dependency_blocks);
    config.max_discarded_blocks =
        json.value("max_discarded_blocks", config.max_discarded_blocks);
    config.channel_size = json.value("channel_size", config.channel_size);
    config.worker_poll_interval_ms =
        json.value("worker_poll_interval_ms", config.worker_poll_interval_ms);

    if (json.contains("genesis_key")) {
      auto key = from_hex(json.at("genesis_key").get<std::string>());
      if (key.is_err()) {
        LOG_ERROR("config", "Invalid genesis_key: ", key.error());
        return std::nullopt;
      }
      config.genesis_key = std::move(key).value();
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("config", "Invalid consensus configuration: ", e.what());
    return std::nullopt;
  }

  return config;
}

nlohmann::json ConsensusConfigLoader::to_json(const ConsensusConfig &config) {
  nlohmann::json json;
  json["thread_count"] = config.thread_count;
  json["t0_ms"] = config.t0_ms;
  json["genesis_timestamp_ms"] = config.genesis_timestamp_ms;
  json["genesis_key"] = to_hex(config.genesis_key);
  json["staking_keys_path"] = config.staking_keys_path;
  json["future_block_processing_max_periods"] =
      config.future_block_processing_max_periods;
  json["max_future_processing_blocks"] = config.max_future_processing_blocks;
  json["max_dependency_blocks"] = config.max_dependency_blocks;
  json["max_discarded_blocks"] = config.max_discarded_blocks;
  json["channel_size"] = config.channel_size;
  json["worker_poll_interval_ms"] = config.worker_poll_interval_ms;
  return json;
}

} // namespace consensus
} // namespace clique

#pragma once

#include "common/types.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace clique {
namespace consensus {

using namespace clique::common;

/**
 * @brief Consensus worker configuration
 *
 * @note Default values suit tests: two threads, one-second periods and
 *       small queues so that backpressure shows up quickly.
 */
struct ConsensusConfig {
  // Timeline
  uint8_t thread_count = 2;             ///< Number of block threads (power of two)
  uint64_t t0_ms = 1000;                ///< Period duration in milliseconds
  uint64_t genesis_timestamp_ms = 0;    ///< Start of period 0 (ms since epoch)
  PrivateKey genesis_key;               ///< Signs the genesis blocks

  // Credentials
  std::string staking_keys_path;        ///< Encrypted staking key file (optional)

  // Block processing limits
  uint64_t future_block_processing_max_periods = 100; ///< Farther blocks are discarded
  size_t max_future_processing_blocks = 100;  ///< Blocks held until their slot
  size_t max_dependency_blocks = 2048;        ///< Blocks held for missing parents
  size_t max_discarded_blocks = 100;          ///< Remembered discarded ids

  // Channels and scheduling
  size_t channel_size = 256;            ///< Capacity of every engine channel
  uint32_t worker_poll_interval_ms = 20; ///< Max sleep between command checks
};

/**
 * @brief Configuration loader and validator
 */
class ConsensusConfigLoader {
public:
  /**
   * @brief Defaults with a fresh random genesis key and genesis at now
   */
  static ConsensusConfig create_default();

  /**
   * @return validation error message, or empty string if valid
   */
  static std::string validate_config(const ConsensusConfig &config);

  static std::optional<ConsensusConfig>
  load_from_file(const std::string &config_path);
  static bool save_to_file(const ConsensusConfig &config,
                           const std::string &config_path);

  /// Missing fields keep their defaults
  static std::optional<ConsensusConfig>
  load_from_json(const nlohmann::json &json);
  static nlohmann::json to_json(const ConsensusConfig &config);
};

} // namespace consensus
} // namespace clique

#pragma once

#include "common/cancellation.h"
#include "common/channel.h"
#include "common/types.h"
#include "consensus/commands.h"
#include "consensus/config.h"
#include "consensus/staking_keys.h"
#include "consensus/worker.h"
#include "models/graph.h"
#include "storage/block_storage.h"
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace clique {
namespace consensus {

/**
 * @brief Request/response handle onto a running consensus worker
 *
 * Copyable. Each call blocks until the worker answers, and fails if the
 * worker stops before it does.
 */
class ConsensusCommandSender {
public:
  ConsensusCommandSender() = default;
  explicit ConsensusCommandSender(common::Sender<ConsensusCommand> sender);

  Result<models::BlockGraphExport> get_block_graph_status();
  Result<std::optional<WrappedBlock>> get_active_block(const BlockId &block_id);
  Result<std::set<Address>> get_staking_addresses();
  Result<std::map<Address, uint64_t>> get_active_stakers();
  Result<bool> register_staking_keys(std::vector<PrivateKey> keys);
  Result<bool> remove_staking_addresses(std::set<Address> addresses);

private:
  template <typename T>
  Result<T> request(ConsensusCommand command, std::future<T> reply);

  common::Sender<ConsensusCommand> sender_;
};

/**
 * @brief Owner of the consensus worker thread
 *
 * Destroying a manager that was not stopped cancels and joins the worker.
 */
class ConsensusManager {
public:
  ConsensusManager() = default;
  ConsensusManager(common::CancellationTokenPtr stop_token,
                   std::thread worker_thread,
                   std::shared_future<Result<bool>> worker_result,
                   uint32_t poll_interval_ms);
  ~ConsensusManager();

  ConsensusManager(ConsensusManager &&) noexcept = default;
  ConsensusManager &operator=(ConsensusManager &&) = delete;
  ConsensusManager(const ConsensusManager &) = delete;
  ConsensusManager &operator=(const ConsensusManager &) = delete;

  /**
   * @brief Stop the worker
   *
   * Consensus events are drained while the worker winds down so it can
   * never block on its event channel. Protocol and pool channels are NOT
   * drained here; their owners must keep consuming until the returned
   * future is ready. Calling stop() again returns the same outcome.
   *
   * @return future resolving to true once the worker exited cleanly; it
   *         holds an exception if the worker failed or crashed
   */
  std::future<bool> stop(ConsensusEventReceiver event_receiver);

  /// True while the worker thread has not finished
  bool is_running() const;

private:
  struct State {
    common::CancellationTokenPtr stop_token;
    std::thread worker_thread;
    std::shared_future<Result<bool>> worker_result;
    uint32_t poll_interval_ms = 20;
    std::mutex join_mutex;

    void join();
  };

  std::shared_ptr<State> state_;
};

using ConsensusHandles =
    std::tuple<ConsensusCommandSender, ConsensusEventReceiver, ConsensusManager>;

/**
 * @brief Start a consensus worker on its own thread
 *
 * @param config Validated with ConsensusConfigLoader::validate_config
 * @param channels Collaborator endpoints; all must be connected
 * @param boot_pos Initial roll counts, if bootstrapping
 * @param boot_graph Initial graph; genesis blocks are created when empty
 * @param storage Shared block store; bootstrap blocks missing from it are
 *        added
 * @param clock_compensation_ms Added to the local clock
 * @param password Protects the staking key file on updates
 * @param staking_keys Keys the node stakes with
 */
Result<ConsensusHandles> start_consensus_controller(
    ConsensusConfig config, ConsensusChannels channels,
    std::optional<models::ExportProofOfStake> boot_pos,
    std::optional<models::BootstrapableGraph> boot_graph,
    storage::Storage storage, int64_t clock_compensation_ms,
    std::string password, StakingKeys staking_keys);

} // namespace consensus
} // namespace clique

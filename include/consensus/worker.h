#pragma once

#include "common/cancellation.h"
#include "common/channel.h"
#include "common/types.h"
#include "consensus/commands.h"
#include "consensus/config.h"
#include "consensus/execution.h"
#include "consensus/staking_keys.h"
#include "models/block.h"
#include "models/graph.h"
#include "storage/block_storage.h"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace clique {
namespace consensus {

/**
 * @brief Channels and collaborators the consensus engine talks to
 */
struct ConsensusChannels {
  std::shared_ptr<ExecutionController> execution_controller;
  ProtocolCommandSender protocol_command_sender;
  ProtocolEventReceiver protocol_event_receiver;
  PoolCommandSender pool_command_sender;
};

/**
 * @brief Block graph state machine driven by one thread
 *
 * Keeps the set of active blocks and the best parent of each thread.
 * Incoming blocks are verified, held until their slot and their parents are
 * known, then integrated. Every outcome is reported to the protocol; slot
 * ticks go to the pool; graph changes go to execution.
 *
 * Not thread-safe: everything except construction runs on the worker
 * thread. Outbound sends block while the receiving channel is full, so
 * whoever owns the other ends must keep draining them until run() returns.
 */
class ConsensusWorker {
public:
  ConsensusWorker(ConsensusConfig config, ConsensusChannels channels,
                  common::Receiver<ConsensusCommand> command_receiver,
                  common::Sender<ConsensusEvent> event_sender,
                  std::optional<models::ExportProofOfStake> boot_pos,
                  std::optional<models::BootstrapableGraph> boot_graph,
                  storage::Storage storage, int64_t clock_compensation_ms,
                  std::string password, StakingKeys staking_keys,
                  common::CancellationTokenPtr stop_token);

  /**
   * @brief Build the initial graph from genesis or from bootstrap state
   *
   * Must succeed before run() is called.
   */
  Result<bool> initialize();

  /**
   * @brief Process slots, protocol events and commands until stopped
   * @return error if a collaborator went away while the worker was running
   */
  Result<bool> run();

private:
  struct ActiveBlock {
    Slot slot;
    std::vector<BlockId> parents;
    std::set<OperationId> operation_ids;
    std::vector<EndorsementId> endorsement_ids;
    bool is_final = false;
  };

  struct DependencyWait {
    WrappedBlock block;
    std::set<BlockId> missing;
  };

  // Initialization
  Result<bool> create_genesis();
  Result<bool> load_bootstrap_graph(const models::BootstrapableGraph &graph);

  // Event handling
  void handle_protocol_event(ProtocolEvent event);
  void handle_command(ConsensusCommand cmd);
  void on_block_received(WrappedBlock block);
  void on_header_received(const WrappedHeader &header);
  void on_get_blocks(const std::vector<BlockId> &block_ids);
  void on_slot_tick(const Slot &slot);

  // Graph
  void process_block(WrappedBlock block);
  void wait_for_dependencies(WrappedBlock block, std::set<BlockId> missing);
  void integrate(const WrappedBlock &block);
  void discard_block(const BlockId &block_id, const std::string &reason);
  void remove_from_wishlist(const BlockId &block_id);
  std::string check_header_structure(const models::BlockHeader &header) const;
  std::string check_parent_topology(const models::BlockHeader &header) const;
  bool is_known(const BlockId &block_id) const;
  models::BlockGraphExport export_graph() const;

  // Staking
  Result<bool> register_staking_keys(const std::vector<PrivateKey> &keys);
  Result<bool> remove_staking_addresses(const std::set<Address> &addresses);
  Result<bool> persist_staking_keys();

  // Outbound
  bool emit_protocol(ProtocolCommand command);
  bool emit_pool(PoolCommand command);
  void notify_blockclique();
  void request_sync();
  void fail(const std::string &reason);

  uint64_t current_time_ms() const;
  uint64_t slot_timestamp(const Slot &slot) const;

  ConsensusConfig config_;
  ConsensusChannels channels_;
  common::Receiver<ConsensusCommand> command_receiver_;
  common::Sender<ConsensusEvent> event_sender_;
  std::optional<models::ExportProofOfStake> boot_pos_;
  std::optional<models::BootstrapableGraph> boot_graph_;
  storage::Storage storage_;
  int64_t clock_compensation_ms_;
  std::string password_;
  StakingKeys staking_keys_;
  common::CancellationTokenPtr stop_token_;

  std::map<BlockId, ActiveBlock> active_blocks_;
  std::vector<BlockId> best_parents_;
  std::vector<uint64_t> latest_final_periods_;
  std::map<BlockId, WrappedBlock> waiting_for_slot_;
  std::map<BlockId, DependencyWait> waiting_for_dependencies_;
  std::deque<BlockId> dependency_order_;
  std::set<BlockId> wishlist_;
  std::set<BlockId> discarded_;
  std::deque<BlockId> discarded_order_;
  std::map<Address, uint64_t> roll_counts_;

  std::optional<Slot> current_slot_;
  Slot next_slot_;
  bool out_of_sync_ = false;
  bool failed_ = false;
  std::string failure_;
};

} // namespace consensus
} // namespace clique

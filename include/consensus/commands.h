#pragma once

#include "common/channel.h"
#include "common/types.h"
#include "models/block.h"
#include "models/graph.h"
#include "models/ids.h"
#include "models/slot.h"
#include <cstdint>
#include <future>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <variant>
#include <vector>

namespace clique {
namespace consensus {

using common::PrivateKey;
using models::Address;
using models::BlockId;
using models::EndorsementId;
using models::OperationId;
using models::Slot;
using models::WrappedBlock;
using models::WrappedHeader;

// Protocol (network side)

namespace protocol {

/// A block passed validation and joined the graph
struct IntegratedBlock {
  BlockId block_id;
  std::set<OperationId> operation_ids;
  std::vector<EndorsementId> endorsement_ids;
};

/// Blocks the engine starts and stops wanting from the network
struct WishlistDelta {
  std::set<BlockId> new_blocks;
  std::set<BlockId> remove_blocks;
};

/// A peer sent a block or header that failed verification
struct AttackBlockDetected {
  BlockId block_id;
};

/// Answer to a GetBlocks event; empty entries are unknown blocks
struct GetBlocksResults {
  std::map<BlockId, std::optional<WrappedBlock>> results;
};

struct ReceivedBlock {
  WrappedBlock block;
};

struct ReceivedBlockHeader {
  WrappedHeader header;
};

struct GetBlocks {
  std::vector<BlockId> block_ids;
};

} // namespace protocol

/// Engine to protocol
using ProtocolCommand =
    std::variant<protocol::IntegratedBlock, protocol::WishlistDelta,
                 protocol::AttackBlockDetected, protocol::GetBlocksResults>;

/// Protocol to engine
using ProtocolEvent =
    std::variant<protocol::ReceivedBlock, protocol::ReceivedBlockHeader,
                 protocol::GetBlocks>;

// Pool

namespace pool {

struct UpdateCurrentSlot {
  Slot slot;
};

/// Latest final period of each thread
struct UpdateLatestFinalPeriods {
  std::vector<uint64_t> periods;
};

} // namespace pool

using PoolCommand =
    std::variant<pool::UpdateCurrentSlot, pool::UpdateLatestFinalPeriods>;

// Execution

namespace execution {

struct UpdateBlockclique {
  std::map<Slot, BlockId> finalized_blocks;
  std::map<Slot, BlockId> blockclique;
};

} // namespace execution

using ExecutionCommand = std::variant<execution::UpdateBlockclique>;

// Consensus API (callers to engine)

namespace command {

struct GetBlockGraphStatus {
  std::promise<models::BlockGraphExport> reply;
};

struct GetActiveBlock {
  BlockId block_id;
  std::promise<std::optional<WrappedBlock>> reply;
};

struct GetStakingAddresses {
  std::promise<std::set<Address>> reply;
};

/// Roll count of every known staker
struct GetActiveStakers {
  std::promise<std::map<Address, uint64_t>> reply;
};

/// Add staking keys and persist them to the staking key file. The reply
/// carries an exception if the keys are invalid or cannot be saved.
struct RegisterStakingKeys {
  std::vector<PrivateKey> keys;
  std::promise<bool> reply;
};

struct RemoveStakingAddresses {
  std::set<Address> addresses;
  std::promise<bool> reply;
};

} // namespace command

using ConsensusCommand =
    std::variant<command::GetBlockGraphStatus, command::GetActiveBlock,
                 command::GetStakingAddresses, command::GetActiveStakers,
                 command::RegisterStakingKeys, command::RemoveStakingAddresses>;

namespace event {

/// Engine saw blocks too far ahead of its clock and needs a resync
struct NeedSync {};

} // namespace event

using ConsensusEvent = std::variant<event::NeedSync>;

// Channel endpoints handed to the engine

using ProtocolCommandSender = common::Sender<ProtocolCommand>;
using ProtocolCommandReceiver = common::Receiver<ProtocolCommand>;
using ProtocolEventSender = common::Sender<ProtocolEvent>;
using ProtocolEventReceiver = common::Receiver<ProtocolEvent>;
using PoolCommandSender = common::Sender<PoolCommand>;
using PoolCommandReceiver = common::Receiver<PoolCommand>;
using ExecutionCommandSender = common::Sender<ExecutionCommand>;
using ExecutionCommandReceiver = common::Receiver<ExecutionCommand>;
using ConsensusEventReceiver = common::Receiver<ConsensusEvent>;

/// Name of a command or event alternative, for logs and test failures
const char *command_name(const ProtocolCommand &cmd);
const char *command_name(const ProtocolEvent &evt);
const char *command_name(const PoolCommand &cmd);
const char *command_name(const ExecutionCommand &cmd);

} // namespace consensus
} // namespace clique

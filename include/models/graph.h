#pragma once

#include "models/block.h"
#include "models/ids.h"
#include "models/slot.h"
#include <cstdint>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace clique {
namespace models {

/**
 * @brief Active block as exported for bootstrap
 *
 * `parents` pairs each parent id with that parent's period.
 */
struct ExportActiveBlock {
  WrappedBlock block;
  BlockId block_id;
  std::vector<std::pair<BlockId, uint64_t>> parents;
  bool is_final = false;
};

/**
 * @brief Block graph state a node can be bootstrapped from
 *
 * When `best_parents` is empty the receiving engine derives it from the
 * highest-slot active block of each thread.
 */
struct BootstrapableGraph {
  std::map<BlockId, ExportActiveBlock> active_blocks;
  std::vector<std::pair<BlockId, uint64_t>> best_parents;
  std::vector<std::pair<BlockId, uint64_t>> latest_final_blocks_periods;
};

/**
 * @brief Proof-of-stake state a node can be bootstrapped from
 *
 * Only initial roll counts; draws and cycles are not modelled.
 */
struct ExportProofOfStake {
  std::map<Address, uint64_t> roll_counts;
};

/**
 * @brief Snapshot of the engine's block graph
 */
struct BlockGraphExport {
  std::vector<BlockId> best_parents;
  std::map<BlockId, Slot> active_blocks;
  std::set<BlockId> waiting_for_dependencies;
  std::set<BlockId> waiting_for_slot;
  std::set<BlockId> discarded_blocks;
  std::set<BlockId> wishlist;
};

} // namespace models
} // namespace clique

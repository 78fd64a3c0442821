#pragma once

#include "common/types.h"
#include "models/block.h"
#include "models/ids.h"
#include <memory>
#include <optional>
#include <vector>

namespace clique {
namespace storage {

using models::BlockId;
using models::OperationId;
using models::WrappedBlock;
using models::WrappedOperation;

/**
 * @brief Shared in-memory block store
 *
 * Copies of a Storage are handles onto the same underlying store, so the
 * harness, the mocks and the consensus worker all see the same blocks. All
 * methods are thread-safe.
 */
class Storage {
public:
  Storage();

  /**
   * @brief Store a block and index its operations
   * @return true if the block was new, false if it was already stored
   */
  common::Result<bool> store_block(const WrappedBlock &block);

  std::optional<WrappedBlock> retrieve_block(const BlockId &block_id) const;
  std::optional<WrappedOperation>
  retrieve_operation(const OperationId &operation_id) const;

  bool contains_block(const BlockId &block_id) const;

  /// Drop blocks (and the operations only they referenced)
  void remove_blocks(const std::vector<BlockId> &block_ids);

  size_t block_count() const;
  std::vector<BlockId> block_ids() const;

private:
  class Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace storage
} // namespace clique

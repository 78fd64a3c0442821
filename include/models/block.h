#pragma once

#include "models/endorsement.h"
#include "models/ids.h"
#include "models/operation.h"
#include "models/slot.h"
#include "models/wrapped.h"
#include <vector>

namespace clique {
namespace models {

/**
 * @brief Block header
 *
 * `parents` holds exactly one parent per thread, parents[i] living in thread
 * i. The header's identifier is the block's identifier.
 */
struct BlockHeader {
  Slot slot;
  std::vector<BlockId> parents;
  Hash operation_merkle_root;
  std::vector<WrappedEndorsement> endorsements;

  void serialize(std::vector<uint8_t> &buf) const;
};

using WrappedHeader = Wrapped<BlockHeader, BlockId>;

/**
 * @brief Full block: signed header plus operations
 */
struct Block {
  WrappedHeader header;
  std::vector<WrappedOperation> operations;

  void serialize(std::vector<uint8_t> &buf) const;
};

template <>
struct IdDerivation<Block, BlockId> {
  static BlockId derive(const Block &content, const Hash & /*content_hash*/) {
    return content.header.id;
  }
};

using WrappedBlock = Wrapped<Block, BlockId>;

/**
 * @brief Full verification of a block as received from the network
 *
 * Checks the block envelope, the header envelope, every endorsement and
 * every operation, and that block and header share one creator.
 */
bool verify_block(const WrappedBlock &block);

/// Merkle root convention: SHA-256 over the concatenated operation ids
Hash compute_operation_merkle_root(const std::vector<WrappedOperation> &ops);

} // namespace models
} // namespace clique

#pragma once

#include "models/ids.h"
#include "models/slot.h"
#include "models/wrapped.h"
#include <cstdint>
#include <vector>

namespace clique {
namespace models {

/**
 * Endorsement of a block by a staker, included in later block headers
 */
struct Endorsement {
  Slot slot;
  uint32_t index = 0;
  BlockId endorsed_block;

  void serialize(std::vector<uint8_t> &buf) const;
};

using WrappedEndorsement = Wrapped<Endorsement, EndorsementId>;

} // namespace models
} // namespace clique

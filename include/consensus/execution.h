#pragma once

#include "models/ids.h"
#include "models/slot.h"
#include <map>

namespace clique {
namespace consensus {

/**
 * @brief Execution module as seen by the consensus worker
 *
 * The worker reports every change of the final and candidate block sets.
 * Implementations must not block for long: the call happens on the worker
 * thread.
 */
class ExecutionController {
public:
  virtual ~ExecutionController() = default;

  virtual void update_blockclique_status(
      std::map<models::Slot, models::BlockId> finalized_blocks,
      std::map<models::Slot, models::BlockId> blockclique) = 0;
};

} // namespace consensus
} // namespace clique

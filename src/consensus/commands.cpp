#include "consensus/commands.h"

namespace clique {
namespace consensus {

namespace {

const char *const PROTOCOL_COMMAND_NAMES[] = {
    "IntegratedBlock", "WishlistDelta", "AttackBlockDetected",
    "GetBlocksResults"};

const char *const PROTOCOL_EVENT_NAMES[] = {"ReceivedBlock",
                                            "ReceivedBlockHeader", "GetBlocks"};

const char *const POOL_COMMAND_NAMES[] = {"UpdateCurrentSlot",
                                          "UpdateLatestFinalPeriods"};

const char *const EXECUTION_COMMAND_NAMES[] = {"UpdateBlockclique"};

} // namespace

const char *command_name(const ProtocolCommand &cmd) {
  return PROTOCOL_COMMAND_NAMES[cmd.index()];
}

const char *command_name(const ProtocolEvent &evt) {
  return PROTOCOL_EVENT_NAMES[evt.index()];
}

const char *command_name(const PoolCommand &cmd) {
  return POOL_COMMAND_NAMES[cmd.index()];
}

const char *command_name(const ExecutionCommand &cmd) {
  return EXECUTION_COMMAND_NAMES[cmd.index()];
}

} // namespace consensus
} // namespace clique

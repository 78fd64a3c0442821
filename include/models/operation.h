#pragma once

#include "models/ids.h"
#include "models/wrapped.h"
#include <cstdint>
#include <variant>
#include <vector>

namespace clique {
namespace models {

struct TransactionOp {
  Address recipient_address;
  Amount amount = 0;
};

struct RollBuyOp {
  uint64_t roll_count = 0;
};

struct RollSellOp {
  uint64_t roll_count = 0;
};

struct ExecuteScOp {
  std::vector<uint8_t> data;
  uint64_t max_gas = 0;
  Amount coins = 0;
  Amount gas_price = 0;
};

using OperationType =
    std::variant<TransactionOp, RollBuyOp, RollSellOp, ExecuteScOp>;

/**
 * Operation payload carried by blocks
 */
struct Operation {
  Amount fee = 0;
  uint64_t expire_period = 0;
  OperationType op;

  void serialize(std::vector<uint8_t> &buf) const;
};

using WrappedOperation = Wrapped<Operation, OperationId>;

} // namespace models
} // namespace clique

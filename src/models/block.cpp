#include "models/block.h"
#include "crypto/keys.h"
#include "models/serializer.h"
#include <type_traits>

namespace clique {
namespace models {

namespace {

// Variant tags are part of the signed encoding: never reorder
constexpr uint8_t OP_TRANSACTION = 0;
constexpr uint8_t OP_ROLL_BUY = 1;
constexpr uint8_t OP_ROLL_SELL = 2;
constexpr uint8_t OP_EXECUTE_SC = 3;

} // namespace

void Operation::serialize(std::vector<uint8_t> &buf) const {
  Serializer::write_u64(buf, fee);
  Serializer::write_u64(buf, expire_period);
  std::visit(
      [&buf](const auto &op) {
        using OpT = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<OpT, TransactionOp>) {
          Serializer::write_u8(buf, OP_TRANSACTION);
          Serializer::write_bytes(buf, op.recipient_address.hash());
          Serializer::write_u64(buf, op.amount);
        } else if constexpr (std::is_same_v<OpT, RollBuyOp>) {
          Serializer::write_u8(buf, OP_ROLL_BUY);
          Serializer::write_u64(buf, op.roll_count);
        } else if constexpr (std::is_same_v<OpT, RollSellOp>) {
          Serializer::write_u8(buf, OP_ROLL_SELL);
          Serializer::write_u64(buf, op.roll_count);
        } else {
          Serializer::write_u8(buf, OP_EXECUTE_SC);
          Serializer::write_bytes(buf, op.data);
          Serializer::write_u64(buf, op.max_gas);
          Serializer::write_u64(buf, op.coins);
          Serializer::write_u64(buf, op.gas_price);
        }
      },
      op);
}

void Endorsement::serialize(std::vector<uint8_t> &buf) const {
  slot.serialize(buf);
  Serializer::write_u32(buf, index);
  Serializer::write_bytes(buf, endorsed_block.hash());
}

void BlockHeader::serialize(std::vector<uint8_t> &buf) const {
  slot.serialize(buf);
  Serializer::write_u32(buf, static_cast<uint32_t>(parents.size()));
  for (const auto &parent : parents) {
    Serializer::write_bytes(buf, parent.hash());
  }
  Serializer::write_bytes(buf, operation_merkle_root);
  Serializer::write_u32(buf, static_cast<uint32_t>(endorsements.size()));
  for (const auto &endorsement : endorsements) {
    endorsement.serialize(buf);
  }
}

void Block::serialize(std::vector<uint8_t> &buf) const {
  header.serialize(buf);
  Serializer::write_u32(buf, static_cast<uint32_t>(operations.size()));
  for (const auto &operation : operations) {
    operation.serialize(buf);
  }
}

bool verify_block(const WrappedBlock &block) {
  if (!block.verify() || !block.content.header.verify()) {
    return false;
  }
  if (block.creator_public_key != block.content.header.creator_public_key) {
    return false;
  }
  for (const auto &endorsement : block.content.header.content.endorsements) {
    if (!endorsement.verify()) {
      return false;
    }
  }
  for (const auto &operation : block.content.operations) {
    if (!operation.verify()) {
      return false;
    }
  }
  return true;
}

Hash compute_operation_merkle_root(const std::vector<WrappedOperation> &ops) {
  std::vector<uint8_t> data;
  for (const auto &op : ops) {
    data.insert(data.end(), op.id.hash().begin(), op.id.hash().end());
  }
  return crypto::sha256(data);
}

} // namespace models
} // namespace clique

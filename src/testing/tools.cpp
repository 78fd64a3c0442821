#include "testing/tools.h"
#include "common/logging.h"
#include "crypto/keys.h"
#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>

namespace clique {
namespace testing {

using consensus::PoolCommand;
using consensus::ProtocolCommand;

namespace {

template <typename T>
T expect_ok(Result<T> result, const char *what) {
  if (result.is_err()) {
    throw std::runtime_error(std::string(what) + ": " + result.error());
  }
  return std::move(result).value();
}

std::optional<BlockId> integrated_block(ProtocolCommand cmd) {
  if (auto *integrated =
          std::get_if<consensus::protocol::IntegratedBlock>(&cmd)) {
    return integrated->block_id;
  }
  return std::nullopt;
}

std::optional<consensus::protocol::WishlistDelta>
wishlist_delta(ProtocolCommand cmd) {
  if (auto *delta = std::get_if<consensus::protocol::WishlistDelta>(&cmd)) {
    return std::move(*delta);
  }
  return std::nullopt;
}

std::optional<consensus::protocol::GetBlocksResults>
get_blocks_results(ProtocolCommand cmd) {
  if (auto *results =
          std::get_if<consensus::protocol::GetBlocksResults>(&cmd)) {
    return std::move(*results);
  }
  return std::nullopt;
}

std::chrono::milliseconds millis(uint64_t ms) {
  return std::chrono::milliseconds(ms);
}

WrappedOperation wrap_operation(models::Operation content,
                                const PrivateKey &private_key,
                                const PublicKey &public_key) {
  return expect_ok(
      WrappedOperation::new_wrapped(std::move(content), private_key, public_key),
      "Cannot sign operation");
}

PublicKey public_key_of(const PrivateKey &private_key) {
  return expect_ok(crypto::derive_public_key(private_key),
                   "Cannot derive public key");
}

std::pair<WrappedBlock, PrivateKey>
build_block(const Slot &slot, std::vector<BlockId> parents,
            Hash operation_merkle_root, const PrivateKey &creator,
            std::vector<WrappedOperation> operations,
            std::vector<WrappedEndorsement> endorsements) {
  PublicKey public_key = public_key_of(creator);

  models::BlockHeader header;
  header.slot = slot;
  header.parents = std::move(parents);
  header.operation_merkle_root = std::move(operation_merkle_root);
  header.endorsements = std::move(endorsements);

  models::Block block;
  block.header = expect_ok(
      models::WrappedHeader::new_wrapped(std::move(header), creator, public_key),
      "Cannot sign block header");
  block.operations = std::move(operations);

  auto wrapped = expect_ok(
      WrappedBlock::new_wrapped(std::move(block), creator, public_key),
      "Cannot sign block");
  return std::make_pair(std::move(wrapped), creator);
}

} // namespace

BlockId get_dummy_block_id(const std::string &seed) {
  return BlockId(crypto::sha256(std::vector<uint8_t>(seed.begin(), seed.end())));
}

AddressTest random_address() {
  auto keys = expect_ok(crypto::generate_keypair(), "Cannot generate key pair");
  AddressTest result;
  result.address = Address::from_public_key(keys.public_key);
  result.private_key = std::move(keys.private_key);
  result.public_key = std::move(keys.public_key);
  return result;
}

AddressTest random_address_on_thread(uint8_t thread, uint8_t thread_count) {
  for (;;) {
    AddressTest candidate = random_address();
    if (candidate.address.get_thread(thread_count) == thread) {
      return candidate;
    }
  }
}

bool validate_notpropagate_block(MockProtocolController &protocol,
                                 const BlockId &not_propagated,
                                 uint64_t timeout_ms) {
  auto seen = protocol.wait_command(millis(timeout_ms), integrated_block);
  return seen && *seen != not_propagated;
}

bool validate_notpropagate_block_in_list(
    MockProtocolController &protocol,
    const std::vector<BlockId> &not_propagated, uint64_t timeout_ms) {
  auto seen = protocol.wait_command(millis(timeout_ms), integrated_block);
  return seen && std::find(not_propagated.begin(), not_propagated.end(),
                           *seen) == not_propagated.end();
}

BlockId validate_propagate_block_in_list(MockProtocolController &protocol,
                                         const std::vector<BlockId> &valid,
                                         uint64_t timeout_ms) {
  auto seen = protocol.wait_command(millis(timeout_ms), integrated_block);
  if (!seen) {
    ADD_FAILURE() << "Block not propagated before timeout";
    return BlockId();
  }
  EXPECT_TRUE(std::find(valid.begin(), valid.end(), *seen) != valid.end())
      << "Propagated block " << *seen
      << " is not one of the expected blocks (genesis timestamp problem?)";
  return *seen;
}

void validate_propagate_block(MockProtocolController &protocol,
                              const BlockId &valid, uint64_t timeout_ms) {
  auto seen = protocol.wait_command(
      millis(timeout_ms), [&valid](ProtocolCommand cmd) -> std::optional<bool> {
        auto block_id = integrated_block(std::move(cmd));
        if (block_id && *block_id == valid) {
          return true;
        }
        return std::nullopt;
      });
  EXPECT_TRUE(seen.has_value())
      << "Block " << valid << " not propagated before timeout";
}

BlockId validate_ask_for_block(MockProtocolController &protocol,
                               const BlockId &valid, uint64_t timeout_ms) {
  auto delta = protocol.wait_command(millis(timeout_ms), wishlist_delta);
  if (!delta) {
    ADD_FAILURE() << "Block " << valid << " not asked for before timeout";
    return valid;
  }
  EXPECT_EQ(delta->new_blocks.count(valid), 1u) << "Not the expected block asked for";
  EXPECT_EQ(delta->new_blocks.size(), 1u);
  return valid;
}

void validate_wishlist(MockProtocolController &protocol,
                       const std::set<BlockId> &new_blocks,
                       const std::set<BlockId> &remove_blocks,
                       uint64_t timeout_ms) {
  auto delta = protocol.wait_command(millis(timeout_ms), wishlist_delta);
  if (!delta) {
    ADD_FAILURE() << "Wishlist delta not sent before timeout";
    return;
  }
  EXPECT_EQ(new_blocks, delta->new_blocks);
  EXPECT_EQ(remove_blocks, delta->remove_blocks);
}

void validate_does_not_ask_for_block(MockProtocolController &protocol,
                                     const BlockId &block_id,
                                     uint64_t timeout_ms) {
  auto delta = protocol.wait_command(millis(timeout_ms), wishlist_delta);
  if (delta) {
    EXPECT_EQ(delta->new_blocks.count(block_id), 0u)
        << "Unexpected ask for block " << block_id;
  }
}

void validate_notify_block_attack_attempt(MockProtocolController &protocol,
                                          const BlockId &block_id,
                                          uint64_t timeout_ms) {
  auto attacked = protocol.wait_command(
      millis(timeout_ms), [](ProtocolCommand cmd) -> std::optional<BlockId> {
        if (auto *attack =
                std::get_if<consensus::protocol::AttackBlockDetected>(&cmd)) {
          return attack->block_id;
        }
        return std::nullopt;
      });
  if (!attacked) {
    ADD_FAILURE() << "Attack attempt not notified before timeout";
    return;
  }
  EXPECT_EQ(block_id, *attacked) << "Attack attempt notified for wrong block";
}

void validate_block_found(MockProtocolController &protocol,
                          const BlockId &block_id, uint64_t timeout_ms) {
  auto results = protocol.wait_command(millis(timeout_ms), get_blocks_results);
  if (!results) {
    ADD_FAILURE() << "Get blocks results not sent before timeout";
    return;
  }
  auto it = results->results.find(block_id);
  if (it == results->results.end()) {
    ADD_FAILURE() << "Block " << block_id << " missing from results";
    return;
  }
  EXPECT_TRUE(it->second.has_value())
      << "Get blocks results do not contain block " << block_id;
}

void validate_block_not_found(MockProtocolController &protocol,
                              const BlockId &block_id, uint64_t timeout_ms) {
  auto results = protocol.wait_command(millis(timeout_ms), get_blocks_results);
  if (!results) {
    ADD_FAILURE() << "Get blocks results not sent before timeout";
    return;
  }
  auto it = results->results.find(block_id);
  if (it == results->results.end()) {
    ADD_FAILURE() << "Block " << block_id << " missing from results";
    return;
  }
  EXPECT_FALSE(it->second.has_value())
      << "Get blocks results unexpectedly contain block " << block_id;
}

BlockId create_and_test_block(MockProtocolController &protocol,
                              const consensus::ConsensusConfig &cfg,
                              const Slot &slot,
                              std::vector<BlockId> best_parents, bool valid,
                              bool trace, const PrivateKey &creator) {
  auto block = create_block(cfg, slot, std::move(best_parents), creator).first;
  BlockId block_id = block.id;
  if (trace) {
    LOG_INFO("harness", "Created block ", block_id, " at slot ", slot);
  }

  protocol.receive_block(std::move(block));
  if (valid) {
    validate_propagate_block(protocol, block_id, 2000);
  } else {
    validate_notpropagate_block(protocol, block_id, 500);
  }
  return block_id;
}

BlockId propagate_block(MockProtocolController &protocol, WrappedBlock block,
                        bool valid, uint64_t timeout_ms) {
  BlockId block_id = block.id;
  protocol.receive_block(std::move(block));
  if (valid) {
    validate_propagate_block(protocol, block_id, timeout_ms);
  } else {
    validate_notpropagate_block(protocol, block_id, timeout_ms);
  }
  return block_id;
}

Slot wait_pool_slot(MockPoolController &pool, uint64_t t0_ms, uint64_t period,
                    uint8_t thread) {
  const Slot target(period, thread);
  auto slot = pool.wait_command(
      millis(t0_ms * 2), [&target](PoolCommand cmd) -> std::optional<Slot> {
        if (auto *update = std::get_if<consensus::pool::UpdateCurrentSlot>(&cmd)) {
          if (update->slot >= target) {
            return update->slot;
          }
        }
        return std::nullopt;
      });
  if (!slot) {
    ADD_FAILURE() << "Timeout while waiting for slot " << target;
    return Slot();
  }
  return *slot;
}

WrappedOperation create_transaction(const PrivateKey &private_key,
                                    const PublicKey &sender_public_key,
                                    const Address &recipient_address,
                                    uint64_t amount, uint64_t expire_period,
                                    uint64_t fee) {
  models::Operation content;
  content.fee = fee;
  content.expire_period = expire_period;
  content.op = models::TransactionOp{recipient_address, amount};
  return wrap_operation(std::move(content), private_key, sender_public_key);
}

WrappedOperation create_roll_transaction(const PrivateKey &private_key,
                                         const PublicKey &sender_public_key,
                                         uint64_t roll_count, bool buy,
                                         uint64_t expire_period, uint64_t fee) {
  models::Operation content;
  content.fee = fee;
  content.expire_period = expire_period;
  if (buy) {
    content.op = models::RollBuyOp{roll_count};
  } else {
    content.op = models::RollSellOp{roll_count};
  }
  return wrap_operation(std::move(content), private_key, sender_public_key);
}

WrappedOperation create_executesc(const PrivateKey &private_key,
                                  const PublicKey &sender_public_key,
                                  uint64_t expire_period, uint64_t fee,
                                  std::vector<uint8_t> data, uint64_t max_gas,
                                  uint64_t coins, uint64_t gas_price) {
  models::Operation content;
  content.fee = fee;
  content.expire_period = expire_period;
  content.op = models::ExecuteScOp{std::move(data), max_gas, coins, gas_price};
  return wrap_operation(std::move(content), private_key, sender_public_key);
}

WrappedOperation create_roll_buy(const PrivateKey &private_key,
                                 uint64_t roll_count, uint64_t expire_period,
                                 uint64_t fee) {
  return create_roll_transaction(private_key, public_key_of(private_key),
                                 roll_count, true, expire_period, fee);
}

WrappedOperation create_roll_sell(const PrivateKey &private_key,
                                  uint64_t roll_count, uint64_t expire_period,
                                  uint64_t fee) {
  return create_roll_transaction(private_key, public_key_of(private_key),
                                 roll_count, false, expire_period, fee);
}

std::pair<WrappedBlock, PrivateKey>
create_block(const consensus::ConsensusConfig &cfg, const Slot &slot,
             std::vector<BlockId> best_parents, const PrivateKey &creator) {
  const std::string seed = "default_val";
  return create_block_with_merkle_root(
      cfg, crypto::sha256(std::vector<uint8_t>(seed.begin(), seed.end())), slot,
      std::move(best_parents), creator);
}

std::pair<WrappedBlock, PrivateKey>
create_block_with_merkle_root(const consensus::ConsensusConfig & /*cfg*/,
                              Hash operation_merkle_root, const Slot &slot,
                              std::vector<BlockId> best_parents,
                              const PrivateKey &creator) {
  return build_block(slot, std::move(best_parents),
                     std::move(operation_merkle_root), creator, {}, {});
}

std::pair<WrappedBlock, PrivateKey>
create_block_with_operations(const consensus::ConsensusConfig &cfg,
                             const Slot &slot,
                             const std::vector<BlockId> &best_parents,
                             const PrivateKey &creator,
                             std::vector<WrappedOperation> operations) {
  return create_block_with_operations_and_endorsements(
      cfg, slot, best_parents, creator, std::move(operations), {});
}

std::pair<WrappedBlock, PrivateKey>
create_block_with_operations_and_endorsements(
    const consensus::ConsensusConfig & /*cfg*/, const Slot &slot,
    const std::vector<BlockId> &best_parents, const PrivateKey &creator,
    std::vector<WrappedOperation> operations,
    std::vector<WrappedEndorsement> endorsements) {
  Hash merkle_root = models::compute_operation_merkle_root(operations);
  return build_block(slot, best_parents, std::move(merkle_root), creator,
                     std::move(operations), std::move(endorsements));
}

WrappedEndorsement create_endorsement(const PrivateKey &sender,
                                      const Slot &slot,
                                      const BlockId &endorsed_block,
                                      uint32_t index) {
  models::Endorsement content;
  content.slot = slot;
  content.index = index;
  content.endorsed_block = endorsed_block;
  return expect_ok(WrappedEndorsement::new_wrapped(std::move(content), sender,
                                                   public_key_of(sender)),
                   "Cannot sign endorsement");
}

models::ExportActiveBlock get_export_active_test_block(
    const PrivateKey &creator,
    std::vector<std::pair<BlockId, uint64_t>> parents,
    std::vector<WrappedOperation> operations, const Slot &slot,
    bool is_final) {
  std::vector<BlockId> parent_ids;
  for (const auto &parent : parents) {
    parent_ids.push_back(parent.first);
  }
  Hash merkle_root = models::compute_operation_merkle_root(operations);
  auto block = build_block(slot, std::move(parent_ids), std::move(merkle_root),
                           creator, std::move(operations), {})
                   .first;

  models::ExportActiveBlock exported;
  exported.block_id = block.id;
  exported.block = std::move(block);
  exported.parents = std::move(parents);
  exported.is_final = is_final;
  return exported;
}

PrivateKey get_creator_for_draw(const Address &draw,
                                const std::vector<PrivateKey> &nodes) {
  for (const auto &key : nodes) {
    if (Address::from_public_key(public_key_of(key)) == draw) {
      return key;
    }
  }
  throw std::runtime_error("Matching key for draw not found");
}

} // namespace testing
} // namespace clique

#include "storage/block_storage.h"
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace clique {
namespace storage {

class Storage::Impl {
public:
  mutable std::shared_mutex mutex;
  std::unordered_map<BlockId, WrappedBlock> blocks;
  std::unordered_map<OperationId, WrappedOperation> operations;
  // Number of stored blocks referencing each operation
  std::unordered_map<OperationId, size_t> operation_refs;
};

Storage::Storage() : impl_(std::make_shared<Impl>()) {}

common::Result<bool> Storage::store_block(const WrappedBlock &block) {
  if (block.id.empty()) {
    return common::Result<bool>("Cannot store a block without identifier");
  }

  std::unique_lock<std::shared_mutex> lock(impl_->mutex);
  auto inserted = impl_->blocks.emplace(block.id, block);
  if (!inserted.second) {
    return common::Result<bool>(false);
  }

  for (const auto &op : block.content.operations) {
    impl_->operations.emplace(op.id, op);
    ++impl_->operation_refs[op.id];
  }
  return common::Result<bool>(true);
}

std::optional<WrappedBlock>
Storage::retrieve_block(const BlockId &block_id) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex);
  auto it = impl_->blocks.find(block_id);
  if (it == impl_->blocks.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<WrappedOperation>
Storage::retrieve_operation(const OperationId &operation_id) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex);
  auto it = impl_->operations.find(operation_id);
  if (it == impl_->operations.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Storage::contains_block(const BlockId &block_id) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex);
  return impl_->blocks.count(block_id) > 0;
}

void Storage::remove_blocks(const std::vector<BlockId> &block_ids) {
  std::unique_lock<std::shared_mutex> lock(impl_->mutex);
  for (const auto &block_id : block_ids) {
    auto it = impl_->blocks.find(block_id);
    if (it == impl_->blocks.end()) {
      continue;
    }
    for (const auto &op : it->second.content.operations) {
      auto ref = impl_->operation_refs.find(op.id);
      if (ref != impl_->operation_refs.end() && --ref->second == 0) {
        impl_->operation_refs.erase(ref);
        impl_->operations.erase(op.id);
      }
    }
    impl_->blocks.erase(it);
  }
}

size_t Storage::block_count() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex);
  return impl_->blocks.size();
}

std::vector<BlockId> Storage::block_ids() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex);
  std::vector<BlockId> ids;
  ids.reserve(impl_->blocks.size());
  for (const auto &entry : impl_->blocks) {
    ids.push_back(entry.first);
  }
  return ids;
}

} // namespace storage
} // namespace clique

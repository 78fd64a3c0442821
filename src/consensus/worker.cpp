#include "consensus/worker.h"
#include "common/logging.h"
#include "crypto/keys.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace clique {
namespace consensus {

namespace {

void reply_with(std::promise<bool> &reply, const Result<bool> &outcome) {
  if (outcome.is_ok()) {
    reply.set_value(outcome.value());
  } else {
    reply.set_exception(
        std::make_exception_ptr(std::runtime_error(outcome.error())));
  }
}

} // namespace

ConsensusWorker::ConsensusWorker(
    ConsensusConfig config, ConsensusChannels channels,
    common::Receiver<ConsensusCommand> command_receiver,
    common::Sender<ConsensusEvent> event_sender,
    std::optional<models::ExportProofOfStake> boot_pos,
    std::optional<models::BootstrapableGraph> boot_graph,
    storage::Storage storage, int64_t clock_compensation_ms,
    std::string password, StakingKeys staking_keys,
    common::CancellationTokenPtr stop_token)
    : config_(std::move(config)), channels_(std::move(channels)),
      command_receiver_(std::move(command_receiver)),
      event_sender_(std::move(event_sender)), boot_pos_(std::move(boot_pos)),
      boot_graph_(std::move(boot_graph)), storage_(std::move(storage)),
      clock_compensation_ms_(clock_compensation_ms),
      password_(std::move(password)), staking_keys_(std::move(staking_keys)),
      stop_token_(std::move(stop_token)) {}

Result<bool> ConsensusWorker::initialize() {
  best_parents_.assign(config_.thread_count, BlockId());
  latest_final_periods_.assign(config_.thread_count, 0);

  auto graph = boot_graph_ && !boot_graph_->active_blocks.empty()
                   ? load_bootstrap_graph(*boot_graph_)
                   : create_genesis();
  boot_graph_.reset();
  if (graph.is_err()) {
    return graph;
  }

  if (boot_pos_) {
    roll_counts_ = boot_pos_->roll_counts;
    boot_pos_.reset();
  }

  auto latest = models::get_latest_block_slot_at_timestamp(
      config_.thread_count, config_.t0_ms, config_.genesis_timestamp_ms,
      current_time_ms());
  current_slot_ = latest;
  next_slot_ = latest ? latest->next(config_.thread_count) : Slot(0, 0);

  LOG_INFO("consensus", "Consensus worker initialized with ",
           active_blocks_.size(), " active blocks and ", staking_keys_.size(),
           " staking keys");
  return Result<bool>(true);
}

Result<bool> ConsensusWorker::create_genesis() {
  auto public_key = crypto::derive_public_key(config_.genesis_key);
  if (public_key.is_err()) {
    return Result<bool>("Invalid genesis key: " + public_key.error());
  }

  for (uint8_t thread = 0; thread < config_.thread_count; ++thread) {
    models::BlockHeader header;
    header.slot = Slot(0, thread);
    header.operation_merkle_root = models::compute_operation_merkle_root({});

    auto wrapped_header = WrappedHeader::new_wrapped(
        std::move(header), config_.genesis_key, public_key.value());
    if (wrapped_header.is_err()) {
      return Result<bool>("Cannot sign genesis header: " +
                          wrapped_header.error());
    }

    models::Block block;
    block.header = std::move(wrapped_header).value();
    auto genesis = WrappedBlock::new_wrapped(
        std::move(block), config_.genesis_key, public_key.value());
    if (genesis.is_err()) {
      return Result<bool>("Cannot sign genesis block: " + genesis.error());
    }

    const auto &genesis_block = genesis.value();
    auto stored = storage_.store_block(genesis_block);
    if (stored.is_err()) {
      return Result<bool>("Cannot store genesis block: " + stored.error());
    }

    ActiveBlock active;
    active.slot = Slot(0, thread);
    active.is_final = true;
    active_blocks_[genesis_block.id] = active;
    best_parents_[thread] = genesis_block.id;
    LOG_DEBUG("consensus", "Genesis block ", genesis_block.id, " in thread ",
              static_cast<int>(thread));
  }
  return Result<bool>(true);
}

Result<bool>
ConsensusWorker::load_bootstrap_graph(const models::BootstrapableGraph &graph) {
  for (const auto &entry : graph.active_blocks) {
    const auto &exported = entry.second;
    if (!(exported.block.id == entry.first)) {
      return Result<bool>("Bootstrap block id mismatch for " +
                          entry.first.to_string());
    }
    if (!storage_.contains_block(entry.first)) {
      auto stored = storage_.store_block(exported.block);
      if (stored.is_err()) {
        return Result<bool>("Cannot store bootstrap block: " + stored.error());
      }
    }

    ActiveBlock active;
    active.slot = exported.block.content.header.content.slot;
    for (const auto &parent : exported.parents) {
      active.parents.push_back(parent.first);
    }
    for (const auto &op : exported.block.content.operations) {
      active.operation_ids.insert(op.id);
    }
    for (const auto &endorsement :
         exported.block.content.header.content.endorsements) {
      active.endorsement_ids.push_back(endorsement.id);
    }
    active.is_final = exported.is_final;
    if (active.slot.thread >= config_.thread_count) {
      return Result<bool>("Bootstrap block " + entry.first.to_string() +
                          " is in an unknown thread");
    }
    active_blocks_[entry.first] = std::move(active);
  }

  if (graph.best_parents.size() == config_.thread_count) {
    for (size_t i = 0; i < graph.best_parents.size(); ++i) {
      if (active_blocks_.count(graph.best_parents[i].first) == 0) {
        return Result<bool>("Bootstrap best parent is not an active block");
      }
      best_parents_[i] = graph.best_parents[i].first;
    }
  } else {
    std::vector<bool> found(config_.thread_count, false);
    for (const auto &entry : active_blocks_) {
      uint8_t thread = entry.second.slot.thread;
      if (!found[thread] ||
          active_blocks_.at(best_parents_[thread]).slot < entry.second.slot) {
        best_parents_[thread] = entry.first;
        found[thread] = true;
      }
    }
    for (uint8_t thread = 0; thread < config_.thread_count; ++thread) {
      if (!found[thread]) {
        return Result<bool>("Bootstrap graph has no block in thread " +
                            std::to_string(thread));
      }
    }
  }

  if (graph.latest_final_blocks_periods.size() == config_.thread_count) {
    for (size_t i = 0; i < graph.latest_final_blocks_periods.size(); ++i) {
      latest_final_periods_[i] = graph.latest_final_blocks_periods[i].second;
    }
  } else {
    for (const auto &entry : active_blocks_) {
      if (entry.second.is_final) {
        auto &period = latest_final_periods_[entry.second.slot.thread];
        period = std::max(period, entry.second.slot.period);
      }
    }
  }

  LOG_INFO("consensus", "Bootstrapped graph with ", active_blocks_.size(),
           " active blocks");
  return Result<bool>(true);
}

Result<bool> ConsensusWorker::run() {
  const auto poll_interval =
      std::chrono::milliseconds(config_.worker_poll_interval_ms);

  if (emit_pool(pool::UpdateLatestFinalPeriods{latest_final_periods_})) {
    notify_blockclique();
  }

  while (!failed_ && !stop_token_->is_cancelled()) {
    while (!failed_) {
      auto command = command_receiver_.try_recv();
      if (!command) {
        break;
      }
      handle_command(std::move(*command));
    }
    if (failed_) {
      break;
    }

    uint64_t now = current_time_ms();
    uint64_t next_tick = slot_timestamp(next_slot_);
    if (now >= next_tick) {
      Slot slot = next_slot_;
      next_slot_ = slot.next(config_.thread_count);
      on_slot_tick(slot);
      continue;
    }

    auto wait = std::min<std::chrono::milliseconds>(
        std::chrono::milliseconds(next_tick - now), poll_interval);
    std::optional<ProtocolEvent> event;
    auto status = channels_.protocol_event_receiver.recv_until(
        std::chrono::steady_clock::now() + wait, event);
    if (status == common::RecvStatus::READY) {
      handle_protocol_event(std::move(*event));
    } else if (status == common::RecvStatus::DISCONNECTED) {
      fail("Protocol event channel disconnected");
    }
  }

  if (failed_) {
    return Result<bool>(failure_);
  }
  LOG_INFO("consensus", "Consensus worker stopped");
  return Result<bool>(true);
}

void ConsensusWorker::handle_protocol_event(ProtocolEvent event) {
  if (auto *received = std::get_if<protocol::ReceivedBlock>(&event)) {
    on_block_received(std::move(received->block));
  } else if (auto *header = std::get_if<protocol::ReceivedBlockHeader>(&event)) {
    on_header_received(header->header);
  } else if (auto *request = std::get_if<protocol::GetBlocks>(&event)) {
    on_get_blocks(request->block_ids);
  }
}

void ConsensusWorker::handle_command(ConsensusCommand cmd) {
  if (auto *status = std::get_if<command::GetBlockGraphStatus>(&cmd)) {
    status->reply.set_value(export_graph());
  } else if (auto *get = std::get_if<command::GetActiveBlock>(&cmd)) {
    if (active_blocks_.count(get->block_id) > 0) {
      get->reply.set_value(storage_.retrieve_block(get->block_id));
    } else {
      get->reply.set_value(std::nullopt);
    }
  } else if (auto *addresses =
                 std::get_if<command::GetStakingAddresses>(&cmd)) {
    std::set<Address> result;
    for (const auto &entry : staking_keys_) {
      result.insert(entry.first);
    }
    addresses->reply.set_value(std::move(result));
  } else if (auto *stakers = std::get_if<command::GetActiveStakers>(&cmd)) {
    stakers->reply.set_value(roll_counts_);
  } else if (auto *reg = std::get_if<command::RegisterStakingKeys>(&cmd)) {
    reply_with(reg->reply, register_staking_keys(reg->keys));
  } else if (auto *remove =
                 std::get_if<command::RemoveStakingAddresses>(&cmd)) {
    reply_with(remove->reply, remove_staking_addresses(remove->addresses));
  }
}

void ConsensusWorker::on_block_received(WrappedBlock block) {
  const BlockId block_id = block.id;
  if (is_known(block_id)) {
    LOG_TRACE("consensus", "Ignoring known block ", block_id);
    return;
  }

  if (!models::verify_block(block)) {
    LOG_WARN("consensus", "Block ", block_id,
             " failed verification, reporting attack attempt");
    discard_block(block_id, "invalid signature");
    emit_protocol(protocol::AttackBlockDetected{block_id});
    return;
  }

  remove_from_wishlist(block_id);
  if (failed_) {
    return;
  }

  const auto &header = block.content.header.content;
  auto structure_error = check_header_structure(header);
  if (!structure_error.empty()) {
    discard_block(block_id, structure_error);
    return;
  }

  uint64_t current_period = current_slot_ ? current_slot_->period : 0;
  if (header.slot.period >
      current_period + config_.future_block_processing_max_periods) {
    discard_block(block_id, "slot too far in the future");
    request_sync();
    return;
  }

  auto stored = storage_.store_block(block);
  if (stored.is_err()) {
    LOG_ERROR("consensus", "Cannot store block ", block_id, ": ",
              stored.error());
    return;
  }

  if (!current_slot_ || header.slot > *current_slot_) {
    LOG_DEBUG("consensus", "Block ", block_id, " waits for slot ",
              header.slot);
    waiting_for_slot_.emplace(block_id, std::move(block));
    if (waiting_for_slot_.size() > config_.max_future_processing_blocks) {
      auto latest = std::max_element(
          waiting_for_slot_.begin(), waiting_for_slot_.end(),
          [](const std::pair<const BlockId, WrappedBlock> &a,
             const std::pair<const BlockId, WrappedBlock> &b) {
            return a.second.content.header.content.slot <
                   b.second.content.header.content.slot;
          });
      BlockId dropped = latest->first;
      waiting_for_slot_.erase(latest);
      discard_block(dropped, "too many blocks waiting for their slot");
    }
    return;
  }

  process_block(std::move(block));
}

void ConsensusWorker::on_header_received(const WrappedHeader &header) {
  if (is_known(header.id) || wishlist_.count(header.id) > 0) {
    return;
  }

  if (!header.verify()) {
    LOG_WARN("consensus", "Header ", header.id,
             " failed verification, reporting attack attempt");
    discard_block(header.id, "invalid header signature");
    emit_protocol(protocol::AttackBlockDetected{header.id});
    return;
  }

  auto structure_error = check_header_structure(header.content);
  if (!structure_error.empty()) {
    discard_block(header.id, structure_error);
    return;
  }

  wishlist_.insert(header.id);
  emit_protocol(protocol::WishlistDelta{{header.id}, {}});
}

void ConsensusWorker::on_get_blocks(const std::vector<BlockId> &block_ids) {
  protocol::GetBlocksResults results;
  for (const auto &block_id : block_ids) {
    if (active_blocks_.count(block_id) > 0) {
      results.results[block_id] = storage_.retrieve_block(block_id);
    } else {
      results.results[block_id] = std::nullopt;
    }
  }
  emit_protocol(std::move(results));
}

void ConsensusWorker::on_slot_tick(const Slot &slot) {
  current_slot_ = slot;
  LOG_TRACE("consensus", "Slot tick ", slot);
  if (!emit_pool(pool::UpdateCurrentSlot{slot})) {
    return;
  }

  std::vector<WrappedBlock> ready;
  for (auto it = waiting_for_slot_.begin(); it != waiting_for_slot_.end();) {
    if (it->second.content.header.content.slot <= slot) {
      ready.push_back(std::move(it->second));
      it = waiting_for_slot_.erase(it);
    } else {
      ++it;
    }
  }
  std::sort(ready.begin(), ready.end(),
            [](const WrappedBlock &a, const WrappedBlock &b) {
              return a.content.header.content.slot <
                     b.content.header.content.slot;
            });
  for (auto &block : ready) {
    if (failed_) {
      return;
    }
    process_block(std::move(block));
  }
}

void ConsensusWorker::process_block(WrappedBlock block) {
  std::deque<WrappedBlock> queue;
  queue.push_back(std::move(block));

  while (!queue.empty() && !failed_) {
    WrappedBlock current = std::move(queue.front());
    queue.pop_front();
    const BlockId block_id = current.id;
    const auto &header = current.content.header.content;

    std::set<BlockId> missing;
    bool discarded_parent = false;
    for (const auto &parent : header.parents) {
      if (active_blocks_.count(parent) > 0) {
        continue;
      }
      if (discarded_.count(parent) > 0) {
        discarded_parent = true;
        break;
      }
      missing.insert(parent);
    }

    if (discarded_parent) {
      discard_block(block_id, "parent was discarded");
      continue;
    }
    if (!missing.empty()) {
      wait_for_dependencies(std::move(current), std::move(missing));
      continue;
    }

    auto topology_error = check_parent_topology(header);
    if (!topology_error.empty()) {
      discard_block(block_id, topology_error);
      continue;
    }

    integrate(current);

    // Blocks that were only waiting for this one can go next
    for (auto it = waiting_for_dependencies_.begin();
         it != waiting_for_dependencies_.end();) {
      it->second.missing.erase(block_id);
      if (it->second.missing.empty()) {
        queue.push_back(std::move(it->second.block));
        it = waiting_for_dependencies_.erase(it);
      } else {
        ++it;
      }
    }
  }
}

void ConsensusWorker::wait_for_dependencies(WrappedBlock block,
                                            std::set<BlockId> missing) {
  const BlockId block_id = block.id;
  std::set<BlockId> new_wishes;
  for (const auto &parent : missing) {
    if (wishlist_.count(parent) == 0 && waiting_for_slot_.count(parent) == 0 &&
        waiting_for_dependencies_.count(parent) == 0) {
      wishlist_.insert(parent);
      new_wishes.insert(parent);
    }
  }

  LOG_DEBUG("consensus", "Block ", block_id, " waits for ", missing.size(),
            " missing parents");
  waiting_for_dependencies_[block_id] =
      DependencyWait{std::move(block), std::move(missing)};
  dependency_order_.push_back(block_id);

  while (waiting_for_dependencies_.size() > config_.max_dependency_blocks &&
         !dependency_order_.empty()) {
    BlockId oldest = dependency_order_.front();
    dependency_order_.pop_front();
    if (waiting_for_dependencies_.count(oldest) > 0) {
      discard_block(oldest, "too many blocks waiting for dependencies");
    }
  }

  if (!new_wishes.empty()) {
    emit_protocol(protocol::WishlistDelta{std::move(new_wishes), {}});
  }
}

void ConsensusWorker::integrate(const WrappedBlock &block) {
  const auto &header = block.content.header.content;

  ActiveBlock active;
  active.slot = header.slot;
  active.parents = header.parents;
  for (const auto &op : block.content.operations) {
    active.operation_ids.insert(op.id);
  }
  for (const auto &endorsement : header.endorsements) {
    active.endorsement_ids.push_back(endorsement.id);
  }
  active_blocks_[block.id] = active;

  auto &best = best_parents_[header.slot.thread];
  if (active_blocks_.at(best).slot < header.slot) {
    best = block.id;
  }
  out_of_sync_ = false;

  LOG_DEBUG("consensus", "Integrated block ", block.id, " at slot ",
            header.slot);
  if (emit_protocol(protocol::IntegratedBlock{
          block.id, active.operation_ids, active.endorsement_ids})) {
    notify_blockclique();
  }
}

void ConsensusWorker::discard_block(const BlockId &block_id,
                                    const std::string &reason) {
  std::vector<BlockId> pending{block_id};
  std::vector<BlockId> removed;

  while (!pending.empty()) {
    BlockId current = pending.back();
    pending.pop_back();
    if (discarded_.count(current) > 0) {
      continue;
    }

    LOG_DEBUG("consensus", "Discarding block ", current, ": ",
              current == block_id ? reason : "parent was discarded");
    waiting_for_slot_.erase(current);
    waiting_for_dependencies_.erase(current);
    discarded_.insert(current);
    discarded_order_.push_back(current);
    removed.push_back(current);

    for (const auto &entry : waiting_for_dependencies_) {
      if (entry.second.missing.count(current) > 0) {
        pending.push_back(entry.first);
      }
    }
  }

  while (discarded_order_.size() > config_.max_discarded_blocks) {
    discarded_.erase(discarded_order_.front());
    discarded_order_.pop_front();
  }
  storage_.remove_blocks(removed);
}

void ConsensusWorker::remove_from_wishlist(const BlockId &block_id) {
  if (wishlist_.erase(block_id) > 0) {
    emit_protocol(protocol::WishlistDelta{{}, {block_id}});
  }
}

std::string
ConsensusWorker::check_header_structure(const models::BlockHeader &header) const {
  if (header.slot.thread >= config_.thread_count) {
    return "thread out of range";
  }
  if (header.slot.period == 0) {
    return "only genesis blocks live in period 0";
  }
  if (header.parents.size() != config_.thread_count) {
    return "expected one parent per thread";
  }
  return "";
}

std::string
ConsensusWorker::check_parent_topology(const models::BlockHeader &header) const {
  for (size_t thread = 0; thread < header.parents.size(); ++thread) {
    const auto &parent = active_blocks_.at(header.parents[thread]);
    if (parent.slot.thread != thread) {
      return "parent " + std::to_string(thread) + " is in the wrong thread";
    }
    if (!(parent.slot < header.slot)) {
      return "parent " + std::to_string(thread) + " is not older than block";
    }
  }
  return "";
}

bool ConsensusWorker::is_known(const BlockId &block_id) const {
  return active_blocks_.count(block_id) > 0 ||
         waiting_for_slot_.count(block_id) > 0 ||
         waiting_for_dependencies_.count(block_id) > 0 ||
         discarded_.count(block_id) > 0;
}

models::BlockGraphExport ConsensusWorker::export_graph() const {
  models::BlockGraphExport graph;
  graph.best_parents = best_parents_;
  for (const auto &entry : active_blocks_) {
    graph.active_blocks[entry.first] = entry.second.slot;
  }
  for (const auto &entry : waiting_for_dependencies_) {
    graph.waiting_for_dependencies.insert(entry.first);
  }
  for (const auto &entry : waiting_for_slot_) {
    graph.waiting_for_slot.insert(entry.first);
  }
  graph.discarded_blocks = discarded_;
  graph.wishlist = wishlist_;
  return graph;
}

Result<bool>
ConsensusWorker::register_staking_keys(const std::vector<PrivateKey> &keys) {
  auto added = staking_keys_from_private(keys);
  if (added.is_err()) {
    return Result<bool>(added.error());
  }
  for (const auto &entry : added.value()) {
    staking_keys_[entry.first] = entry.second;
  }
  LOG_INFO("consensus", "Registered ", added.value().size(),
           " staking keys");
  return persist_staking_keys();
}

Result<bool> ConsensusWorker::remove_staking_addresses(
    const std::set<Address> &addresses) {
  for (const auto &address : addresses) {
    staking_keys_.erase(address);
  }
  return persist_staking_keys();
}

Result<bool> ConsensusWorker::persist_staking_keys() {
  if (config_.staking_keys_path.empty()) {
    return Result<bool>(true);
  }
  std::vector<PrivateKey> keys;
  for (const auto &entry : staking_keys_) {
    keys.push_back(entry.second.second);
  }
  return save_staking_keys(config_.staking_keys_path, password_, keys);
}

bool ConsensusWorker::emit_protocol(ProtocolCommand command) {
  const char *name = command_name(command);
  auto sent = channels_.protocol_command_sender.send(std::move(command));
  if (sent.is_err()) {
    fail(std::string("Cannot send ") + name + " to protocol: " + sent.error());
    return false;
  }
  return true;
}

bool ConsensusWorker::emit_pool(PoolCommand command) {
  const char *name = command_name(command);
  auto sent = channels_.pool_command_sender.send(std::move(command));
  if (sent.is_err()) {
    fail(std::string("Cannot send ") + name + " to pool: " + sent.error());
    return false;
  }
  return true;
}

void ConsensusWorker::notify_blockclique() {
  std::map<Slot, BlockId> finalized;
  std::map<Slot, BlockId> blockclique;
  for (const auto &entry : active_blocks_) {
    auto &target = entry.second.is_final ? finalized : blockclique;
    target.emplace(entry.second.slot, entry.first);
  }
  channels_.execution_controller->update_blockclique_status(
      std::move(finalized), std::move(blockclique));
}

void ConsensusWorker::request_sync() {
  if (out_of_sync_) {
    return;
  }
  out_of_sync_ = true;
  auto sent = event_sender_.send(event::NeedSync{});
  if (sent.is_err()) {
    LOG_WARN("consensus", "Nobody listens for consensus events: ",
             sent.error());
  }
}

void ConsensusWorker::fail(const std::string &reason) {
  if (failed_) {
    return;
  }
  failed_ = true;
  failure_ = reason;
  LOG_CONSENSUS_ERROR(reason);
}

uint64_t ConsensusWorker::current_time_ms() const {
  int64_t now = static_cast<int64_t>(models::now_millis()) +
                clock_compensation_ms_;
  return now < 0 ? 0 : static_cast<uint64_t>(now);
}

uint64_t ConsensusWorker::slot_timestamp(const Slot &slot) const {
  return models::get_block_slot_timestamp(config_.thread_count, config_.t0_ms,
                                          config_.genesis_timestamp_ms, slot);
}

} // namespace consensus
} // namespace clique

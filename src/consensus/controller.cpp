#include "consensus/controller.h"
#include "common/logging.h"
#include <chrono>
#include <stdexcept>

namespace clique {
namespace consensus {

// ConsensusCommandSender

ConsensusCommandSender::ConsensusCommandSender(
    common::Sender<ConsensusCommand> sender)
    : sender_(std::move(sender)) {}

template <typename T>
Result<T> ConsensusCommandSender::request(ConsensusCommand command,
                                          std::future<T> reply) {
  auto sent = sender_.send(std::move(command));
  if (sent.is_err()) {
    return Result<T>("Consensus worker unreachable: " + sent.error());
  }
  try {
    return Result<T>(reply.get());
  } catch (const std::future_error &e) {
    return Result<T>(std::string("Consensus worker dropped request: ") +
                     e.what());
  } catch (const std::exception &e) {
    return Result<T>(std::string(e.what()));
  }
}

Result<models::BlockGraphExport>
ConsensusCommandSender::get_block_graph_status() {
  command::GetBlockGraphStatus cmd;
  auto reply = cmd.reply.get_future();
  return request(std::move(cmd), std::move(reply));
}

Result<std::optional<WrappedBlock>>
ConsensusCommandSender::get_active_block(const BlockId &block_id) {
  command::GetActiveBlock cmd;
  cmd.block_id = block_id;
  auto reply = cmd.reply.get_future();
  return request(std::move(cmd), std::move(reply));
}

Result<std::set<Address>> ConsensusCommandSender::get_staking_addresses() {
  command::GetStakingAddresses cmd;
  auto reply = cmd.reply.get_future();
  return request(std::move(cmd), std::move(reply));
}

Result<std::map<Address, uint64_t>>
ConsensusCommandSender::get_active_stakers() {
  command::GetActiveStakers cmd;
  auto reply = cmd.reply.get_future();
  return request(std::move(cmd), std::move(reply));
}

Result<bool>
ConsensusCommandSender::register_staking_keys(std::vector<PrivateKey> keys) {
  command::RegisterStakingKeys cmd;
  cmd.keys = std::move(keys);
  auto reply = cmd.reply.get_future();
  return request(std::move(cmd), std::move(reply));
}

Result<bool>
ConsensusCommandSender::remove_staking_addresses(std::set<Address> addresses) {
  command::RemoveStakingAddresses cmd;
  cmd.addresses = std::move(addresses);
  auto reply = cmd.reply.get_future();
  return request(std::move(cmd), std::move(reply));
}

// ConsensusManager

ConsensusManager::ConsensusManager(
    common::CancellationTokenPtr stop_token, std::thread worker_thread,
    std::shared_future<Result<bool>> worker_result, uint32_t poll_interval_ms)
    : state_(std::make_shared<State>()) {
  state_->stop_token = std::move(stop_token);
  state_->worker_thread = std::move(worker_thread);
  state_->worker_result = std::move(worker_result);
  state_->poll_interval_ms = poll_interval_ms;
}

ConsensusManager::~ConsensusManager() {
  if (!state_) {
    return;
  }
  if (state_->stop_token->cancel()) {
    LOG_WARN("consensus", "Consensus manager destroyed without stop()");
  }
  state_->join();
}

void ConsensusManager::State::join() {
  std::lock_guard<std::mutex> lock(join_mutex);
  if (worker_thread.joinable()) {
    worker_thread.join();
  }
}

std::future<bool>
ConsensusManager::stop(ConsensusEventReceiver event_receiver) {
  auto state = state_;
  return std::async(
      std::launch::async,
      [state, receiver = std::move(event_receiver)]() mutable {
        if (!state) {
          throw std::runtime_error("Consensus manager was never started");
        }
        if (state->stop_token->cancel()) {
          LOG_INFO("consensus", "Stopping consensus worker");
        }

        const auto poll = std::chrono::milliseconds(state->poll_interval_ms);
        while (state->worker_result.wait_for(std::chrono::milliseconds(0)) !=
               std::future_status::ready) {
          if (receiver.is_disconnected()) {
            state->worker_result.wait_for(poll);
          } else {
            receiver.recv_timeout(poll);
          }
        }
        state->join();

        // Rethrows if the worker crashed
        auto outcome = state->worker_result.get();
        if (outcome.is_err()) {
          throw std::runtime_error("Consensus worker failed: " +
                                   outcome.error());
        }
        return true;
      });
}

bool ConsensusManager::is_running() const {
  return state_ && state_->worker_result.valid() &&
         state_->worker_result.wait_for(std::chrono::milliseconds(0)) !=
             std::future_status::ready;
}

// Startup

Result<ConsensusHandles> start_consensus_controller(
    ConsensusConfig config, ConsensusChannels channels,
    std::optional<models::ExportProofOfStake> boot_pos,
    std::optional<models::BootstrapableGraph> boot_graph,
    storage::Storage storage, int64_t clock_compensation_ms,
    std::string password, StakingKeys staking_keys) {
  auto config_error = ConsensusConfigLoader::validate_config(config);
  if (!config_error.empty()) {
    return Result<ConsensusHandles>("Invalid consensus configuration: " +
                                    config_error);
  }
  if (!channels.execution_controller ||
      !channels.protocol_command_sender.is_connected() ||
      !channels.protocol_event_receiver.is_connected() ||
      !channels.pool_command_sender.is_connected()) {
    return Result<ConsensusHandles>("Consensus channels are not connected");
  }

  auto command_channel =
      common::make_channel<ConsensusCommand>(config.channel_size);
  auto event_channel = common::make_channel<ConsensusEvent>(config.channel_size);
  auto stop_token = std::make_shared<common::CancellationToken>();
  const uint32_t poll_interval_ms = config.worker_poll_interval_ms;

  auto worker = std::make_unique<ConsensusWorker>(
      std::move(config), std::move(channels), std::move(command_channel.second),
      std::move(event_channel.first), std::move(boot_pos),
      std::move(boot_graph), std::move(storage), clock_compensation_ms,
      std::move(password), std::move(staking_keys), stop_token);

  auto initialized = worker->initialize();
  if (initialized.is_err()) {
    return Result<ConsensusHandles>("Cannot start consensus worker: " +
                                    initialized.error());
  }

  auto outcome = std::make_shared<std::promise<Result<bool>>>();
  std::shared_future<Result<bool>> worker_result =
      outcome->get_future().share();

  std::thread worker_thread([worker = std::move(worker), outcome]() {
    try {
      outcome->set_value(worker->run());
    } catch (const std::exception &e) {
      LOG_CONSENSUS_ERROR(std::string("Consensus worker crashed: ") +
                          e.what());
      outcome->set_exception(std::current_exception());
    }
  });

  LOG_INFO("consensus", "Consensus controller started");
  return Result<ConsensusHandles>(ConsensusHandles(
      ConsensusCommandSender(std::move(command_channel.first)),
      std::move(event_channel.second),
      ConsensusManager(stop_token, std::move(worker_thread), worker_result,
                       poll_interval_ms)));
}

} // namespace consensus
} // namespace clique

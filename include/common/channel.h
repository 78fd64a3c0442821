#pragma once

#include "common/types.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace clique {
namespace common {

/**
 * Outcome of a bounded receive
 */
enum class RecvStatus {
  READY,       // A message was dequeued
  TIMEOUT,     // Deadline reached with the queue still empty
  DISCONNECTED // Queue empty and every sender is gone
};

namespace detail {

template <typename T>
struct ChannelState {
  explicit ChannelState(size_t cap) : capacity(cap) {}

  std::mutex mutex;
  std::condition_variable not_empty;
  std::condition_variable not_full;
  std::deque<T> queue;
  const size_t capacity;
  size_t senders = 0;
  bool receiver_alive = true;
};

} // namespace detail

/**
 * Sending half of a bounded FIFO channel
 *
 * Copyable: every copy counts as a producer. send() blocks while the queue is
 * at capacity, which is how backpressure reaches the producer. It fails once
 * the receiver is gone, including when the producer is blocked at the time
 * the receiver drops.
 */
template <typename T>
class Sender {
public:
  Sender() = default;

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {
    acquire();
  }

  Sender(const Sender &other) : state_(other.state_) { acquire(); }

  Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}

  Sender &operator=(Sender other) noexcept {
    std::swap(state_, other.state_);
    return *this;
  }

  ~Sender() { release(); }

  /**
   * Enqueue a message, waiting for room if the channel is full
   * @return error if the receiver has been dropped
   */
  Result<bool> send(T value) {
    if (!state_) {
      return Result<bool>("Sender is not connected to a channel");
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->not_full.wait(lock, [this] {
      return !state_->receiver_alive ||
             state_->queue.size() < state_->capacity;
    });
    if (!state_->receiver_alive) {
      return Result<bool>("Channel closed: receiver dropped");
    }
    state_->queue.push_back(std::move(value));
    lock.unlock();
    state_->not_empty.notify_one();
    return Result<bool>(true);
  }

  bool is_closed() const {
    if (!state_) {
      return true;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->receiver_alive;
  }

  bool is_connected() const { return state_ != nullptr; }

private:
  void acquire() {
    if (state_) {
      std::lock_guard<std::mutex> lock(state_->mutex);
      ++state_->senders;
    }
  }

  void release() {
    if (!state_) {
      return;
    }
    bool last = false;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      last = (--state_->senders == 0);
    }
    if (last) {
      state_->not_empty.notify_all();
    }
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * Receiving half of a bounded FIFO channel
 *
 * Move-only: a channel has exactly one consumer. Messages come out in the
 * order they were sent. Dropping the receiver discards whatever is still
 * queued and fails every pending and future send().
 */
template <typename T>
class Receiver {
public:
  Receiver() = default;

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
      : state_(std::move(state)) {}

  Receiver(const Receiver &) = delete;
  Receiver &operator=(const Receiver &) = delete;

  Receiver(Receiver &&other) noexcept : state_(std::move(other.state_)) {}

  Receiver &operator=(Receiver &&other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Receiver() { close(); }

  /**
   * Wait for the next message until `deadline`
   *
   * TIMEOUT is only reported once the deadline has been reached.
   * DISCONNECTED is only reported once the queue is drained.
   */
  RecvStatus recv_until(std::chrono::steady_clock::time_point deadline,
                        std::optional<T> &out) {
    if (!state_) {
      return RecvStatus::DISCONNECTED;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->not_empty.wait_until(lock, deadline, [this] {
      return !state_->queue.empty() || state_->senders == 0;
    });

    if (!state_->queue.empty()) {
      out.emplace(std::move(state_->queue.front()));
      state_->queue.pop_front();
      lock.unlock();
      state_->not_full.notify_one();
      return RecvStatus::READY;
    }
    if (state_->senders == 0) {
      return RecvStatus::DISCONNECTED;
    }
    return RecvStatus::TIMEOUT;
  }

  /// Bounded receive; empty on timeout or disconnection
  template <typename Rep, typename Period>
  std::optional<T> recv_timeout(std::chrono::duration<Rep, Period> timeout) {
    std::optional<T> out;
    recv_until(std::chrono::steady_clock::now() + timeout, out);
    return out;
  }

  /// Non-blocking receive
  std::optional<T> try_recv() {
    if (!state_) {
      return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->queue.empty()) {
      return std::nullopt;
    }
    std::optional<T> out(std::move(state_->queue.front()));
    state_->queue.pop_front();
    lock.unlock();
    state_->not_full.notify_one();
    return out;
  }

  /// Number of messages currently queued
  size_t pending() const {
    if (!state_) {
      return 0;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
  }

  /// True once every sender is gone and nothing is left to read
  bool is_disconnected() const {
    if (!state_) {
      return true;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->senders == 0 && state_->queue.empty();
  }

  bool is_connected() const { return state_ != nullptr; }

private:
  void close() {
    if (!state_) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->receiver_alive = false;
      state_->queue.clear();
    }
    state_->not_full.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

/**
 * Create a bounded channel
 * @param capacity Maximum number of queued messages (must be > 0)
 */
template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(size_t capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("Channel capacity must be greater than zero");
  }
  auto state = std::make_shared<detail::ChannelState<T>>(capacity);
  return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace common
} // namespace clique

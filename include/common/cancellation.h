#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace clique {
namespace common {

/**
 * Cancellation token shared between a controlling thread and the background
 * loops it owns (drains, sinks, the consensus worker).
 *
 * The state only ever moves from "running" to "cancelled". cancel() is
 * idempotent, so stopping twice is a no-op. Loops are expected to check
 * is_cancelled() between bounded waits, or to sleep in wait_for() which
 * returns early on cancellation.
 */
class CancellationToken {
public:
  CancellationToken() : cancelled_(false) {}

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /**
   * Request cancellation and wake every thread blocked in wait_for()
   * @return true if this call performed the transition
   */
  bool cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (cancelled_) {
        return false;
      }
      cancelled_ = true;
    }
    cv_.notify_all();
    return true;
  }

  bool is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  /**
   * Sleep for at most `timeout`
   * @return true if cancelled (before or during the wait)
   */
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace common
} // namespace clique

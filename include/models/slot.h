#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace clique {
namespace models {

/**
 * @brief Position in the block graph timeline
 *
 * Periods advance every t0 milliseconds; each period is split into
 * `thread_count` equal slots, one per thread. Ordering is by period first,
 * then thread.
 */
struct Slot {
  uint64_t period = 0;
  uint8_t thread = 0;

  Slot() = default;
  Slot(uint64_t p, uint8_t t) : period(p), thread(t) {}

  bool operator==(const Slot &other) const {
    return period == other.period && thread == other.thread;
  }
  bool operator!=(const Slot &other) const { return !(*this == other); }
  bool operator<(const Slot &other) const {
    return period < other.period ||
           (period == other.period && thread < other.thread);
  }
  bool operator>(const Slot &other) const { return other < *this; }
  bool operator<=(const Slot &other) const { return !(other < *this); }
  bool operator>=(const Slot &other) const { return !(*this < other); }

  /// Following slot, wrapping into the next period after the last thread
  Slot next(uint8_t thread_count) const;

  void serialize(std::vector<uint8_t> &buf) const;
  std::string to_string() const;
};

std::ostream &operator<<(std::ostream &os, const Slot &slot);

/**
 * @brief Wall-clock start of a slot, in milliseconds since the epoch
 */
uint64_t get_block_slot_timestamp(uint8_t thread_count, uint64_t t0_ms,
                                  uint64_t genesis_timestamp_ms,
                                  const Slot &slot);

/**
 * @brief Latest slot that has started at `timestamp_ms`
 * @return empty before genesis
 */
std::optional<Slot> get_latest_block_slot_at_timestamp(
    uint8_t thread_count, uint64_t t0_ms, uint64_t genesis_timestamp_ms,
    uint64_t timestamp_ms);

/// Milliseconds since the Unix epoch
uint64_t now_millis();

} // namespace models
} // namespace clique

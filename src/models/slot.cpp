#include "models/slot.h"
#include "models/serializer.h"
#include <chrono>
#include <sstream>

namespace clique {
namespace models {

Slot Slot::next(uint8_t thread_count) const {
  if (thread + 1 >= thread_count) {
    return Slot(period + 1, 0);
  }
  return Slot(period, static_cast<uint8_t>(thread + 1));
}

void Slot::serialize(std::vector<uint8_t> &buf) const {
  Serializer::write_u64(buf, period);
  Serializer::write_u8(buf, thread);
}

std::string Slot::to_string() const {
  std::ostringstream oss;
  oss << "(period: " << period << ", thread: " << static_cast<int>(thread)
      << ")";
  return oss.str();
}

std::ostream &operator<<(std::ostream &os, const Slot &slot) {
  return os << slot.to_string();
}

uint64_t get_block_slot_timestamp(uint8_t thread_count, uint64_t t0_ms,
                                  uint64_t genesis_timestamp_ms,
                                  const Slot &slot) {
  const uint64_t per_thread = thread_count > 0 ? t0_ms / thread_count : t0_ms;
  return genesis_timestamp_ms + slot.period * t0_ms + slot.thread * per_thread;
}

std::optional<Slot> get_latest_block_slot_at_timestamp(
    uint8_t thread_count, uint64_t t0_ms, uint64_t genesis_timestamp_ms,
    uint64_t timestamp_ms) {
  if (timestamp_ms < genesis_timestamp_ms || t0_ms == 0 || thread_count == 0) {
    return std::nullopt;
  }
  const uint64_t elapsed = timestamp_ms - genesis_timestamp_ms;
  const uint64_t per_thread = t0_ms / thread_count;
  const uint64_t period = elapsed / t0_ms;
  uint64_t thread = per_thread > 0 ? (elapsed % t0_ms) / per_thread : 0;
  if (thread >= thread_count) {
    thread = thread_count - 1;
  }
  return Slot(period, static_cast<uint8_t>(thread));
}

uint64_t now_millis() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

} // namespace models
} // namespace clique

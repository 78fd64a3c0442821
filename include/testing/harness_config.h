#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace clique {
namespace testing {

/**
 * @brief Tunables of the test harness
 *
 * Channel capacities apply to the mock collaborators' channels. Poll
 * intervals bound how long a drain loop may take to notice it was asked to
 * stop.
 */
struct HarnessConfig {
  size_t protocol_channel_size = 256;
  size_t pool_channel_size = 256;
  size_t execution_channel_size = 256;

  std::chrono::milliseconds execution_poll_interval{500};
  std::chrono::milliseconds sink_poll_interval{100};
  std::chrono::milliseconds drain_poll_interval{50};

  int64_t clock_compensation_ms = 0;
};

} // namespace testing
} // namespace clique

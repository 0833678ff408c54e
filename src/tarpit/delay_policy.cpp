// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tarpit/delay_policy.hpp"
#include <algorithm>

namespace deadlock {
namespace tarpit {

std::chrono::milliseconds ComputeDelay(uint64_t connection_count,
                                       const DelaySettings &settings) {
  const int64_t initial = std::max<int64_t>(0, settings.initial_delay.count());
  const int64_t increment = std::max<int64_t>(0, settings.delay_increment.count());
  const int64_t ceiling = std::max<int64_t>(initial, settings.max_delay.count());

  const uint64_t repeats = connection_count > 0 ? connection_count - 1 : 0;
  if (repeats == 0 || increment == 0) {
    return std::chrono::milliseconds(std::min(initial, ceiling));
  }

  // Headroom left before the ceiling; compare in the division domain so
  // increment * repeats is only computed when it cannot exceed it
  const uint64_t headroom = static_cast<uint64_t>(ceiling - initial);
  const uint64_t steps_to_ceiling = headroom / static_cast<uint64_t>(increment);
  if (repeats > steps_to_ceiling) {
    return std::chrono::milliseconds(ceiling);
  }

  return std::chrono::milliseconds(initial +
                                   increment * static_cast<int64_t>(repeats));
}

} // namespace tarpit
} // namespace deadlock

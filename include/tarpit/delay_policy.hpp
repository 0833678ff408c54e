// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "tarpit/config.hpp"
#include <chrono>
#include <cstdint>

namespace deadlock {
namespace tarpit {

/**
 * Pre-banner delay for an address's connection_count-th connection
 *
 *   min(max_delay, initial_delay + delay_increment * (connection_count - 1))
 *
 * Pure and deterministic. Saturates at max_delay for any count instead of
 * overflowing. A count of 0 is treated like a first offense.
 */
std::chrono::milliseconds ComputeDelay(uint64_t connection_count,
                                       const DelaySettings &settings);

} // namespace tarpit
} // namespace deadlock

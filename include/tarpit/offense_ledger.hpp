// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 OffenseLedger - per-source-address offense history

 Purpose
 - Count connection attempts per normalized IP address since process start
 - Provide the count that drives delay escalation
 - Serve point-in-time snapshots to the stats presenter

 Key responsibilities
 1. Record(): atomic increment-and-fetch on the connection hot path
 2. Snapshot()/TopOffenders(): copies ordered by offense count
 3. SweepStale(): optional age-based eviction (unbounded growth guard)

 Concurrency
 - Sharded map: one mutex per shard, so unrelated attackers rarely contend
 - Record() holds only the owning shard's lock; no I/O under any lock
 - In-memory only; a restart starts every address from scratch
*/

#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace deadlock {
namespace tarpit {

struct OffenseRecord {
  uint64_t connection_count{0};
  int64_t first_seen{0}; // Unix seconds
  int64_t last_seen{0};  // Unix seconds
};

class OffenseLedger {
public:
  using Entry = std::pair<std::string, OffenseRecord>;

  static constexpr size_t SHARD_COUNT = 64;

  OffenseLedger() = default;

  // Non-copyable: one instance is owned by the application and shared by reference
  OffenseLedger(const OffenseLedger&) = delete;
  OffenseLedger& operator=(const OffenseLedger&) = delete;

  /**
   * Record a new connection from address
   * @param address Source IP (normalized if it parses as an IP)
   * @param now Unix seconds stored as last_seen (first_seen on creation)
   * @return The post-increment record
   */
  OffenseRecord Record(const std::string& address, int64_t now);

  // Record() at util::GetTime()
  OffenseRecord Record(const std::string& address);

  std::optional<OffenseRecord> Get(const std::string& address) const;

  /**
   * Copy of all entries, ordered by connection_count descending then
   * address ascending. Each shard is copied under its own lock.
   */
  std::vector<Entry> Snapshot() const;

  // First n entries of Snapshot()
  std::vector<Entry> TopOffenders(size_t n) const;

  // Distinct addresses currently held
  size_t Size() const;

  // Record() calls since construction (not reduced by eviction)
  uint64_t TotalConnections() const {
    return total_connections_.load(std::memory_order_relaxed);
  }

  /**
   * Evict entries whose last_seen is older than now - max_age_seconds
   * @return Number of evicted addresses
   */
  size_t SweepStale(int64_t now, int64_t max_age_seconds);

  void Clear();

private:
  static std::string NormalizeKey(const std::string& address);

  util::ShardedThreadSafeMap<std::string, OffenseRecord, SHARD_COUNT> records_;
  std::atomic<uint64_t> total_connections_{0};
};

} // namespace tarpit
} // namespace deadlock

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace deadlock {
namespace util {

/**
 * ThreadSafeMap - Thread-safe wrapper around std::map or std::unordered_map
 *
 * Usage:
 *   ThreadSafeMap<uint64_t, SessionPtr> sessions_;
 *   sessions_.Insert(id, session);
 *
 *   // Read data without expensive copies
 *   sessions_.Read(id, [&](const SessionPtr& s) { ... });
 *
 *   // Insert-or-modify in one critical section
 *   auto count = counts_.Upsert(addr, [](int& c) { return ++c; });
 *
 * Design decisions:
 * - All operations are atomic (single lock per operation)
 * - Read() and Upsert() use callbacks to avoid copies and keep the
 *   lock scope explicit
 * - No iterator-based API to avoid lock lifetime issues
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    /**
     * Insert or update a key-value pair
     * Returns true if inserted, false if updated
     */
    bool Insert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    /**
     * Read value by key with a callback
     * Calls reader(const Value&) under lock if key exists
     * Returns true if key exists and was read, false otherwise
     */
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            reader(it->second);
            return true;
        }
        return false;
    }

    /**
     * Remove entry by key
     * Returns true if removed, false if key didn't exist
     */
    bool Erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * Remove every entry for which predicate(key, value) returns true
     * Returns the number of removed entries
     */
    template <typename Pred>
    size_t EraseIf(Pred&& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = map_.begin(); it != map_.end();) {
            if (predicate(it->first, it->second)) {
                it = map_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.clear();
    }

    /**
     * Get snapshot of all entries
     * Returns vector of key-value pairs (safe to iterate without lock)
     */
    std::vector<std::pair<Key, Value>> GetAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
    }

    /**
     * Append a snapshot of all entries to out (one lock acquisition)
     */
    void AppendTo(std::vector<std::pair<Key, Value>>& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        out.insert(out.end(), map_.begin(), map_.end());
    }

    /**
     * Atomic insert-or-modify
     * Default-constructs the value if key is absent, then calls
     * modifier(value) under the same lock and returns its result
     */
    template <typename Func>
    auto Upsert(const Key& key, Func&& modifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.try_emplace(key);
        return modifier(it->second);
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

/**
 * ShardedThreadSafeMap - N independently locked ThreadSafeMap shards
 *
 * A key always maps to the same shard (std::hash modulo N), so operations on
 * one key are serialized while operations on keys in different shards never
 * contend. Whole-map operations (GetAll, Size, EraseIf) visit the shards one
 * at a time: each shard is consistent, the result as a whole is not a single
 * atomic cut.
 */
template <typename Key, typename Value, size_t N = 32,
          typename Hash = std::hash<Key>>
class ShardedThreadSafeMap {
    static_assert(N > 0, "ShardedThreadSafeMap needs at least one shard");

public:
    ShardedThreadSafeMap() = default;

    ShardedThreadSafeMap(const ShardedThreadSafeMap&) = delete;
    ShardedThreadSafeMap& operator=(const ShardedThreadSafeMap&) = delete;

    template <typename Func>
    auto Upsert(const Key& key, Func&& modifier) {
        return ShardFor(key).Upsert(key, std::forward<Func>(modifier));
    }

    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        return ShardFor(key).Read(key, std::forward<Func>(reader));
    }

    bool Erase(const Key& key) { return ShardFor(key).Erase(key); }

    template <typename Pred>
    size_t EraseIf(Pred&& predicate) {
        size_t removed = 0;
        for (auto& shard : shards_) {
            removed += shard.EraseIf(predicate);
        }
        return removed;
    }

    size_t Size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard.Size();
        }
        return total;
    }

    void Clear() {
        for (auto& shard : shards_) {
            shard.Clear();
        }
    }

    std::vector<std::pair<Key, Value>> GetAll() const {
        std::vector<std::pair<Key, Value>> out;
        for (const auto& shard : shards_) {
            shard.AppendTo(out);
        }
        return out;
    }

    static constexpr size_t ShardCount() { return N; }

    size_t ShardIndex(const Key& key) const { return Hash{}(key) % N; }

private:
    ThreadSafeMap<Key, Value>& ShardFor(const Key& key) {
        return shards_[ShardIndex(key)];
    }
    const ThreadSafeMap<Key, Value>& ShardFor(const Key& key) const {
        return shards_[ShardIndex(key)];
    }

    std::array<ThreadSafeMap<Key, Value>, N> shards_;
};

} // namespace util
} // namespace deadlock

#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../non_copyable.hpp"
#include "value.hpp"

namespace kvs
{
    /// @brief Largest shard count computeCapacity will return
    inline constexpr uint32_t MAX_SHARD_COUNT = 1u << 30;

    /// @brief Smallest shard count used unless a single shard is requested
    inline constexpr uint32_t MIN_SHARD_COUNT = 16;

    /// @brief Rounds requested shard count up to a power of two, at least MIN_SHARD_COUNT
    uint32_t computeCapacity(int64_t param) noexcept;

    /// @brief Consumer for ShardedMap::forEach, return false to stop the iteration
    using Consumer = std::function<bool(const std::string& key, const Value& value)>;

    /// @brief Removed value and number of removed entries (0 or 1)
    struct RemoveResult {
        std::optional<Value> value;
        int result = 0;
    };

    struct Shard : NonCopyableOrMovable {
        std::unordered_map<std::string, Value> m;
        mutable std::shared_mutex mutex;

        /// @brief Picks an arbitrary key of this shard under a read lock
        /// @return key or std::nullopt when the shard is empty
        std::optional<std::string> randomKey(std::mt19937_64& rng) const;
    };

    /// @brief Shard locks taken by ShardedMap::rwLocks, released on destruction
    class ShardLocks {
        private:
            std::vector<std::unique_lock<std::shared_mutex>> writeLocks;
            std::vector<std::shared_lock<std::shared_mutex>> readLocks;
            friend class ShardedMap;
        public:
            ShardLocks() = default;
            ShardLocks(ShardLocks&&) noexcept = default;
            ShardLocks& operator=(ShardLocks&&) noexcept = default;

            size_t size() const noexcept { return writeLocks.size() + readLocks.size(); }
    };

    /// @brief Concurrent map split into a fixed number of shards, each guarded by its own reader/writer lock.
    /// Keys never move between shards, so there is no rehash across the whole table.
    class ShardedMap : NonCopyableOrMovable {
        private:
            std::vector<std::unique_ptr<Shard>> table;
            std::atomic<int32_t> count{0};
            uint32_t shardCount;

            void addCount() noexcept { count.fetch_add(1, std::memory_order_relaxed); }
            void decreaseCount() noexcept { count.fetch_sub(1, std::memory_order_relaxed); }

            static int putToShard(ShardedMap& dict, Shard& shard, const std::string& key, Value&& value);
            static int putIfAbsentToShard(ShardedMap& dict, Shard& shard, const std::string& key, Value&& value);
            static int putIfExistsToShard(Shard& shard, const std::string& key, Value&& value);
            static RemoveResult removeFromShard(ShardedMap& dict, Shard& shard, const std::string& key);
            static std::optional<Value> getFromShard(const Shard& shard, const std::string& key);

        public:
            /// @param shardCount requested number of shards, 1 keeps a single shard, otherwise rounded by computeCapacity
            /// @throws std::invalid_argument when shardCount < 1
            explicit ShardedMap(int64_t shardCount);

            uint32_t getShardCount() const noexcept { return shardCount; }

            /// @brief Index of the shard owning the key, always in [0, getShardCount())
            uint32_t shardIndex(std::string_view key) const noexcept;

            /// @throws std::out_of_range when index >= getShardCount()
            Shard& getShard(uint32_t index) const;

            std::optional<Value> get(const std::string& key) const;
            int put(const std::string& key, Value value);
            int putIfAbsent(const std::string& key, Value value);
            int putIfExists(const std::string& key, Value value);
            RemoveResult remove(const std::string& key);

            // Variants below expect the caller to hold the lock of the key's shard, see rwLocks
            std::optional<Value> getWithLock(const std::string& key) const;
            int putWithLock(const std::string& key, Value value);
            int putIfAbsentWithLock(const std::string& key, Value value);
            int putIfExistsWithLock(const std::string& key, Value value);
            RemoveResult removeWithLock(const std::string& key);

            /// @brief Locks shards of all given keys in ascending shard order.
            /// Shards owning a write key are locked exclusively, the others shared.
            ShardLocks rwLocks(const std::vector<std::string>& writeKeys, const std::vector<std::string>& readKeys) const;

            int len() const noexcept { return count.load(std::memory_order_relaxed); }

            /// @brief Visits entries shard by shard, holding the shard read lock during the visit.
            /// Returning false from the consumer stops the current shard and skips the remaining ones.
            void forEach(const Consumer& consumer) const;

            std::vector<std::string> keys() const;

            /// @brief Samples random keys, may return the same key more than once
            std::vector<std::string> randomKeys(int limit) const;

            /// @brief Samples distinct random keys.
            /// Keeps sampling until limit keys are found, bound limit by a recent len() when keys are being removed concurrently.
            std::vector<std::string> randomDistinctKeys(int limit) const;

            /// @brief Drops every entry
            void clear();
    };
}

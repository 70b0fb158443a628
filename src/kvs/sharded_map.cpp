#include "sharded_map.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include "../hash/hash.hpp"

using namespace kvs;

namespace {
    std::mt19937_64& threadRng() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        return rng;
    }
}

uint32_t kvs::computeCapacity(int64_t param) noexcept
{
    if (param <= MIN_SHARD_COUNT) {
        return MIN_SHARD_COUNT;
    }
    if (param >= MAX_SHARD_COUNT) {
        return MAX_SHARD_COUNT;
    }
    auto n = static_cast<uint32_t>(param - 1);
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    return n + 1;
}

std::optional<std::string> Shard::randomKey(std::mt19937_64& rng) const
{
    std::shared_lock lock(mutex);
    if (m.empty()) {
        return std::nullopt;
    }
    // unordered_map iteration order is stable, pick a random position instead of the first entry
    std::uniform_int_distribution<size_t> dist(0, m.size() - 1);
    auto it = m.begin();
    std::advance(it, dist(rng));
    return it->first;
}

ShardedMap::ShardedMap(int64_t requested)
{
    if (requested < 1) {
        throw std::invalid_argument("shard count must be positive, got " + std::to_string(requested));
    }
    shardCount = requested == 1 ? 1 : computeCapacity(requested);
    table.reserve(shardCount);
    for (uint32_t i = 0; i < shardCount; ++i) {
        table.emplace_back(std::make_unique<Shard>());
    }
}

uint32_t ShardedMap::shardIndex(std::string_view key) const noexcept
{
    return fnv32(key) & (shardCount - 1);
}

Shard& ShardedMap::getShard(uint32_t index) const
{
    if (index >= table.size()) {
        throw std::out_of_range("shard index " + std::to_string(index) + " is out of range, shard count is " + std::to_string(table.size()));
    }
    return *table[index];
}

std::optional<Value> ShardedMap::getFromShard(const Shard& shard, const std::string& key)
{
    auto it = shard.m.find(key);
    if (it == shard.m.end()) {
        return std::nullopt;
    }
    return it->second;
}

int ShardedMap::putToShard(ShardedMap& dict, Shard& shard, const std::string& key, Value&& value)
{
    auto [it, inserted] = shard.m.insert_or_assign(key, std::move(value));
    if (inserted) {
        dict.addCount();
        return 1;
    }
    return 0;
}

int ShardedMap::putIfAbsentToShard(ShardedMap& dict, Shard& shard, const std::string& key, Value&& value)
{
    auto [it, inserted] = shard.m.try_emplace(key, std::move(value));
    if (inserted) {
        dict.addCount();
        return 1;
    }
    return 0;
}

int ShardedMap::putIfExistsToShard(Shard& shard, const std::string& key, Value&& value)
{
    auto it = shard.m.find(key);
    if (it == shard.m.end()) {
        return 0;
    }
    it->second = std::move(value);
    return 1;
}

RemoveResult ShardedMap::removeFromShard(ShardedMap& dict, Shard& shard, const std::string& key)
{
    auto node = shard.m.extract(key);
    if (node.empty()) {
        return RemoveResult{std::nullopt, 0};
    }
    dict.decreaseCount();
    return RemoveResult{std::move(node.mapped()), 1};
}

std::optional<Value> ShardedMap::get(const std::string& key) const
{
    auto& shard = getShard(shardIndex(key));
    std::shared_lock lock(shard.mutex);
    return getFromShard(shard, key);
}

int ShardedMap::put(const std::string& key, Value value)
{
    auto& shard = getShard(shardIndex(key));
    std::unique_lock lock(shard.mutex);
    return putToShard(*this, shard, key, std::move(value));
}

int ShardedMap::putIfAbsent(const std::string& key, Value value)
{
    auto& shard = getShard(shardIndex(key));
    std::unique_lock lock(shard.mutex);
    return putIfAbsentToShard(*this, shard, key, std::move(value));
}

int ShardedMap::putIfExists(const std::string& key, Value value)
{
    auto& shard = getShard(shardIndex(key));
    std::unique_lock lock(shard.mutex);
    return putIfExistsToShard(shard, key, std::move(value));
}

RemoveResult ShardedMap::remove(const std::string& key)
{
    auto& shard = getShard(shardIndex(key));
    std::unique_lock lock(shard.mutex);
    return removeFromShard(*this, shard, key);
}

std::optional<Value> ShardedMap::getWithLock(const std::string& key) const
{
    return getFromShard(getShard(shardIndex(key)), key);
}

int ShardedMap::putWithLock(const std::string& key, Value value)
{
    return putToShard(*this, getShard(shardIndex(key)), key, std::move(value));
}

int ShardedMap::putIfAbsentWithLock(const std::string& key, Value value)
{
    return putIfAbsentToShard(*this, getShard(shardIndex(key)), key, std::move(value));
}

int ShardedMap::putIfExistsWithLock(const std::string& key, Value value)
{
    return putIfExistsToShard(getShard(shardIndex(key)), key, std::move(value));
}

RemoveResult ShardedMap::removeWithLock(const std::string& key)
{
    return removeFromShard(*this, getShard(shardIndex(key)), key);
}

ShardLocks ShardedMap::rwLocks(const std::vector<std::string>& writeKeys, const std::vector<std::string>& readKeys) const
{
    std::vector<std::pair<uint32_t, bool>> indices;
    indices.reserve(writeKeys.size() + readKeys.size());
    for (const auto& key : writeKeys) {
        indices.emplace_back(shardIndex(key), true);
    }
    for (const auto& key : readKeys) {
        indices.emplace_back(shardIndex(key), false);
    }
    // ascending index, write request first so it wins over a read of the same shard
    std::sort(indices.begin(), indices.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first != rhs.first ? lhs.first < rhs.first : lhs.second > rhs.second;
    });
    indices.erase(std::unique(indices.begin(), indices.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.first == rhs.first;
    }), indices.end());

    ShardLocks locks;
    for (const auto& [index, write] : indices) {
        auto& shard = getShard(index);
        if (write) {
            locks.writeLocks.emplace_back(shard.mutex);
        } else {
            locks.readLocks.emplace_back(shard.mutex);
        }
    }
    return locks;
}

void ShardedMap::forEach(const Consumer& consumer) const
{
    for (const auto& shard : table) {
        std::shared_lock lock(shard->mutex);
        for (const auto& [key, value] : shard->m) {
            if (!consumer(key, value)) {
                return;
            }
        }
    }
}

std::vector<std::string> ShardedMap::keys() const
{
    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(std::max(len(), 0)));
    forEach([&result](const std::string& key, const Value&) {
        result.push_back(key);
        return true;
    });
    return result;
}

std::vector<std::string> ShardedMap::randomKeys(int limit) const
{
    std::vector<std::string> result;
    if (limit <= 0) {
        return result;
    }
    result.reserve(static_cast<size_t>(limit));
    auto& rng = threadRng();
    std::uniform_int_distribution<uint32_t> pickShard(0, shardCount - 1);
    while (static_cast<int>(result.size()) < limit && len() > 0) {
        if (auto key = table[pickShard(rng)]->randomKey(rng)) {
            result.push_back(std::move(*key));
        }
    }
    return result;
}

std::vector<std::string> ShardedMap::randomDistinctKeys(int limit) const
{
    if (limit >= len()) {
        return keys();
    }
    if (limit <= 0) {
        return {};
    }

    std::unordered_set<std::string> found;
    found.reserve(static_cast<size_t>(limit));
    auto& rng = threadRng();
    std::uniform_int_distribution<uint32_t> pickShard(0, shardCount - 1);
    while (static_cast<int>(found.size()) < limit) {
        if (auto key = table[pickShard(rng)]->randomKey(rng)) {
            found.insert(std::move(*key));
        }
    }
    return std::vector<std::string>(found.begin(), found.end());
}

void ShardedMap::clear()
{
    std::vector<std::unique_lock<std::shared_mutex>> locks;
    locks.reserve(table.size());
    for (auto& shard : table) {
        locks.emplace_back(shard->mutex);
    }
    for (auto& shard : table) {
        std::unordered_map<std::string, Value>().swap(shard->m);
    }
    count.store(0, std::memory_order_relaxed);
}

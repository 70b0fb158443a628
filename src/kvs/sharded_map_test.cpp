#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "sharded_map.hpp"
#include "../hash/hash.hpp"
#include "../env.hpp"

using namespace kvs;

// Number of elements to test
const int NUM_ELEMENTS = getFromEnv<int>("NUM_ELEMENTS", false, 20000);

static std::string generateKey(int index) {
    return "key" + std::to_string(index);
}

static Value generateValue(int index) {
    return Value::fromString("value" + std::to_string(index));
}

TEST(HashTest, Fnv32KnownValues) {
    // offset basis for the empty key
    EXPECT_EQ(fnv32(""), 2166136261u);
    EXPECT_EQ(fnv32("a"), (2166136261u * 16777619u) ^ static_cast<uint32_t>('a'));
    EXPECT_EQ(fnv32("key1"), fnv32(std::string("key1")));
    EXPECT_NE(fnv32("key1"), fnv32("key2"));
}

TEST(ShardedMapTest, ComputeCapacity) {
    EXPECT_EQ(computeCapacity(-5), 16u);
    EXPECT_EQ(computeCapacity(0), 16u);
    EXPECT_EQ(computeCapacity(2), 16u);
    EXPECT_EQ(computeCapacity(16), 16u);
    EXPECT_EQ(computeCapacity(17), 32u);
    EXPECT_EQ(computeCapacity(32), 32u);
    EXPECT_EQ(computeCapacity(33), 64u);
    EXPECT_EQ(computeCapacity(1000), 1024u);
    EXPECT_EQ(computeCapacity(1024), 1024u);
    EXPECT_EQ(computeCapacity(int64_t{1} << 40), MAX_SHARD_COUNT);
}

TEST(ShardedMapTest, ShardCountRounding) {
    EXPECT_EQ(ShardedMap(1).getShardCount(), 1u);
    EXPECT_EQ(ShardedMap(2).getShardCount(), 16u);
    EXPECT_EQ(ShardedMap(100).getShardCount(), 128u);
}

TEST(ShardedMapTest, InvalidShardCountThrows) {
    EXPECT_THROW(ShardedMap(0), std::invalid_argument);
    EXPECT_THROW(ShardedMap(-1), std::invalid_argument);
}

TEST(ShardedMapTest, GetShardOutOfRangeThrows) {
    ShardedMap dict(16);
    EXPECT_NO_THROW(dict.getShard(15));
    EXPECT_THROW(dict.getShard(16), std::out_of_range);
}

TEST(ShardedMapTest, ShardIndexIsStableAndInRange) {
    ShardedMap dict(64);
    for (int i = 0; i < 1000; ++i) {
        auto key = generateKey(i);
        auto index = dict.shardIndex(key);
        EXPECT_LT(index, dict.getShardCount());
        EXPECT_EQ(index, dict.shardIndex(key));
        EXPECT_EQ(index, fnv32(key) & 63u);
    }

    ShardedMap single(1);
    EXPECT_EQ(single.shardIndex("anything"), 0u);
}

TEST(ShardedMapTest, PutReportsInsertionOnce) {
    ShardedMap dict(16);
    EXPECT_EQ(dict.put("a", Value::fromString("1")), 1);
    EXPECT_EQ(dict.put("a", Value::fromString("2")), 0);
    EXPECT_EQ(dict.put("a", Value::fromString("3")), 0);
    EXPECT_EQ(dict.len(), 1);

    auto value = dict.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->asString(), "3");
}

TEST(ShardedMapTest, GetMissing) {
    ShardedMap dict(16);
    EXPECT_FALSE(dict.get("missing").has_value());
}

TEST(ShardedMapTest, PutIfAbsent) {
    ShardedMap dict(16);
    EXPECT_EQ(dict.putIfAbsent("a", Value::fromString("1")), 1);
    EXPECT_EQ(dict.putIfAbsent("a", Value::fromString("2")), 0);
    EXPECT_EQ(dict.get("a")->asString(), "1");
    EXPECT_EQ(dict.len(), 1);
}

TEST(ShardedMapTest, PutIfExists) {
    ShardedMap dict(16);
    EXPECT_EQ(dict.putIfExists("a", Value::fromString("1")), 0);
    EXPECT_FALSE(dict.get("a").has_value());
    EXPECT_EQ(dict.len(), 0);

    dict.put("a", Value::fromString("1"));
    EXPECT_EQ(dict.putIfExists("a", Value::fromString("2")), 1);
    EXPECT_EQ(dict.get("a")->asString(), "2");
    EXPECT_EQ(dict.len(), 1);
}

TEST(ShardedMapTest, RemoveTwice) {
    ShardedMap dict(16);
    dict.put("a", Value::fromInteger(42));

    auto first = dict.remove("a");
    EXPECT_EQ(first.result, 1);
    ASSERT_TRUE(first.value.has_value());
    EXPECT_EQ(first.value->asInteger(), 42);
    EXPECT_EQ(dict.len(), 0);

    auto second = dict.remove("a");
    EXPECT_EQ(second.result, 0);
    EXPECT_FALSE(second.value.has_value());
    EXPECT_EQ(dict.len(), 0);
}

TEST(ShardedMapTest, AddAndRetrieveElements) {
    ShardedMap dict(1024);
    for (int i = 0; i < NUM_ELEMENTS; ++i) {
        ASSERT_EQ(dict.put(generateKey(i), generateValue(i)), 1);
    }
    ASSERT_EQ(dict.len(), NUM_ELEMENTS);
    for (int i = 0; i < NUM_ELEMENTS; ++i) {
        auto value = dict.get(generateKey(i));
        ASSERT_TRUE(value.has_value());
        ASSERT_EQ(*value, generateValue(i));
    }
}

TEST(ShardedMapTest, ConcurrentPutsCountDistinctKeys) {
    ShardedMap dict(64);
    constexpr int numThreads = 8;
    std::vector<std::thread> workers;
    // every thread writes the full key range, overlapping with the others
    for (int t = 0; t < numThreads; ++t) {
        workers.emplace_back([&dict, t] {
            for (int i = 0; i < NUM_ELEMENTS; ++i) {
                dict.put(generateKey(i), Value::fromInteger(t));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(dict.len(), NUM_ELEMENTS);
    EXPECT_EQ(static_cast<int>(dict.keys().size()), NUM_ELEMENTS);
}

TEST(ShardedMapTest, ConcurrentPutAndRemoveSettles) {
    ShardedMap dict(16);
    std::thread writer([&dict] {
        for (int i = 0; i < NUM_ELEMENTS; ++i) {
            dict.put(generateKey(i), generateValue(i));
        }
    });
    std::thread remover([&dict] {
        for (int i = 0; i < NUM_ELEMENTS; i += 2) {
            while (dict.remove(generateKey(i)).result == 0) {
                std::this_thread::yield();
            }
        }
    });
    writer.join();
    remover.join();
    EXPECT_EQ(dict.len(), NUM_ELEMENTS / 2);
    EXPECT_FALSE(dict.get(generateKey(0)).has_value());
    EXPECT_TRUE(dict.get(generateKey(1)).has_value());
}

TEST(ShardedMapTest, ForEachVisitsEverything) {
    ShardedMap dict(16);
    for (int i = 0; i < 100; ++i) {
        dict.put(generateKey(i), generateValue(i));
    }
    std::set<std::string> seen;
    dict.forEach([&seen](const std::string& key, const Value&) {
        seen.insert(key);
        return true;
    });
    EXPECT_EQ(seen.size(), 100u);
}

TEST(ShardedMapTest, ForEachStopsOnFalse) {
    ShardedMap dict(16);
    for (int i = 0; i < 100; ++i) {
        dict.put(generateKey(i), generateValue(i));
    }
    int visited = 0;
    dict.forEach([&visited](const std::string&, const Value&) {
        ++visited;
        return visited < 5;
    });
    EXPECT_EQ(visited, 5);
}

TEST(ShardedMapTest, Keys) {
    ShardedMap dict(16);
    for (int i = 0; i < 50; ++i) {
        dict.put(generateKey(i), generateValue(i));
    }
    auto keys = dict.keys();
    std::sort(keys.begin(), keys.end());
    std::vector<std::string> expected;
    for (int i = 0; i < 50; ++i) {
        expected.push_back(generateKey(i));
    }
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(keys, expected);
}

TEST(ShardedMapTest, RandomKeys) {
    ShardedMap dict(16);
    EXPECT_TRUE(dict.randomKeys(10).empty());

    for (int i = 0; i < 5; ++i) {
        dict.put(generateKey(i), generateValue(i));
    }
    auto keys = dict.randomKeys(20);
    ASSERT_EQ(keys.size(), 20u);
    for (const auto& key : keys) {
        EXPECT_TRUE(dict.get(key).has_value());
    }
}

TEST(ShardedMapTest, RandomDistinctKeys) {
    ShardedMap dict(16);
    for (int i = 0; i < 100; ++i) {
        dict.put(generateKey(i), generateValue(i));
    }

    auto some = dict.randomDistinctKeys(10);
    ASSERT_EQ(some.size(), 10u);
    std::set<std::string> unique(some.begin(), some.end());
    EXPECT_EQ(unique.size(), 10u);
    for (const auto& key : some) {
        EXPECT_TRUE(dict.get(key).has_value());
    }

    auto all = dict.randomDistinctKeys(1000);
    EXPECT_EQ(all.size(), 100u);
}

TEST(ShardedMapTest, Clear) {
    ShardedMap dict(16);
    for (int i = 0; i < 100; ++i) {
        dict.put(generateKey(i), generateValue(i));
    }
    dict.clear();
    EXPECT_EQ(dict.len(), 0);
    EXPECT_TRUE(dict.keys().empty());
    EXPECT_FALSE(dict.get(generateKey(1)).has_value());
    EXPECT_EQ(dict.put(generateKey(1), generateValue(1)), 1);
    EXPECT_EQ(dict.len(), 1);
}

TEST(ShardedMapTest, WithLockVariants) {
    ShardedMap dict(16);
    std::vector<std::string> keys{"a", "b", "c"};
    {
        auto locks = dict.rwLocks(keys, {});
        EXPECT_EQ(dict.putWithLock("a", Value::fromString("1")), 1);
        EXPECT_EQ(dict.putWithLock("a", Value::fromString("2")), 0);
        EXPECT_EQ(dict.putIfAbsentWithLock("b", Value::fromString("3")), 1);
        EXPECT_EQ(dict.putIfAbsentWithLock("b", Value::fromString("4")), 0);
        EXPECT_EQ(dict.putIfExistsWithLock("c", Value::fromString("5")), 0);
        EXPECT_EQ(dict.getWithLock("a")->asString(), "2");
        EXPECT_EQ(dict.removeWithLock("b").result, 1);
        EXPECT_EQ(dict.removeWithLock("b").result, 0);
    }
    // locks are released, regular operations work again
    EXPECT_EQ(dict.get("a")->asString(), "2");
    EXPECT_EQ(dict.len(), 1);
}

TEST(ShardedMapTest, RwLocksDeduplicatesShards) {
    ShardedMap dict(1);
    auto locks = dict.rwLocks({"a", "b"}, {"c"});
    EXPECT_EQ(locks.size(), 1u);
}

TEST(ShardedMapTest, RwLocksBlocksWriters) {
    ShardedMap dict(16);
    std::atomic<bool> written{false};
    std::thread writer;
    {
        auto locks = dict.rwLocks({"a"}, {});
        writer = std::thread([&dict, &written] {
            dict.put("a", Value::fromString("late"));
            written = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(written.load());
        dict.putWithLock("a", Value::fromString("early"));
    }
    writer.join();
    EXPECT_TRUE(written.load());
    EXPECT_EQ(dict.get("a")->asString(), "late");
}

TEST(ValueTest, KindChecks) {
    auto text = Value::fromString("abc");
    auto number = Value::fromInteger(-7);
    auto packed = Value::fromCompressed("gz", 10);

    EXPECT_EQ(text.kind(), ValueKind::String);
    EXPECT_EQ(number.kind(), ValueKind::Integer);
    EXPECT_EQ(packed.kind(), ValueKind::Compressed);

    EXPECT_EQ(text.asString(), "abc");
    EXPECT_EQ(number.asInteger(), -7);
    EXPECT_EQ(packed.asCompressed().originalSize, 10u);

    EXPECT_THROW(text.asInteger(), WrongKindError);
    EXPECT_THROW(number.asString(), WrongKindError);
    EXPECT_THROW(packed.asString(), WrongKindError);
    EXPECT_THROW(text.asCompressed(), WrongKindError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

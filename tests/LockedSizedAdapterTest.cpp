#include <gtest/gtest.h>
#include <cachebench/adapters/LockedSizedAdapter.hpp>
#include <string>
#include <thread>
#include <vector>

using SizedAdapter = LockedSizedAdapter<size_t, std::string>;

TEST(LockedSizedAdapterTest, ConstructorThrowsOnZeroCapacity) {
    EXPECT_THROW(SizedAdapter(0), std::invalid_argument);
}

TEST(LockedSizedAdapterTest, SetThenGet) {
    SizedAdapter cache(4);

    cache.setKey(7, "seven");

    auto value = cache.getKey(7);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "seven");
    EXPECT_FALSE(cache.getKey(8).has_value());
}

TEST(LockedSizedAdapterTest, DefaultElasticity) {
    SizedAdapter cache(4);
    EXPECT_EQ(cache.elasticity(), SizedAdapter::kDefaultElasticity);
}

TEST(LockedSizedAdapterTest, GrowsPastCapacityWithinElasticity) {
    SizedAdapter cache(4, 2);

    for (size_t key = 1; key <= 5; ++key) {
        cache.setKey(key, std::to_string(key));
    }

    // 5 < 4 + 2, обрезки ещё не было
    EXPECT_EQ(cache.size(), 5);
    EXPECT_TRUE(cache.getKey(1).has_value());
}

TEST(LockedSizedAdapterTest, PrunesBackAfterElasticityExceeded) {
    SizedAdapter cache(4, 2);

    for (size_t key = 1; key <= 7; ++key) {
        cache.setKey(key, std::to_string(key));
    }

    EXPECT_GE(cache.size(), 4);
    EXPECT_LE(cache.size(), 6);
    EXPECT_FALSE(cache.getKey(1).has_value());
    EXPECT_TRUE(cache.getKey(7).has_value());
}

TEST(LockedSizedAdapterTest, Metadata) {
    SizedAdapter cache(16);

    EXPECT_EQ(cache.capacity(), 16);
    EXPECT_EQ(cache.replacementPolicy(), "elastic LRU");
    EXPECT_FALSE(cache.isThreadSafe());
}

TEST(LockedSizedAdapterTest, ConcurrentWritesAreAllVisible) {
    SizedAdapter cache(1000);

    const int numThreads = 4;
    const int opsPerThread = 250;
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&cache, t, opsPerThread]() {
            for (int i = 0; i < opsPerThread; ++i) {
                size_t key = static_cast<size_t>(t * opsPerThread + i);
                cache.setKey(key, std::to_string(key));
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(cache.size(), numThreads * opsPerThread);
    for (size_t key = 0; key < 1000; ++key) {
        auto value = cache.getKey(key);
        ASSERT_TRUE(value.has_value()) << "key " << key;
        EXPECT_EQ(value.value(), std::to_string(key));
    }
}

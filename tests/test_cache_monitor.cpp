#include "loopguard/memory/array_cache.h"
#include "loopguard/memory/container_cache.h"

#include <gtest/gtest.h>

#include <deque>
#include <map>
#include <string>
#include <vector>

using namespace loopguard;

// ============================================================================
// ArrayCache
// ============================================================================

TEST(ArrayCacheTest, SizeIsKeyPlusValueLength) {
    ArrayCache cache;
    cache.set("user:1", "alice");      // 6 + 5
    cache.set("user:2", "bob");        // 6 + 3

    EXPECT_EQ(cache.count(), 2u);
    EXPECT_EQ(cache.size_bytes(), 20u);

    cache.set("user:1", "alexandra");  // value grows by 4
    EXPECT_EQ(cache.size_bytes(), 24u);
    EXPECT_EQ(cache.count(), 2u);

    EXPECT_TRUE(cache.remove("user:2"));
    EXPECT_FALSE(cache.remove("user:2"));
    EXPECT_EQ(cache.size_bytes(), 15u);
}

TEST(ArrayCacheTest, HitRateCountsLookups) {
    ArrayCache cache;
    cache.set("k", "v");

    EXPECT_EQ(cache.get("k"), "v");
    EXPECT_EQ(cache.get("k"), "v");
    EXPECT_FALSE(cache.get("missing").has_value());

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 2u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_NEAR(stats.hit_rate, 2.0 / 3.0, 1e-9);
    EXPECT_EQ(stats.count, 1u);
    EXPECT_EQ(stats.size, 2u);
}

TEST(ArrayCacheTest, EmptyCacheHasZeroHitRate) {
    ArrayCache cache;
    EXPECT_EQ(cache.stats().hit_rate, 0.0);
}

TEST(ArrayCacheTest, CleanEvictsOldestFirstUntilTargetMet) {
    ArrayCache cache;
    for (int i = 0; i < 8; ++i) {
        cache.set("k" + std::to_string(i), std::string(98, 'x'));   // 100 bytes each
    }
    ASSERT_EQ(cache.size_bytes(), 800u);

    cache.clean(450);

    EXPECT_LE(cache.size_bytes(), 450u);
    EXPECT_FALSE(cache.has("k0"));
    EXPECT_FALSE(cache.has("k1"));
    EXPECT_TRUE(cache.has("k7"));
}

TEST(ArrayCacheTest, OverwriteKeepsInsertionPosition) {
    ArrayCache cache;
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("a", "3");

    cache.clean(2);   // drops one entry: the oldest is still "a"

    EXPECT_FALSE(cache.has("a"));
    EXPECT_TRUE(cache.has("b"));
}

TEST(ArrayCacheTest, CleanToZeroEmptiesCache) {
    ArrayCache cache;
    cache.set("a", "1");
    cache.set("b", "2");

    cache.clean(0);
    EXPECT_EQ(cache.count(), 0u);
    EXPECT_EQ(cache.size_bytes(), 0u);
}

TEST(ArrayCacheTest, ClearDropsEverything) {
    ArrayCache cache;
    cache.set("a", "1");
    cache.clear();
    EXPECT_EQ(cache.count(), 0u);
    EXPECT_EQ(cache.size_bytes(), 0u);
    EXPECT_FALSE(cache.has("a"));
}

// ============================================================================
// ContainerCache
// ============================================================================

TEST(ContainerCacheTest, DefaultSizeUsesElementSize) {
    std::vector<int> values{1, 2, 3, 4};
    ContainerCache<std::vector<int>> cache(values);

    EXPECT_EQ(cache.size_bytes(), 4 * sizeof(int));
    EXPECT_EQ(cache.stats().count, 4u);
}

TEST(ContainerCacheTest, CleanErasesFromFront) {
    std::deque<int> queue{1, 2, 3, 4, 5};
    ContainerCache<std::deque<int>> cache(queue);

    cache.clean(2 * sizeof(int));

    ASSERT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.front(), 4);
}

TEST(ContainerCacheTest, EstimatorOverridesSize) {
    std::map<std::string, std::string> sessions{{"a", std::string(1000, 's')}, {"b", "tiny"}};
    ContainerCache<std::map<std::string, std::string>> cache(sessions, [](const auto& m) {
        size_t total = 0;
        for (const auto& [k, v] : m) total += k.size() + v.size();
        return total;
    });

    EXPECT_EQ(cache.size_bytes(), 1006u);
    cache.clean(100);
    EXPECT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions.count("b"), 1u);

    cache.clear();
    EXPECT_TRUE(sessions.empty());
}

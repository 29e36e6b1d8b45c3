/**
 * Unit tests for the LRU attribute cache
 */

#include "layout/AttributeCache.h"

#include <gtest/gtest.h>

namespace {
CachedLayout layoutOfHeight(int height) {
    CachedLayout layout;
    layout.cellSize = {100, height};
    return layout;
}
} // namespace

TEST(AttributeCacheTest, LookupReturnsStoredLayout) {
    AttributeCache cache(4);
    cache.store("a", 1, layoutOfHeight(10));

    const CachedLayout *found = cache.lookup("a", 1);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->cellSize.height, 10);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 0u);
}

TEST(AttributeCacheTest, FingerprintMismatchDropsEntry) {
    AttributeCache cache(4);
    cache.store("a", 1, layoutOfHeight(10));

    EXPECT_EQ(cache.lookup("a", 2), nullptr);
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_EQ(cache.lookup("a", 1), nullptr);
    EXPECT_EQ(cache.misses(), 2u);
}

TEST(AttributeCacheTest, EvictsLeastRecentlyUsed) {
    AttributeCache cache(2);
    cache.store("a", 1, layoutOfHeight(10));
    cache.store("b", 1, layoutOfHeight(20));

    // Touch a so b becomes the eviction candidate
    ASSERT_NE(cache.lookup("a", 1), nullptr);
    cache.store("c", 1, layoutOfHeight(30));

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_EQ(cache.size(), 2u);
}

TEST(AttributeCacheTest, StoreReplacesExistingEntry) {
    AttributeCache cache(2);
    cache.store("a", 1, layoutOfHeight(10));
    cache.store("a", 2, layoutOfHeight(15));

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.lookup("a", 1), nullptr);

    cache.store("a", 2, layoutOfHeight(15));
    const CachedLayout *found = cache.lookup("a", 2);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->cellSize.height, 15);
}

TEST(AttributeCacheTest, ZeroCapacityStoresNothing) {
    AttributeCache cache(0);
    cache.store("a", 1, layoutOfHeight(10));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.lookup("a", 1), nullptr);
}

TEST(AttributeCacheTest, ShrinkingEvictsOldest) {
    AttributeCache cache(3);
    cache.store("a", 1, layoutOfHeight(10));
    cache.store("b", 1, layoutOfHeight(20));
    cache.store("c", 1, layoutOfHeight(30));

    cache.setCapacity(1);
    EXPECT_EQ(cache.capacity(), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains("c"));
}

TEST(AttributeCacheTest, InvalidateAndCounters) {
    AttributeCache cache(3);
    cache.store("a", 1, layoutOfHeight(10));
    cache.store("b", 1, layoutOfHeight(20));

    cache.invalidate("a");
    cache.invalidate("missing");
    EXPECT_EQ(cache.size(), 1u);

    cache.lookup("b", 1);
    cache.lookup("a", 1);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);

    cache.invalidateAll();
    cache.resetCounters();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.hits(), 0u);
    EXPECT_EQ(cache.misses(), 0u);
}

#include <gtest/gtest.h>
#include "kgstore/storage/result_cache.h"
#include <chrono>
#include <string>
#include <thread>

namespace kgstore {
namespace storage {
namespace test {

namespace {

core::KnowledgeGraph GraphOf(const std::string& name) {
    core::KnowledgeGraph graph;
    graph.entities.emplace_back(name, "person");
    return graph;
}

core::ResultCacheConfig SmallConfig(size_t capacity) {
    core::ResultCacheConfig config;
    config.capacity = capacity;
    return config;
}

}  // namespace

// ============================================================================
// Basic Functionality Tests
// ============================================================================

TEST(ResultCacheTest, PutAndGet) {
    ResultCache cache;
    EXPECT_TRUE(cache.put("k", GraphOf("alice")));
    EXPECT_EQ(cache.size(), 1u);

    auto graph = cache.get_as<core::KnowledgeGraph>("k");
    ASSERT_TRUE(graph.has_value());
    ASSERT_EQ(graph->entities.size(), 1u);
    EXPECT_EQ(graph->entities[0].name, "alice");
    EXPECT_EQ(cache.hit_count(), 1u);
}

TEST(ResultCacheTest, MissOnUnknownKeyOrWrongShape) {
    ResultCache cache;
    EXPECT_FALSE(cache.get_as<core::KnowledgeGraph>("absent").has_value());
    EXPECT_EQ(cache.miss_count(), 1u);

    cache.put("stats", std::vector<core::EntityTypeStats>{});
    EXPECT_FALSE(cache.get_as<core::KnowledgeGraph>("stats").has_value());
    EXPECT_TRUE(cache.get_as<std::vector<core::EntityTypeStats>>("stats").has_value());
}

TEST(ResultCacheTest, PutReplacesExistingKey) {
    ResultCache cache;
    cache.put("k", GraphOf("alice"));
    cache.put("k", GraphOf("bob"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get_as<core::KnowledgeGraph>("k")->entities[0].name, "bob");
}

// ============================================================================
// Key Tests
// ============================================================================

TEST(ResultCacheTest, MakeKeyNormalizesWhitespace) {
    EXPECT_EQ(ResultCache::NormalizeSql("  SELECT  *\n FROM\tentities  "), "SELECT * FROM entities");
    EXPECT_EQ(ResultCache::MakeKey("SELECT  1", {}), ResultCache::MakeKey("SELECT 1", {}));
}

TEST(ResultCacheTest, MakeKeyDistinguishesParameters) {
    const std::string sql = "SELECT * FROM entities WHERE name = ?";
    EXPECT_EQ(ResultCache::MakeKey(sql, {std::string("a")}),
              ResultCache::MakeKey(sql, {std::string("a")}));
    EXPECT_NE(ResultCache::MakeKey(sql, {std::string("a")}),
              ResultCache::MakeKey(sql, {std::string("b")}));
    EXPECT_NE(ResultCache::MakeKey(sql, {int64_t(1)}), ResultCache::MakeKey(sql, {1.0}));
    EXPECT_EQ(ResultCache::MakeKey(sql, {}).rfind("SELECT * FROM entities WHERE name = ?#", 0), 0u);
}

// ============================================================================
// Expiry Tests
// ============================================================================

TEST(ResultCacheTest, EntryExpiresAfterTtl) {
    ResultCache cache;
    cache.put("short", GraphOf("alice"), std::chrono::milliseconds(10));
    cache.put("long", GraphOf("bob"));

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(cache.get_as<core::KnowledgeGraph>("short").has_value());
    EXPECT_TRUE(cache.get_as<core::KnowledgeGraph>("long").has_value());
    EXPECT_EQ(cache.size(), 1u);
}

TEST(ResultCacheTest, CleanupExpiredRemovesAll) {
    ResultCache cache;
    for (int i = 0; i < 5; ++i) {
        cache.put("k" + std::to_string(i), GraphOf("x"), std::chrono::milliseconds(5));
    }
    cache.put("keep", GraphOf("y"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_EQ(cache.cleanup_expired(), 5u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(ResultCacheTest, MaybeCleanupIsThrottled) {
    core::ResultCacheConfig config;
    config.cleanup_interval = std::chrono::milliseconds(20);
    ResultCache cache(config);

    EXPECT_FALSE(cache.maybe_cleanup());
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(cache.maybe_cleanup());
    EXPECT_FALSE(cache.maybe_cleanup());
}

// ============================================================================
// Eviction Tests
// ============================================================================

TEST(ResultCacheTest, OverflowEvictsOldestDownToTarget) {
    ResultCache cache(SmallConfig(10));
    for (int i = 0; i < 10; ++i) {
        cache.put("k" + std::to_string(i), GraphOf("x"));
    }
    EXPECT_EQ(cache.size(), 10u);

    // Eviction runs down to 90% of capacity, then the new entry is inserted
    cache.put("new", GraphOf("y"));
    EXPECT_EQ(cache.size(), 10u);
    EXPECT_EQ(cache.eviction_count(), 1u);
    EXPECT_FALSE(cache.get_as<core::KnowledgeGraph>("k0").has_value());
    EXPECT_TRUE(cache.get_as<core::KnowledgeGraph>("k1").has_value());
    EXPECT_TRUE(cache.get_as<core::KnowledgeGraph>("new").has_value());
}

TEST(ResultCacheTest, OverflowPrefersExpiredEntries) {
    ResultCache cache(SmallConfig(3));
    cache.put("old", GraphOf("a"));
    cache.put("stale", GraphOf("b"), std::chrono::milliseconds(5));
    cache.put("fresh", GraphOf("c"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    cache.put("new", GraphOf("d"));
    EXPECT_EQ(cache.eviction_count(), 0u);
    EXPECT_TRUE(cache.get_as<core::KnowledgeGraph>("old").has_value());
    EXPECT_TRUE(cache.get_as<core::KnowledgeGraph>("new").has_value());
}

// ============================================================================
// Invalidation Tests
// ============================================================================

TEST(ResultCacheTest, InvalidatePattern) {
    ResultCache cache;
    cache.put("search:alice", GraphOf("alice"));
    cache.put("search:bob", GraphOf("bob"));
    cache.put("SELECT ... FROM entity_type_stats#1", std::vector<core::EntityTypeStats>{});

    EXPECT_EQ(cache.invalidate("_type_stats"), 1u);
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.invalidate("search:"), 2u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(ResultCacheTest, InvalidateAllBumpsGeneration) {
    ResultCache cache;
    cache.put("a", GraphOf("a"));
    uint64_t before = cache.generation();

    cache.invalidate_all();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_GT(cache.generation(), before);
}

TEST(ResultCacheTest, StalePutIsDiscarded) {
    ResultCache cache;
    uint64_t observed = cache.generation();

    // A write commits between the read and the put
    cache.invalidate_all();

    EXPECT_FALSE(cache.put("search:alice", GraphOf("alice"), std::nullopt, observed));
    EXPECT_EQ(cache.size(), 0u);

    EXPECT_TRUE(cache.put("search:alice", GraphOf("alice"), std::nullopt, cache.generation()));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(ResultCacheTest, StatsReport) {
    ResultCache cache;
    EXPECT_NE(cache.stats().find("ResultCache Stats"), std::string::npos);
}

}  // namespace test
}  // namespace storage
}  // namespace kgstore

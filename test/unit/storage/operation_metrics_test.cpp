#include <gtest/gtest.h>
#include "kgstore/storage/operation_metrics.h"
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kgstore {
namespace storage {
namespace test {

using std::chrono::milliseconds;

TEST(OperationMetricsTest, StartsEmpty) {
    OperationMetrics metrics;
    OperationStats stats = metrics.snapshot(OperationKind::SEARCH_NODES);
    EXPECT_EQ(stats.kind, OperationKind::SEARCH_NODES);
    EXPECT_EQ(stats.count, 0u);
    EXPECT_DOUBLE_EQ(stats.avg_duration_ms, 0.0);
    EXPECT_DOUBLE_EQ(stats.p95_ms, 0.0);
    EXPECT_DOUBLE_EQ(stats.cache_hit_rate, 0.0);
    EXPECT_TRUE(metrics.snapshot_all().empty());
}

TEST(OperationMetricsTest, RecordsCountsAndErrors) {
    OperationMetrics metrics;
    metrics.record(OperationKind::CREATE_ENTITIES, milliseconds(2), true);
    metrics.record(OperationKind::CREATE_ENTITIES, milliseconds(4), false);

    OperationStats stats = metrics.snapshot(OperationKind::CREATE_ENTITIES);
    EXPECT_EQ(stats.count, 2u);
    EXPECT_EQ(stats.errors, 1u);
    EXPECT_DOUBLE_EQ(stats.avg_duration_ms, 3.0);
    EXPECT_EQ(stats.cache_hits + stats.cache_misses, 0u);
}

TEST(OperationMetricsTest, CacheHitRate) {
    OperationMetrics metrics;
    metrics.record(OperationKind::READ_GRAPH, milliseconds(1), true, false);
    metrics.record(OperationKind::READ_GRAPH, milliseconds(1), true, true);
    metrics.record(OperationKind::READ_GRAPH, milliseconds(1), true, true);
    metrics.record(OperationKind::READ_GRAPH, milliseconds(1), true, true);

    OperationStats stats = metrics.snapshot(OperationKind::READ_GRAPH);
    EXPECT_EQ(stats.cache_hits, 3u);
    EXPECT_EQ(stats.cache_misses, 1u);
    EXPECT_DOUBLE_EQ(stats.cache_hit_rate, 0.75);
}

TEST(OperationMetricsTest, PercentilesUseNearestRank) {
    OperationMetrics metrics;
    for (int i = 1; i <= 100; ++i) {
        metrics.record(OperationKind::OPEN_NODES, milliseconds(i), true);
    }
    OperationStats stats = metrics.snapshot(OperationKind::OPEN_NODES);
    EXPECT_DOUBLE_EQ(stats.p95_ms, 95.0);
    EXPECT_DOUBLE_EQ(stats.p99_ms, 99.0);
    EXPECT_DOUBLE_EQ(stats.avg_duration_ms, 50.5);
}

TEST(OperationMetricsTest, PercentilesCoverWindowOnly) {
    OperationMetrics metrics(10);
    for (int i = 0; i < 50; ++i) {
        metrics.record(OperationKind::OPEN_NODES, milliseconds(1000), true);
    }
    for (int i = 0; i < 10; ++i) {
        metrics.record(OperationKind::OPEN_NODES, milliseconds(1), true);
    }
    OperationStats stats = metrics.snapshot(OperationKind::OPEN_NODES);
    EXPECT_EQ(stats.count, 60u);
    EXPECT_DOUBLE_EQ(stats.p99_ms, 1.0);
    EXPECT_GT(stats.avg_duration_ms, 800.0);
}

TEST(OperationMetricsTest, TimerRecordsOnDestruction) {
    OperationMetrics metrics;
    {
        auto timer = metrics.start(OperationKind::DELETE_ENTITIES);
        std::this_thread::sleep_for(milliseconds(2));
        timer.set_success(true);
    }
    {
        auto timer = metrics.start(OperationKind::DELETE_ENTITIES);
        timer.set_cache_hit(true);
    }

    OperationStats stats = metrics.snapshot(OperationKind::DELETE_ENTITIES);
    EXPECT_EQ(stats.count, 2u);
    EXPECT_EQ(stats.errors, 1u);  // Success never set on the second
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_GE(stats.p99_ms, 2.0);
}

TEST(OperationMetricsTest, MovedTimerRecordsOnce) {
    OperationMetrics metrics;
    {
        auto first = metrics.start(OperationKind::MAINTENANCE);
        OperationMetrics::Timer second(std::move(first));
        second.set_success(true);
    }
    EXPECT_EQ(metrics.snapshot(OperationKind::MAINTENANCE).count, 1u);
}

TEST(OperationMetricsTest, SnapshotAllListsRecordedKinds) {
    OperationMetrics metrics;
    metrics.record(OperationKind::MAINTENANCE, milliseconds(1), true);
    metrics.record(OperationKind::CREATE_ENTITIES, milliseconds(1), true);

    auto all = metrics.snapshot_all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].kind, OperationKind::CREATE_ENTITIES);
    EXPECT_EQ(all[1].kind, OperationKind::MAINTENANCE);

    metrics.reset();
    EXPECT_TRUE(metrics.snapshot_all().empty());
}

TEST(OperationMetricsTest, KindNamesAreDistinct) {
    std::set<std::string> names;
    for (size_t i = 0; i < kOperationKindCount; ++i) {
        names.insert(OperationKindName(static_cast<OperationKind>(i)));
    }
    EXPECT_EQ(names.size(), kOperationKindCount);
    EXPECT_STREQ(OperationKindName(OperationKind::SEARCH_NODES), "search_nodes");
}

TEST(OperationMetricsTest, ConcurrentRecording) {
    OperationMetrics metrics(100);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&metrics] {
            for (int i = 0; i < 500; ++i) {
                metrics.record(OperationKind::SEARCH_NODES, milliseconds(1), i % 10 != 0,
                               i % 2 == 0);
            }
        });
    }
    for (auto& t : threads) t.join();

    OperationStats stats = metrics.snapshot(OperationKind::SEARCH_NODES);
    EXPECT_EQ(stats.count, 2000u);
    EXPECT_EQ(stats.errors, 200u);
    EXPECT_EQ(stats.cache_hits, 1000u);
    EXPECT_EQ(stats.cache_misses, 1000u);
}

}  // namespace test
}  // namespace storage
}  // namespace kgstore

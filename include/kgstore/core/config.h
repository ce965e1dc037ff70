#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "kgstore/core/types.h"

namespace kgstore {
namespace core {

/**
 * @brief Source of "now" for versioning and partitioning
 *
 * Defaults to the wall clock; tests inject a controllable one.
 */
using Clock = std::function<Timestamp()>;

/**
 * @brief Configuration for the bounded connection pool
 */
struct PoolConfig {
    size_t max_connections;                       // Upper bound N on live handles
    std::chrono::milliseconds acquire_timeout;    // Default deadline for acquire()
    int64_t cache_size_kib;                       // PRAGMA cache_size (as -KiB)
    std::chrono::milliseconds busy_timeout;       // sqlite3_busy_timeout per handle

    PoolConfig()
        : max_connections(10),
          acquire_timeout(std::chrono::seconds(5)),
          cache_size_kib(64000),
          busy_timeout(std::chrono::seconds(5)) {}

    static PoolConfig Default() { return PoolConfig(); }
};

/**
 * @brief Configuration for the prepared statement cache
 */
struct StatementCacheConfig {
    size_t capacity;

    StatementCacheConfig() : capacity(100) {}

    static StatementCacheConfig Default() { return StatementCacheConfig(); }
};

/**
 * @brief Configuration for the query result cache
 */
struct ResultCacheConfig {
    size_t capacity;
    std::chrono::milliseconds default_ttl;
    std::chrono::milliseconds cleanup_interval;   // Minimum spacing of lazy cleanup passes
    double eviction_target;                       // Fraction of capacity kept after overflow eviction

    ResultCacheConfig()
        : capacity(1000),
          default_ttl(std::chrono::seconds(300)),
          cleanup_interval(std::chrono::seconds(60)),
          eviction_target(0.9) {}

    static ResultCacheConfig Default() { return ResultCacheConfig(); }
};

/**
 * @brief Configuration for age-based partitioning and maintenance
 */
struct PartitionConfig {
    Duration recent_age;        // Rows older than this leave "recent"
    Duration archive_age;       // Rows older than this go to "archive"
    std::chrono::milliseconds maintenance_interval;
    bool enable_background;     // Run maintenance on a background thread

    PartitionConfig()
        : recent_age(30 * kMillisPerDay),
          archive_age(180 * kMillisPerDay),
          maintenance_interval(std::chrono::hours(1)),
          enable_background(true) {}

    static PartitionConfig Default() { return PartitionConfig(); }
};

/**
 * @brief Top-level configuration for a store instance
 */
struct StoreConfig {
    PoolConfig pool;
    StatementCacheConfig statement_cache;
    ResultCacheConfig result_cache;
    PartitionConfig partition;
    size_t default_batch_size;
    Clock clock;

    StoreConfig() : default_batch_size(1000), clock(&NowMillis) {}

    static StoreConfig Default() { return StoreConfig(); }
};

} // namespace core
} // namespace kgstore

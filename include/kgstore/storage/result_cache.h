#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "kgstore/core/config.h"
#include "kgstore/core/types.h"
#include "kgstore/storage/connection.h"

namespace kgstore {
namespace storage {

/**
 * @brief Shapes of read results that can be cached
 */
using CachedResult = std::variant<core::KnowledgeGraph,
                                  std::vector<core::EntityTypeStats>,
                                  std::vector<core::RelationTypeSummary>>;

/**
 * @brief TTL cache of query results shared by every reader
 *
 * Each entry expires ttl after insertion. Expired entries are dropped
 * lazily on lookup, by maybe_cleanup() at most once per cleanup interval,
 * and before anything else when an insert finds the cache full. If the
 * cache is still full after that, the oldest-inserted entries go until
 * size is under capacity * eviction_target.
 *
 * Writers call invalidate_all() after committing. Readers capture
 * generation() before touching storage and pass it to put(); a put whose
 * generation is stale is discarded, so a read that overlapped a write can
 * not reinstate pre-write data.
 */
class ResultCache {
public:
    explicit ResultCache(const core::ResultCacheConfig& config = core::ResultCacheConfig::Default());

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /**
     * @brief Normalized SQL text plus a hash of the bound parameters
     */
    static std::string MakeKey(const std::string& sql, const SqlParams& params);

    /**
     * @brief Collapses whitespace runs to one space and trims the ends
     */
    static std::string NormalizeSql(const std::string& sql);

    std::shared_ptr<const CachedResult> get(const std::string& key);

    template <typename T>
    std::optional<T> get_as(const std::string& key) {
        auto cached = get(key);
        if (!cached) return std::nullopt;
        if (const T* value = std::get_if<T>(cached.get())) return *value;
        return std::nullopt;
    }

    /**
     * @brief Inserts or replaces an entry
     * @param ttl Entry lifetime; the configured default when unset
     * @param generation Value of generation() observed before the read
     * @return false if the entry was discarded as stale
     */
    bool put(const std::string& key, CachedResult value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt,
             std::optional<uint64_t> generation = std::nullopt);

    uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

    /**
     * @brief Removes entries whose key contains `pattern`
     * @return Number of entries removed
     */
    size_t invalidate(const std::string& pattern);

    void invalidate_all();

    /**
     * @brief Removes every expired entry now
     */
    size_t cleanup_expired();

    /**
     * @brief Runs cleanup_expired() if the cleanup interval has elapsed
     * @return true if a cleanup pass ran
     */
    bool maybe_cleanup();

    size_t size() const;
    size_t capacity() const { return config_.capacity; }

    uint64_t hit_count() const { return hit_count_.load(std::memory_order_relaxed); }
    uint64_t miss_count() const { return miss_count_.load(std::memory_order_relaxed); }
    uint64_t eviction_count() const { return eviction_count_.load(std::memory_order_relaxed); }

    std::string stats() const;

private:
    using Clock = std::chrono::steady_clock;
    using OrderList = std::list<std::string>;

    struct Entry {
        std::shared_ptr<const CachedResult> value;
        Clock::time_point inserted_at;
        Clock::time_point last_access;
        std::chrono::milliseconds ttl;
        OrderList::iterator order;

        bool expired(Clock::time_point now) const { return now - inserted_at >= ttl; }
    };

    size_t remove_expired_locked(Clock::time_point now);
    void make_room_locked(Clock::time_point now);
    void erase_locked(std::unordered_map<std::string, Entry>::iterator it);

    core::ResultCacheConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    OrderList insertion_order_;  // Front is oldest
    Clock::time_point last_cleanup_;

    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> hit_count_{0};
    std::atomic<uint64_t> miss_count_{0};
    std::atomic<uint64_t> eviction_count_{0};
};

} // namespace storage
} // namespace kgstore

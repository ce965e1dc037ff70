#pragma once

#include "kgstore/core/config.h"
#include "kgstore/core/result.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kgstore {
namespace storage {

class Connection;
class PreparedStatement;

/**
 * @brief Process-wide LRU cache of prepared statements
 *
 * Keyed by (connection id, SQL text): a statement is only valid on the
 * connection that compiled it. Entries are shared_ptr so evicting a
 * statement another caller is stepping through only drops the cache's
 * reference; the statement is finalized when that caller lets go.
 *
 * Statements are never finalized while the cache mutex is held, and never
 * by a thread other than the one holding the owning connection. Evicting
 * another connection's statement parks it until that connection's holder
 * next calls get_or_prepare() or release_retired().
 */
class StatementCache {
public:
    explicit StatementCache(const core::StatementCacheConfig& config = core::StatementCacheConfig::Default());

    ~StatementCache() = default;

    // Disable copy constructor and assignment
    StatementCache(const StatementCache&) = delete;
    StatementCache& operator=(const StatementCache&) = delete;

    /**
     * @brief Returns the cached statement for this SQL on this connection,
     *        compiling and inserting it on a miss
     *
     * Inserting into a full cache first evicts the least recently used
     * entry, across all connections.
     */
    core::Result<std::shared_ptr<PreparedStatement>> get_or_prepare(Connection& conn,
                                                                    const std::string& sql);

    /**
     * @brief Drops every statement compiled on the given connection
     * @return Number of entries removed
     */
    size_t invalidate_connection(uint64_t connection_id);

    /**
     * @brief Finalizes statements of this connection evicted by other callers
     *
     * Must be called by the thread holding the connection.
     * @return Number of statements released
     */
    size_t release_retired(uint64_t connection_id);

    /**
     * @brief Evicted statements of this connection still waiting to be finalized
     */
    size_t retired_count(uint64_t connection_id) const;

    bool contains(uint64_t connection_id, const std::string& sql) const;

    /**
     * @brief Empties the cache; statements are parked for their owners
     */
    void clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }

    uint64_t hit_count() const;
    uint64_t miss_count() const;
    uint64_t eviction_count() const;

    /**
     * @brief Hit ratio as a percentage (0.0 to 100.0)
     */
    double hit_ratio() const;

    std::string stats() const;

private:
    struct CacheEntry {
        std::string key;
        uint64_t connection_id;
        std::shared_ptr<PreparedStatement> statement;
        std::chrono::steady_clock::time_point last_used;
    };

    // Front is most recently used
    using LRUList = std::list<CacheEntry>;
    using LRUIterator = LRUList::iterator;
    using CacheMap = std::unordered_map<std::string, LRUIterator>;
    using StatementList = std::vector<std::shared_ptr<PreparedStatement>>;

    static std::string make_key(uint64_t connection_id, const std::string& sql);

    void move_to_front(LRUIterator it);
    // Unlinks the LRU entry. A statement of `owner` is moved into `doomed`
    // for the caller to drop after unlocking; any other is parked in retired_.
    void evict_lru(uint64_t owner, StatementList& doomed);
    void take_retired_locked(uint64_t connection_id, StatementList& doomed);

    mutable std::mutex mutex_;
    size_t capacity_;
    LRUList lru_list_;
    CacheMap cache_map_;
    std::unordered_map<uint64_t, StatementList> retired_;

    std::atomic<uint64_t> hit_count_{0};
    std::atomic<uint64_t> miss_count_{0};
    std::atomic<uint64_t> eviction_count_{0};
};

} // namespace storage
} // namespace kgstore

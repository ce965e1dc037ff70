#include "kgstore/storage/statement_cache.h"

#include "kgstore/common/logger.h"
#include "kgstore/storage/connection.h"

#include <iomanip>
#include <sstream>

namespace kgstore {
namespace storage {

StatementCache::StatementCache(const core::StatementCacheConfig& config)
    : capacity_(config.capacity > 0 ? config.capacity : 1) {}

std::string StatementCache::make_key(uint64_t connection_id, const std::string& sql) {
    std::string key = std::to_string(connection_id);
    key.push_back('\x1f');
    key += sql;
    return key;
}

core::Result<std::shared_ptr<PreparedStatement>> StatementCache::get_or_prepare(
    Connection& conn, const std::string& sql) {
    std::string key = make_key(conn.id(), sql);
    // Declared before every lock below so it is destroyed after the unlock
    StatementList doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        take_retired_locked(conn.id(), doomed);
        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            move_to_front(it->second);
            it->second->last_used = std::chrono::steady_clock::now();
            hit_count_.fetch_add(1, std::memory_order_relaxed);
            return it->second->statement;
        }
    }

    // Compile outside the lock; only the connection's holder can race us on this key
    miss_count_.fetch_add(1, std::memory_order_relaxed);
    auto prepared = conn.prepare(sql);
    if (!prepared.ok()) {
        return prepared.error_info();
    }
    std::shared_ptr<PreparedStatement> statement = prepared.take_value();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_map_.find(key);
    if (it != cache_map_.end()) {
        move_to_front(it->second);
        return it->second->statement;
    }
    if (cache_map_.size() >= capacity_) {
        evict_lru(conn.id(), doomed);
    }
    lru_list_.push_front(CacheEntry{key, conn.id(), statement, std::chrono::steady_clock::now()});
    cache_map_.emplace(std::move(key), lru_list_.begin());
    return statement;
}

size_t StatementCache::invalidate_connection(uint64_t connection_id) {
    StatementList doomed;
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = lru_list_.begin(); it != lru_list_.end();) {
            if (it->connection_id == connection_id) {
                doomed.push_back(std::move(it->statement));
                cache_map_.erase(it->key);
                it = lru_list_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        take_retired_locked(connection_id, doomed);
    }
    if (removed > 0) {
        KGSTORE_DEBUG("Invalidated {} cached statements of connection {}", removed, connection_id);
    }
    return removed;
}

size_t StatementCache::release_retired(uint64_t connection_id) {
    StatementList doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        take_retired_locked(connection_id, doomed);
    }
    return doomed.size();
}

size_t StatementCache::retired_count(uint64_t connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = retired_.find(connection_id);
    return it == retired_.end() ? 0 : it->second.size();
}

bool StatementCache::contains(uint64_t connection_id, const std::string& sql) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_map_.count(make_key(connection_id, sql)) > 0;
}

void StatementCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : lru_list_) {
        retired_[entry.connection_id].push_back(std::move(entry.statement));
    }
    lru_list_.clear();
    cache_map_.clear();
}

size_t StatementCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_map_.size();
}

uint64_t StatementCache::hit_count() const {
    return hit_count_.load(std::memory_order_relaxed);
}

uint64_t StatementCache::miss_count() const {
    return miss_count_.load(std::memory_order_relaxed);
}

uint64_t StatementCache::eviction_count() const {
    return eviction_count_.load(std::memory_order_relaxed);
}

double StatementCache::hit_ratio() const {
    uint64_t hits = hit_count();
    uint64_t total = hits + miss_count();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(hits) / total * 100.0;
}

std::string StatementCache::stats() const {
    std::ostringstream oss;
    oss << "StatementCache Stats:\n";
    oss << "  Current size: " << size() << "/" << capacity_ << "\n";
    oss << "  Hit count: " << hit_count() << "\n";
    oss << "  Miss count: " << miss_count() << "\n";
    oss << "  Evictions: " << eviction_count() << "\n";
    oss << "  Hit ratio: " << std::fixed << std::setprecision(2) << hit_ratio() << "%\n";
    return oss.str();
}

void StatementCache::move_to_front(LRUIterator it) {
    lru_list_.splice(lru_list_.begin(), lru_list_, it);
}

void StatementCache::evict_lru(uint64_t owner, StatementList& doomed) {
    if (lru_list_.empty()) {
        return;
    }
    auto victim = std::prev(lru_list_.end());
    KGSTORE_TRACE("Evicting cached statement of connection {}", victim->connection_id);
    if (victim->connection_id == owner) {
        doomed.push_back(std::move(victim->statement));
    } else {
        // Finalizing here would take the other handle's mutex under ours
        retired_[victim->connection_id].push_back(std::move(victim->statement));
    }
    cache_map_.erase(victim->key);
    lru_list_.erase(victim);
    eviction_count_.fetch_add(1, std::memory_order_relaxed);
}

void StatementCache::take_retired_locked(uint64_t connection_id, StatementList& doomed) {
    auto it = retired_.find(connection_id);
    if (it == retired_.end()) {
        return;
    }
    for (auto& statement : it->second) {
        doomed.push_back(std::move(statement));
    }
    retired_.erase(it);
}

} // namespace storage
} // namespace kgstore

#include "kgstore/storage/result_cache.h"

#include "kgstore/common/logger.h"

#include <algorithm>
#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>

namespace kgstore {
namespace storage {

namespace {

struct ParamHashVisitor {
    std::string& out;

    void operator()(const std::monostate&) const { out += "n;"; }
    void operator()(int64_t value) const { out += "i" + std::to_string(value) + ";"; }
    void operator()(double value) const {
        std::ostringstream oss;
        oss << std::setprecision(17) << value;
        out += "d" + oss.str() + ";";
    }
    void operator()(const std::string& value) const {
        out += "s" + std::to_string(value.size()) + ":" + value + ";";
    }
};

}  // namespace

ResultCache::ResultCache(const core::ResultCacheConfig& config)
    : config_(config), last_cleanup_(Clock::now()) {
    if (config_.capacity == 0) {
        config_.capacity = 1;
    }
    if (config_.eviction_target <= 0.0 || config_.eviction_target > 1.0) {
        config_.eviction_target = 0.9;
    }
}

std::string ResultCache::NormalizeSql(const std::string& sql) {
    std::string normalized;
    normalized.reserve(sql.size());
    bool pending_space = false;
    for (char ch : sql) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pending_space = !normalized.empty();
            continue;
        }
        if (pending_space) {
            normalized.push_back(' ');
            pending_space = false;
        }
        normalized.push_back(ch);
    }
    return normalized;
}

std::string ResultCache::MakeKey(const std::string& sql, const SqlParams& params) {
    std::string encoded;
    for (const auto& param : params) {
        std::visit(ParamHashVisitor{encoded}, param);
    }
    std::ostringstream oss;
    oss << NormalizeSql(sql) << "#" << std::hex << std::hash<std::string>{}(encoded);
    return oss.str();
}

std::shared_ptr<const CachedResult> ResultCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        miss_count_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    auto now = Clock::now();
    if (it->second.expired(now)) {
        erase_locked(it);
        miss_count_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    it->second.last_access = now;
    hit_count_.fetch_add(1, std::memory_order_relaxed);
    return it->second.value;
}

bool ResultCache::put(const std::string& key, CachedResult value,
                      std::optional<std::chrono::milliseconds> ttl,
                      std::optional<uint64_t> generation) {
    auto shared = std::make_shared<const CachedResult>(std::move(value));

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation && *generation != generation_.load(std::memory_order_acquire)) {
        KGSTORE_TRACE("Discarding stale result for {}", key);
        return false;
    }

    auto now = Clock::now();
    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        erase_locked(existing);
    }
    if (entries_.size() >= config_.capacity) {
        make_room_locked(now);
    }

    insertion_order_.push_back(key);
    Entry entry;
    entry.value = std::move(shared);
    entry.inserted_at = now;
    entry.last_access = now;
    entry.ttl = ttl.value_or(config_.default_ttl);
    entry.order = std::prev(insertion_order_.end());
    entries_.emplace(key, std::move(entry));
    return true;
}

size_t ResultCache::invalidate(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first.find(pattern) != std::string::npos) {
            auto victim = it++;
            erase_locked(victim);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ResultCache::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_.fetch_add(1, std::memory_order_acq_rel);
    entries_.clear();
    insertion_order_.clear();
}

size_t ResultCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    last_cleanup_ = now;
    return remove_expired_locked(now);
}

bool ResultCache::maybe_cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (now - last_cleanup_ < config_.cleanup_interval) {
        return false;
    }
    last_cleanup_ = now;
    size_t removed = remove_expired_locked(now);
    if (removed > 0) {
        KGSTORE_DEBUG("Result cache cleanup removed {} expired entries", removed);
    }
    return true;
}

size_t ResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string ResultCache::stats() const {
    std::ostringstream oss;
    uint64_t hits = hit_count();
    uint64_t total = hits + miss_count();
    oss << "ResultCache Stats:\n";
    oss << "  Current size: " << size() << "/" << config_.capacity << "\n";
    oss << "  Hit count: " << hits << "\n";
    oss << "  Miss count: " << miss_count() << "\n";
    oss << "  Evictions: " << eviction_count() << "\n";
    oss << "  Hit ratio: " << std::fixed << std::setprecision(2)
        << (total == 0 ? 0.0 : static_cast<double>(hits) / total * 100.0) << "%\n";
    return oss.str();
}

size_t ResultCache::remove_expired_locked(Clock::time_point now) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expired(now)) {
            auto victim = it++;
            erase_locked(victim);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ResultCache::make_room_locked(Clock::time_point now) {
    remove_expired_locked(now);
    if (entries_.size() < config_.capacity) {
        return;
    }

    auto target = static_cast<size_t>(static_cast<double>(config_.capacity) * config_.eviction_target);
    if (target >= config_.capacity) {
        target = config_.capacity - 1;
    }
    size_t evicted = 0;
    while (entries_.size() > target && !insertion_order_.empty()) {
        auto it = entries_.find(insertion_order_.front());
        if (it == entries_.end()) {
            insertion_order_.pop_front();
            continue;
        }
        erase_locked(it);
        ++evicted;
    }
    eviction_count_.fetch_add(evicted, std::memory_order_relaxed);
    KGSTORE_DEBUG("Result cache at capacity; evicted {} oldest entries", evicted);
}

void ResultCache::erase_locked(std::unordered_map<std::string, Entry>::iterator it) {
    insertion_order_.erase(it->second.order);
    entries_.erase(it);
}

} // namespace storage
} // namespace kgstore

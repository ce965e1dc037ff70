#include "kgstore/storage/connection_pool.h"

#include "kgstore/common/logger.h"
#include "kgstore/storage/statement_cache.h"

namespace kgstore {
namespace storage {

// ============================================================================
// PooledConnection
// ============================================================================

PooledConnection::PooledConnection(ConnectionPool* pool, std::unique_ptr<Connection> conn)
    : pool_(pool), conn_(std::move(conn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        other.pool_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_));
    }
    conn_.reset();
    pool_ = nullptr;
}

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::ConnectionPool(std::string db_path, core::PoolConfig config,
                               StatementCache* statements)
    : db_path_(std::move(db_path)), config_(config), statements_(statements) {
    if (config_.max_connections == 0) {
        config_.max_connections = 1;
    }
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

void ConnectionPool::set_acquire_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    acquire_hook_ = std::move(hook);
}

core::Result<PooledConnection> ConnectionPool::acquire() {
    return acquire(config_.acquire_timeout);
}

core::Result<PooledConnection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::function<void()> hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = acquire_hook_;
    }
    if (hook) {
        hook();
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (shutdown_) {
            return core::StorageFailureError("Connection pool for " + db_path_ + " is shut down");
        }
        if (!idle_.empty()) {
            std::unique_ptr<Connection> conn = std::move(idle_.back());
            idle_.pop_back();
            ++active_;
            return PooledConnection(this, std::move(conn));
        }
        if (live_ < config_.max_connections) {
            // Reserve the slot, then open without holding the lock
            ++live_;
            lock.unlock();
            auto opened = Connection::Open(db_path_, config_, statements_);
            lock.lock();
            if (!opened.ok()) {
                --live_;
                available_cv_.notify_one();
                KGSTORE_ERROR("Failed to open pooled connection: {}", opened.error());
                return opened.error_info();
            }
            ++active_;
            ++created_;
            KGSTORE_DEBUG("Pool opened connection {} ({}/{})", opened.value()->id(), live_,
                          config_.max_connections);
            return PooledConnection(this, opened.take_value());
        }
        if (available_cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && live_ >= config_.max_connections && !shutdown_) {
            ++exhausted_;
            KGSTORE_WARN("Connection pool exhausted: {} handles in use, waited {} ms", active_,
                         timeout.count());
            return core::PoolExhaustedError("Timed out after " + std::to_string(timeout.count()) +
                                            " ms waiting for a database connection (" +
                                            std::to_string(active_) + "/" +
                                            std::to_string(config_.max_connections) + " in use)");
        }
    }
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
    if (!conn) {
        return;
    }

    // An abandoned transaction must never leak into the next borrower
    if (!conn->is_broken() && conn->in_transaction()) {
        KGSTORE_WARN("Connection {} returned with an open transaction; rolling back", conn->id());
        auto rolled_back = conn->exec_script("ROLLBACK");
        if (!rolled_back.ok()) {
            KGSTORE_ERROR("Rollback on release failed: {}", rolled_back.error());
            conn->mark_broken();
        }
    }

    // Still the holder here, so statements other callers evicted can be finalized
    if (statements_) {
        statements_->release_retired(conn->id());
    }

    std::unique_ptr<Connection> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        if (shutdown_ || conn->is_broken()) {
            --live_;
            retired = std::move(conn);
        } else {
            idle_.push_back(std::move(conn));
        }
    }
    available_cv_.notify_one();

    if (retired && retired->is_broken()) {
        KGSTORE_WARN("Retiring broken connection {}", retired->id());
    }
}

PoolStats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats stats;
    stats.max_connections = config_.max_connections;
    stats.active = active_;
    stats.idle = idle_.size();
    stats.available = config_.max_connections - active_;
    stats.created = created_;
    stats.exhausted = exhausted_;
    return stats;
}

core::Result<void> ConnectionPool::health_check() {
    auto conn = acquire();
    if (!conn.ok()) {
        return conn.error_info();
    }
    auto one = conn.value()->query_int("SELECT 1");
    if (!one.ok()) {
        return one.error_info();
    }
    if (one.value() != std::optional<int64_t>(1)) {
        return core::StorageFailureError("Health check query returned an unexpected value");
    }
    return core::Result<void>();
}

void ConnectionPool::shutdown() {
    std::vector<std::unique_ptr<Connection>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return;
        }
        shutdown_ = true;
        closing.swap(idle_);
        live_ -= closing.size();
    }
    available_cv_.notify_all();
    if (!closing.empty()) {
        KGSTORE_INFO("Connection pool for {} closing {} idle connections", db_path_, closing.size());
    }
}

} // namespace storage
} // namespace kgstore

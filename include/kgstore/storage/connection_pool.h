#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kgstore/core/config.h"
#include "kgstore/core/result.h"
#include "kgstore/storage/connection.h"

namespace kgstore {
namespace storage {

class ConnectionPool;
class StatementCache;

/**
 * @brief Checked-out connection; returns itself to the pool when destroyed
 *
 * Move-only. The pool must outlive every PooledConnection it hands out.
 */
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool* pool, std::unique_ptr<Connection> conn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Connection& operator*() const { return *conn_; }
    Connection* operator->() const { return conn_.get(); }
    Connection* get() const { return conn_.get(); }
    explicit operator bool() const { return conn_ != nullptr; }

    /**
     * @brief Returns the connection to the pool early
     */
    void release();

private:
    ConnectionPool* pool_ = nullptr;
    std::unique_ptr<Connection> conn_;
};

struct PoolStats {
    size_t max_connections = 0;
    size_t active = 0;       // Checked out right now
    size_t idle = 0;         // Open and waiting in the pool
    size_t available = 0;    // max_connections - active
    size_t created = 0;      // Total connections ever opened
    uint64_t exhausted = 0;  // Acquires that timed out
};

/**
 * @brief Bounded pool of SQLite connections gated by a counting semaphore
 *
 * At most max_connections handles exist at once. acquire() hands out an
 * idle handle, opens a new one while under the bound, and otherwise waits
 * until a handle is released or the deadline passes. Handles come back
 * with no open transaction: release rolls back whatever the caller left
 * behind, and retires handles that report a fatal engine error.
 */
class ConnectionPool {
public:
    ConnectionPool(std::string db_path, core::PoolConfig config,
                   StatementCache* statements = nullptr);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Acquire with the configured default timeout
     */
    core::Result<PooledConnection> acquire();

    /**
     * @brief Acquire a handle, waiting at most `timeout`
     * @return POOL_EXHAUSTED if no handle freed up in time
     */
    core::Result<PooledConnection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Hook run on every acquire before waiting (lazy cache maintenance)
     */
    void set_acquire_hook(std::function<void()> hook);

    PoolStats stats() const;

    /**
     * @brief Runs `SELECT 1` on a pooled handle
     */
    core::Result<void> health_check();

    /**
     * @brief Closes idle handles and fails further acquires
     *
     * Handles still checked out are closed as they are returned.
     */
    void shutdown();

    const std::string& db_path() const { return db_path_; }
    const core::PoolConfig& config() const { return config_; }

private:
    friend class PooledConnection;

    void release(std::unique_ptr<Connection> conn);

    std::string db_path_;
    core::PoolConfig config_;
    StatementCache* statements_;
    std::function<void()> acquire_hook_;

    mutable std::mutex mutex_;
    std::condition_variable available_cv_;
    std::vector<std::unique_ptr<Connection>> idle_;
    size_t live_ = 0;      // Opened or being opened, not yet closed
    size_t active_ = 0;
    size_t created_ = 0;
    uint64_t exhausted_ = 0;
    bool shutdown_ = false;
};

} // namespace storage
} // namespace kgstore

#pragma once

#include <sqlite3.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kgstore/core/config.h"
#include "kgstore/core/result.h"

namespace kgstore {
namespace storage {

class StatementCache;

/**
 * @brief A bound parameter or column value
 */
using SqlValue = std::variant<std::monostate, int64_t, double, std::string>;
using SqlParams = std::vector<SqlValue>;

SqlValue OptionalText(const std::optional<std::string>& value);
SqlValue OptionalInt(const std::optional<int64_t>& value);

/**
 * @brief Read-only view of the current result row of a statement
 *
 * Only valid inside the row callback that received it.
 */
class Row {
public:
    explicit Row(sqlite3_stmt* stmt) : stmt_(stmt) {}

    int column_count() const;
    bool is_null(int column) const;
    int64_t get_int(int column) const;
    double get_double(int column) const;
    std::string get_text(int column) const;
    std::optional<std::string> get_optional_text(int column) const;
    std::optional<int64_t> get_optional_int(int column) const;

private:
    sqlite3_stmt* stmt_;
};

/**
 * @brief Owns one compiled sqlite3_stmt belonging to one connection
 *
 * Finalized when the last reference goes away, which may be on a thread
 * other than the one using the owning connection; connections are opened
 * in serialized mode so that is safe.
 */
class PreparedStatement {
public:
    PreparedStatement(sqlite3_stmt* stmt, std::string sql, uint64_t connection_id);
    ~PreparedStatement();

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    sqlite3_stmt* handle() const { return stmt_; }
    const std::string& sql() const { return sql_; }
    uint64_t connection_id() const { return connection_id_; }

    /**
     * @brief Marks the statement as executing; false if it already is
     *
     * A callback that re-enters the same SQL on the same connection would
     * otherwise reset the outer iteration.
     */
    bool try_claim();
    void release_claim();

private:
    sqlite3_stmt* stmt_;
    std::string sql_;
    uint64_t connection_id_;
    std::atomic<bool> busy_{false};
};

/**
 * @brief One SQLite database handle
 *
 * A connection is used by one thread at a time (the holder of the
 * PooledConnection wrapping it). Pragmas are applied once, in Open().
 */
class Connection {
public:
    // Return false to stop iterating
    using RowCallback = std::function<bool(const Row&)>;

    static core::Result<std::unique_ptr<Connection>> Open(const std::string& path,
                                                          const core::PoolConfig& config,
                                                          StatementCache* statements);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    uint64_t id() const { return id_; }
    const std::string& path() const { return path_; }
    sqlite3* handle() const { return db_; }

    /**
     * @brief Runs a statement and returns the number of changed rows
     */
    core::Result<int> execute(const std::string& sql, const SqlParams& params = {});

    /**
     * @brief Runs a statement and feeds each result row to on_row
     */
    core::Result<void> query(const std::string& sql, const SqlParams& params,
                             const RowCallback& on_row);

    /**
     * @brief Runs a query and decodes every row with decode(const Row&) -> Result<T>
     */
    template <typename T, typename Decoder>
    core::Result<std::vector<T>> query_list(const std::string& sql, const SqlParams& params,
                                            Decoder&& decode) {
        std::vector<T> rows;
        std::optional<core::Error> failure;
        auto status = query(sql, params, [&](const Row& row) {
            core::Result<T> item = decode(row);
            if (!item.ok()) {
                failure = item.error_info();
                return false;
            }
            rows.push_back(item.take_value());
            return true;
        });
        if (!status.ok()) return status.error_info();
        if (failure) return *failure;
        return rows;
    }

    /**
     * @brief First column of the first row as an integer; nullopt when no row or NULL
     */
    core::Result<std::optional<int64_t>> query_int(const std::string& sql,
                                                   const SqlParams& params = {});

    /**
     * @brief Runs semicolon-separated SQL without caching (DDL, pragmas, BEGIN/COMMIT)
     */
    core::Result<void> exec_script(const std::string& sql);

    /**
     * @brief Compiles a statement without going through the statement cache
     */
    core::Result<std::shared_ptr<PreparedStatement>> prepare(const std::string& sql);

    bool in_transaction() const;

    bool is_broken() const { return broken_; }
    void mark_broken() { broken_ = true; }

    // Extended code of the last failure reported by this connection
    int extended_error_code() const;

private:
    Connection(sqlite3* db, std::string path, uint64_t id, StatementCache* statements);

    core::Result<void> apply_pragmas(const core::PoolConfig& config);
    core::Result<std::shared_ptr<PreparedStatement>> lease_statement(const std::string& sql);
    core::Result<void> bind(sqlite3_stmt* stmt, const SqlParams& params);
    core::Error storage_error(const std::string& context, int rc);

    sqlite3* db_;
    std::string path_;
    uint64_t id_;
    StatementCache* statements_;
    bool broken_ = false;
    int last_error_code_ = SQLITE_OK;
};

} // namespace storage
} // namespace kgstore

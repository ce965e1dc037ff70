#include "kgstore/storage/connection.h"

#include "kgstore/common/logger.h"
#include "kgstore/storage/statement_cache.h"

namespace kgstore {
namespace storage {

namespace {

std::atomic<uint64_t> g_next_connection_id{1};

struct BindVisitor {
    sqlite3_stmt* stmt;
    int index;

    int operator()(const std::monostate&) const { return sqlite3_bind_null(stmt, index); }
    int operator()(int64_t value) const { return sqlite3_bind_int64(stmt, index, value); }
    int operator()(double value) const { return sqlite3_bind_double(stmt, index, value); }
    int operator()(const std::string& value) const {
        return sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                                 SQLITE_TRANSIENT);
    }
};

bool IsFatal(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB || primary == SQLITE_IOERR;
}

// Resets and unbinds the statement when the scope ends
class StatementLease {
public:
    explicit StatementLease(std::shared_ptr<PreparedStatement> stmt) : stmt_(std::move(stmt)) {}
    ~StatementLease() {
        sqlite3_reset(stmt_->handle());
        sqlite3_clear_bindings(stmt_->handle());
        stmt_->release_claim();
    }

    StatementLease(const StatementLease&) = delete;
    StatementLease& operator=(const StatementLease&) = delete;

    sqlite3_stmt* handle() const { return stmt_->handle(); }

private:
    std::shared_ptr<PreparedStatement> stmt_;
};

}  // namespace

SqlValue OptionalText(const std::optional<std::string>& value) {
    if (value) return *value;
    return std::monostate{};
}

SqlValue OptionalInt(const std::optional<int64_t>& value) {
    if (value) return *value;
    return std::monostate{};
}

// ============================================================================
// Row
// ============================================================================

int Row::column_count() const {
    return sqlite3_column_count(stmt_);
}

bool Row::is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

int64_t Row::get_int(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Row::get_double(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Row::get_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return std::string();
    int size = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::optional<std::string> Row::get_optional_text(int column) const {
    if (is_null(column)) return std::nullopt;
    return get_text(column);
}

std::optional<int64_t> Row::get_optional_int(int column) const {
    if (is_null(column)) return std::nullopt;
    return get_int(column);
}

// ============================================================================
// PreparedStatement
// ============================================================================

PreparedStatement::PreparedStatement(sqlite3_stmt* stmt, std::string sql, uint64_t connection_id)
    : stmt_(stmt), sql_(std::move(sql)), connection_id_(connection_id) {}

PreparedStatement::~PreparedStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

bool PreparedStatement::try_claim() {
    bool expected = false;
    return busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void PreparedStatement::release_claim() {
    busy_.store(false, std::memory_order_release);
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(sqlite3* db, std::string path, uint64_t id, StatementCache* statements)
    : db_(db), path_(std::move(path)), id_(id), statements_(statements) {}

Connection::~Connection() {
    if (statements_) {
        statements_->invalidate_connection(id_);
    }
    // close_v2 defers the close until any statement still referenced elsewhere is finalized
    int rc = sqlite3_close_v2(db_);
    if (rc != SQLITE_OK) {
        KGSTORE_WARN("Closing connection {} returned {}", id_, sqlite3_errstr(rc));
    } else {
        KGSTORE_DEBUG("Closed connection {}", id_);
    }
}

core::Result<std::unique_ptr<Connection>> Connection::Open(const std::string& path,
                                                           const core::PoolConfig& config,
                                                           StatementCache* statements) {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        return core::StorageFailureError("Failed to open database '" + path + "': " + message);
    }
    sqlite3_extended_result_codes(db, 1);

    uint64_t id = g_next_connection_id.fetch_add(1, std::memory_order_relaxed);
    std::unique_ptr<Connection> conn(new Connection(db, path, id, statements));

    auto pragmas = conn->apply_pragmas(config);
    if (!pragmas.ok()) {
        return pragmas.error_info();
    }

    KGSTORE_DEBUG("Opened connection {} to {}", id, path);
    return std::move(conn);
}

core::Result<void> Connection::apply_pragmas(const core::PoolConfig& config) {
    sqlite3_busy_timeout(db_, static_cast<int>(config.busy_timeout.count()));

    std::string pragmas =
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=NORMAL;"
        "PRAGMA temp_store=MEMORY;"
        "PRAGMA cache_size=-" + std::to_string(config.cache_size_kib) + ";";
    return exec_script(pragmas);
}

core::Result<void> Connection::exec_script(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        if (IsFatal(rc)) mark_broken();
        return core::StorageFailureError("SQL script failed on connection " +
                                         std::to_string(id_) + ": " + message);
    }
    return core::Result<void>();
}

core::Result<std::shared_ptr<PreparedStatement>> Connection::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK || !stmt) {
        sqlite3_finalize(stmt);
        return storage_error("prepare failed for [" + sql + "]", rc);
    }
    return std::make_shared<PreparedStatement>(stmt, sql, id_);
}

core::Result<std::shared_ptr<PreparedStatement>> Connection::lease_statement(const std::string& sql) {
    std::shared_ptr<PreparedStatement> stmt;
    if (statements_) {
        auto cached = statements_->get_or_prepare(*this, sql);
        if (!cached.ok()) return cached.error_info();
        stmt = cached.take_value();
        if (stmt->try_claim()) {
            return stmt;
        }
    }

    // Uncached, or the cached copy is mid-iteration further up the stack
    auto fresh = prepare(sql);
    if (!fresh.ok()) return fresh.error_info();
    stmt = fresh.take_value();
    stmt->try_claim();
    return stmt;
}

core::Result<void> Connection::bind(sqlite3_stmt* stmt, const SqlParams& params) {
    int expected = sqlite3_bind_parameter_count(stmt);
    if (static_cast<size_t>(expected) != params.size()) {
        return core::InternalError("statement expects " + std::to_string(expected) +
                                   " parameters, got " + std::to_string(params.size()));
    }
    for (size_t i = 0; i < params.size(); ++i) {
        int rc = std::visit(BindVisitor{stmt, static_cast<int>(i + 1)}, params[i]);
        if (rc != SQLITE_OK) {
            return storage_error("bind failed", rc);
        }
    }
    return core::Result<void>();
}

core::Result<int> Connection::execute(const std::string& sql, const SqlParams& params) {
    auto leased = lease_statement(sql);
    if (!leased.ok()) return leased.error_info();
    StatementLease lease(leased.take_value());

    auto bound = bind(lease.handle(), params);
    if (!bound.ok()) return bound.error_info();

    int rc;
    while ((rc = sqlite3_step(lease.handle())) == SQLITE_ROW) {
    }
    if (rc != SQLITE_DONE) {
        return storage_error("execute failed for [" + sql + "]", rc);
    }
    return sqlite3_changes(db_);
}

core::Result<void> Connection::query(const std::string& sql, const SqlParams& params,
                                     const RowCallback& on_row) {
    auto leased = lease_statement(sql);
    if (!leased.ok()) return leased.error_info();
    StatementLease lease(leased.take_value());

    auto bound = bind(lease.handle(), params);
    if (!bound.ok()) return bound.error_info();

    while (true) {
        int rc = sqlite3_step(lease.handle());
        if (rc == SQLITE_ROW) {
            if (!on_row(Row(lease.handle()))) break;
            continue;
        }
        if (rc == SQLITE_DONE) break;
        return storage_error("query failed for [" + sql + "]", rc);
    }
    return core::Result<void>();
}

core::Result<std::optional<int64_t>> Connection::query_int(const std::string& sql,
                                                           const SqlParams& params) {
    std::optional<int64_t> value;
    auto status = query(sql, params, [&value](const Row& row) {
        value = row.get_optional_int(0);
        return false;
    });
    if (!status.ok()) return status.error_info();
    return value;
}

bool Connection::in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

int Connection::extended_error_code() const {
    return last_error_code_;
}

core::Error Connection::storage_error(const std::string& context, int rc) {
    last_error_code_ = sqlite3_extended_errcode(db_);
    if (IsFatal(rc)) {
        mark_broken();
    }
    return core::StorageFailureError(context + ": " + sqlite3_errmsg(db_) +
                                     " (code " + std::to_string(rc) + ")");
}

} // namespace storage
} // namespace kgstore

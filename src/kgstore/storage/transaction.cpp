#include "kgstore/storage/transaction.h"

#include "kgstore/common/logger.h"

namespace kgstore {
namespace storage {

core::Result<Transaction> Transaction::Begin(Connection& conn) {
    if (conn.in_transaction()) {
        return core::InvalidArgumentError("Nested transactions are not supported (connection " +
                                          std::to_string(conn.id()) + ")");
    }
    auto begun = conn.exec_script("BEGIN IMMEDIATE");
    if (!begun.ok()) {
        return begun.error_info();
    }
    return Transaction(&conn);
}

Transaction::~Transaction() {
    if (active()) {
        auto rolled_back = rollback();
        (void)rolled_back;
    }
}

Transaction::Transaction(Transaction&& other) noexcept : conn_(other.conn_) {
    other.conn_ = nullptr;
}

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (active()) {
            auto rolled_back = rollback();
            (void)rolled_back;
        }
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

core::Result<void> Transaction::commit() {
    if (!active()) {
        return core::InternalError("commit() on an inactive transaction");
    }
    Connection* conn = conn_;
    auto committed = conn->exec_script("COMMIT");
    if (!committed.ok()) {
        KGSTORE_WARN("Commit failed on connection {}: {}", conn->id(), committed.error());
        auto rolled_back = rollback();
        (void)rolled_back;
        return committed;
    }
    conn_ = nullptr;
    return core::Result<void>();
}

core::Result<void> Transaction::rollback() {
    if (!active()) {
        return core::Result<void>();
    }
    Connection* conn = conn_;
    conn_ = nullptr;
    if (!conn->in_transaction()) {
        // The engine already rolled back (e.g. after SQLITE_FULL)
        return core::Result<void>();
    }
    auto rolled_back = conn->exec_script("ROLLBACK");
    if (!rolled_back.ok()) {
        KGSTORE_ERROR("Rollback failed on connection {}: {}", conn->id(), rolled_back.error());
        conn->mark_broken();
    }
    return rolled_back;
}

} // namespace storage
} // namespace kgstore

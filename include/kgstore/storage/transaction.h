#pragma once

#include <functional>
#include <type_traits>

#include "kgstore/core/result.h"
#include "kgstore/storage/connection.h"

namespace kgstore {
namespace storage {

/**
 * @brief Scoped write transaction on one connection
 *
 * Begin() issues BEGIN IMMEDIATE, so the write lock is taken up front and
 * concurrent writers queue on busy_timeout instead of failing at commit.
 * A Transaction destroyed without a successful commit() rolls back.
 * Nesting is rejected.
 */
class Transaction {
public:
    static core::Result<Transaction> Begin(Connection& conn);

    Transaction() = default;
    ~Transaction();

    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    core::Result<void> commit();
    core::Result<void> rollback();

    bool active() const { return conn_ != nullptr; }

private:
    explicit Transaction(Connection* conn) : conn_(conn) {}

    Connection* conn_ = nullptr;
};

/**
 * @brief Runs fn inside a transaction; commits if it returns ok, rolls back otherwise
 *
 * fn is `Result<T>(Connection&)`; its error, or the commit error, is
 * returned unchanged.
 */
template <typename Fn>
auto RunInTransaction(Connection& conn, Fn&& fn) -> decltype(fn(conn)) {
    using ResultType = decltype(fn(conn));

    auto txn = Transaction::Begin(conn);
    if (!txn.ok()) {
        return ResultType(txn.error_info());
    }

    ResultType result = fn(conn);
    if (!result.ok()) {
        auto rolled_back = txn.value().rollback();
        (void)rolled_back;  // rollback() logs its own failure; the caller's error wins
        return result;
    }

    auto committed = txn.value().commit();
    if (!committed.ok()) {
        return ResultType(committed.error_info());
    }
    return result;
}

} // namespace storage
} // namespace kgstore

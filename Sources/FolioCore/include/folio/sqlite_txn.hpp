#pragma once

#include "connection.hpp"
#include "connection_pool.hpp"
#include <memory>
#include <thread>

namespace folio {

/// A read or write transaction owning one pooled connection.
///
/// The connection flows pool -> transaction (constructor) -> pool (commit,
/// abort or destruction). Once committed or aborted the transaction is
/// consumed; any further use other than abort() throws illegal_argument_error.
class sqlite_txn {
public:
    /// Starts the engine transaction on conn. On failure conn goes back to
    /// the pool and the error propagates.
    sqlite_txn(std::shared_ptr<connection_pool> pool, std::unique_ptr<connection> conn, bool write);

    /// A transaction that was never finished is rolled back and its
    /// connection recycled.
    ~sqlite_txn();

    sqlite_txn(const sqlite_txn&) = delete;
    sqlite_txn& operator=(const sqlite_txn&) = delete;

    sqlite_txn(sqlite_txn&& other) noexcept;
    sqlite_txn& operator=(sqlite_txn&& other) noexcept;

    /// COMMIT. On success the connection returns to the pool. If the engine
    /// commit fails the connection is closed and db_error is thrown.
    void commit();

    /// Best-effort ROLLBACK. Never throws; a connection whose rollback
    /// failed is closed instead of being returned.
    void abort() noexcept;

    [[nodiscard]] bool is_write() const noexcept { return write_; }
    [[nodiscard]] bool is_active() const noexcept { return conn_ != nullptr; }

    /// The owned connection. Throws illegal_argument_error once consumed.
    connection& conn();

private:
    void recycle(std::unique_ptr<connection> conn) noexcept;

    std::shared_ptr<connection_pool> pool_;
    std::unique_ptr<connection> conn_;
    std::thread::id owner_;
    bool write_ = false;
};

} // namespace folio

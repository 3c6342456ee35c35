#include "folio/sqlite_txn.hpp"
#include "folio/log.hpp"

namespace folio {

sqlite_txn::sqlite_txn(std::shared_ptr<connection_pool> pool, std::unique_ptr<connection> conn, bool write)
    : pool_(std::move(pool)), owner_(std::this_thread::get_id()), write_(write) {
    try {
        conn->begin_transaction(write);
    } catch (const db_error&) {
        // The connection itself is fine; only BEGIN failed
        recycle(std::move(conn));
        throw;
    }
    conn_ = std::move(conn);
    LOG_DEBUG("txn", "Began %s transaction", write_ ? "write" : "read");
}

sqlite_txn::~sqlite_txn() {
    if (conn_) {
        LOG_WARN("txn", "Transaction destroyed without commit or abort, rolling back");
        abort();
    }
}

sqlite_txn::sqlite_txn(sqlite_txn&& other) noexcept
    : pool_(std::move(other.pool_))
    , conn_(std::move(other.conn_))
    , owner_(other.owner_)
    , write_(other.write_) {}

sqlite_txn& sqlite_txn::operator=(sqlite_txn&& other) noexcept {
    if (this != &other) {
        if (conn_) {
            abort();
        }
        pool_ = std::move(other.pool_);
        conn_ = std::move(other.conn_);
        owner_ = other.owner_;
        write_ = other.write_;
    }
    return *this;
}

connection& sqlite_txn::conn() {
    if (!conn_) {
        throw illegal_argument_error("Transaction has already been committed or aborted");
    }
    return *conn_;
}

void sqlite_txn::commit() {
    if (!conn_) {
        throw illegal_argument_error("Transaction has already been committed or aborted");
    }

    auto conn = std::move(conn_);
    try {
        conn->commit();
    } catch (const db_error& e) {
        LOG_ERROR("txn", "Commit failed, closing connection: %s", e.what());
        if (conn->is_in_transaction()) {
            try {
                conn->rollback();
            } catch (const db_error& rollback_error) {
                LOG_WARN("txn", "Rollback after failed commit also failed: %s", rollback_error.what());
            }
        }
        conn.reset();
        throw;
    }
    recycle(std::move(conn));
}

void sqlite_txn::abort() noexcept {
    if (!conn_) return;

    auto conn = std::move(conn_);
    try {
        // SQLite may already have rolled back on its own (e.g. SQLITE_FULL)
        if (conn->is_in_transaction()) {
            conn->rollback();
        }
    } catch (const std::exception& e) {
        LOG_WARN("txn", "Rollback failed, dropping connection: %s", e.what());
        return;
    }
    recycle(std::move(conn));
}

void sqlite_txn::recycle(std::unique_ptr<connection> conn) noexcept {
    if (!pool_) return;
    if (std::this_thread::get_id() != owner_) {
        // Never hand a connection to a slot of a thread that did not borrow it
        LOG_DEBUG("txn", "Transaction finished on a foreign thread, closing its connection");
        return;
    }
    try {
        pool_->release(std::move(conn));
    } catch (const std::exception& e) {
        LOG_WARN("txn", "Could not return connection to pool: %s", e.what());
    }
}

} // namespace folio

#pragma once

#include "types.hpp"
#include "error.hpp"
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio {

struct connection_options {
    /// synchronous=NORMAL instead of FULL. Commits may be lost on power
    /// failure but the file stays consistent.
    bool relaxed_durability = false;

    /// How long a connection waits on a locked database before SQLITE_BUSY.
    int busy_timeout_ms = 5000;
};

/// Quote an identifier for use in SQL ("name" with embedded quotes doubled).
std::string quote_identifier(const std::string& name);

// RAII prepared statement
class statement {
public:
    statement() = default;
    statement(sqlite3* db, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    statement(statement&& other) noexcept;
    statement& operator=(statement&& other) noexcept;

    void bind(int index, const column_value_t& value);
    void bind_all(const std::vector<column_value_t>& params);

    /// Advance. Returns true while a row is available, false once done.
    bool step();

    /// Reset for re-execution and clear all bindings.
    void reset();

    int column_count() const;
    bool column_is_null(int index) const;
    int64_t column_int64(int index) const;
    double column_double(int index) const;
    std::string column_text(int index) const;
    column_value_t column(int index) const;

    sqlite3_stmt* handle() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

/// One exclusive SQLite handle. Never shared between threads at the same time;
/// the connection pool and sqlite_txn enforce the hand-off.
class connection {
public:
    explicit connection(const std::string& path, connection_options options = {});
    ~connection();

    // Non-copyable
    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    // Moveable
    connection(connection&& other) noexcept;
    connection& operator=(connection&& other) noexcept;

    // Schema inspection (used by migration)
    bool table_exists(const std::string& name) const;
    std::vector<std::string> table_names() const;

    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // Explicitly created indexes of a table (excludes autoindexes)
    std::vector<std::string> get_index_names(const std::string& table) const;

    // Execute SQL with optional params (for DDL/INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    statement prepare(const std::string& sql);

    // Transaction support
    void begin_transaction(bool write);
    void commit();
    void rollback();
    bool is_in_transaction() const;

    /// Rows modified by the most recent INSERT/UPDATE/DELETE.
    int64_t changes() const;

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    connection_options options_;
};

} // namespace folio

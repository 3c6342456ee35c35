#include "folio/connection.hpp"
#include "folio/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace folio {

std::string quote_identifier(const std::string& name) {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '"';
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }
}

statement::~statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

statement::statement(statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
}

statement& statement::operator=(statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        sql_ = std::move(other.sql_);
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }
    return *this;
}

void statement::bind(int index, const column_value_t& value) {
    int rc = std::visit([&](auto&& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt_, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt_, index, 0);
            }
            return sqlite3_bind_blob(stmt_, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);

    if (rc != SQLITE_OK) {
        throw db_error("Failed to bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(db_));
    }
}

void statement::bind_all(const std::vector<column_value_t>& params) {
    int index = 1;
    for (const auto& param : params) {
        bind(index++, param);
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    auto error = std::string(sqlite3_errmsg(db_));
    LOG_ERROR("db", "Step failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
    throw db_error("Execution failed: " + error);
}

void statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

bool statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

int64_t statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double statement::column_double(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string statement::column_text(int index) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    int size = sqlite3_column_bytes(stmt_, index);
    return text ? std::string(text, static_cast<size_t>(size)) : std::string();
}

column_value_t statement::column(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(stmt_, index);
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, index);
        case SQLITE_TEXT:
            return column_text(index);
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt_, index);
            int size = sqlite3_column_bytes(stmt_, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

// ============================================================================
// connection
// ============================================================================

connection::connection(const std::string& path, connection_options options)
    : path_(path), options_(options) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database '" + path + "': " + error);
    }

    // Set busy timeout before anything that might contend with other connections
    sqlite3_busy_timeout(db_, options_.busy_timeout_ms);

    try {
        execute("PRAGMA journal_mode = WAL");
        execute(options_.relaxed_durability ? "PRAGMA synchronous = NORMAL"
                                            : "PRAGMA synchronous = FULL");
        execute("PRAGMA temp_store = MEMORY");
    } catch (const db_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    LOG_DEBUG("db", "Opened connection to %s", path.c_str());
}

connection::~connection() {
    if (db_) {
        // Passive checkpoint never waits on readers held by other connections
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
        sqlite3_close_v2(db_);
    }
}

connection::connection(connection&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), options_(other.options_) {
    other.db_ = nullptr;
}

connection& connection::operator=(connection&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close_v2(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        options_ = other.options_;
        other.db_ = nullptr;
    }
    return *this;
}

void connection::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
    } else {
        statement stmt(db_, sql);
        stmt.bind_all(params);
        while (stmt.step()) {
        }
    }
}

std::vector<connection::row_t> connection::query(const std::string& sql,
                                                 const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);

    std::vector<row_t> results;
    int col_count = stmt.column_count();
    while (stmt.step()) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt.handle(), i);
            row[name] = stmt.column(i);
        }
        results.push_back(std::move(row));
    }
    return results;
}

statement connection::prepare(const std::string& sql) {
    return statement(db_, sql);
}

bool connection::table_exists(const std::string& name) const {
    statement stmt(db_, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
    stmt.bind(1, name);
    return stmt.step();
}

std::vector<std::string> connection::table_names() const {
    statement stmt(db_, "SELECT name FROM sqlite_master WHERE type='table' ORDER BY name");
    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(stmt.column_text(0));
    }
    return names;
}

std::unordered_map<std::string, std::string> connection::get_table_info(const std::string& table) const {
    std::unordered_map<std::string, std::string> columns;

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    statement stmt(db_, "PRAGMA table_info(" + quote_identifier(table) + ")");
    while (stmt.step()) {
        auto name = stmt.column_text(1);
        auto type = stmt.column_text(2);
        // Normalize type to uppercase for comparison
        for (char& c : type) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        columns[name] = type;
    }
    return columns;
}

std::vector<std::string> connection::get_index_names(const std::string& table) const {
    statement stmt(db_, "SELECT name FROM sqlite_master WHERE type='index' AND tbl_name=? AND sql IS NOT NULL");
    stmt.bind(1, table);
    std::vector<std::string> names;
    while (stmt.step()) {
        names.push_back(stmt.column_text(0));
    }
    return names;
}

void connection::begin_transaction(bool write) {
    // IMMEDIATE takes the write lock up front so a writer never fails midway
    // on lock upgrade; readers stay deferred and see a WAL snapshot.
    const char* sql = write ? "BEGIN IMMEDIATE" : "BEGIN";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // The busy handler already waited busy_timeout_ms. Keep retrying with
    // backoff for SQLITE_BUSY/SQLITE_LOCKED up to a bounded total.
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && total_waited_ms < max_total_wait_ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void connection::commit() {
    execute("COMMIT");
}

void connection::rollback() {
    execute("ROLLBACK");
}

bool connection::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

int64_t connection::changes() const {
    return sqlite3_changes64(db_);
}

} // namespace folio

#include "folio/sqlite_query.hpp"
#include "folio/log.hpp"
#include <limits>
#include <sstream>

namespace folio {

// ============================================================================
// sqlite_reader
// ============================================================================

int sqlite_reader::column(size_t index) const {
    if (index > collection_.property_count()) {
        throw illegal_argument_error("Invalid property index " + std::to_string(index) +
                                     " for collection '" + collection_.name + "'");
    }
    return static_cast<int>(index);
}

document_id_t sqlite_reader::read_id() const {
    return stmt_.column_int64(0);
}

bool sqlite_reader::is_null(size_t index) const {
    return stmt_.column_is_null(column(index));
}

bool sqlite_reader::read_bool(size_t index) const {
    int col = column(index);
    return !stmt_.column_is_null(col) && stmt_.column_int64(col) != 0;
}

uint8_t sqlite_reader::read_byte(size_t index) const {
    int col = column(index);
    return stmt_.column_is_null(col) ? 0 : static_cast<uint8_t>(stmt_.column_int64(col));
}

int32_t sqlite_reader::read_int(size_t index) const {
    int col = column(index);
    if (stmt_.column_is_null(col)) return std::numeric_limits<int32_t>::min();
    return static_cast<int32_t>(stmt_.column_int64(col));
}

float sqlite_reader::read_float(size_t index) const {
    int col = column(index);
    if (stmt_.column_is_null(col)) return std::numeric_limits<float>::quiet_NaN();
    return static_cast<float>(stmt_.column_double(col));
}

int64_t sqlite_reader::read_long(size_t index) const {
    int col = column(index);
    if (stmt_.column_is_null(col)) return std::numeric_limits<int64_t>::min();
    return stmt_.column_int64(col);
}

double sqlite_reader::read_double(size_t index) const {
    int col = column(index);
    if (stmt_.column_is_null(col)) return std::numeric_limits<double>::quiet_NaN();
    return stmt_.column_double(col);
}

std::optional<std::string> sqlite_reader::read_string(size_t index) const {
    int col = column(index);
    if (stmt_.column_is_null(col)) return std::nullopt;
    return stmt_.column_text(col);
}

nlohmann::json sqlite_reader::read_json(size_t index) const {
    int col = column(index);
    if (stmt_.column_is_null(col)) return nullptr;
    auto text = stmt_.column_text(col);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("query", "Corrupt JSON in %s column %d: %s", collection_.name.c_str(), col, e.what());
        throw db_error("Corrupt JSON value in collection '" + collection_.name + "': " + e.what());
    }
}

const sqlite_collection* sqlite_reader::object_collection(size_t index) const {
    const auto& prop = collection_.property_at(index);
    if (!is_object_type(prop.type) || !prop.target_id) return nullptr;
    auto it = collections_.find(*prop.target_id);
    return it != collections_.end() ? &it->second : nullptr;
}

// ============================================================================
// sqlite_cursor
// ============================================================================

const sqlite_reader* sqlite_cursor::next() {
    if (!txn_.is_active()) {
        throw illegal_argument_error("Cursor over '" + reader_.collection().name +
                                     "' outlived its transaction, which was already committed or aborted");
    }
    if (done_) return nullptr;
    if (!stmt_.step()) {
        done_ = true;
        return nullptr;
    }
    return &reader_;
}

// ============================================================================
// sqlite_query
// ============================================================================

sqlite_cursor sqlite_query::cursor(sqlite_txn& txn, uint32_t offset, std::optional<uint32_t> limit) const {
    std::ostringstream sql;
    sql << "SELECT " << collection_.column(0);
    for (size_t i = 1; i <= collection_.property_count(); ++i) {
        sql << ", " << collection_.column(i);
    }
    sql << " FROM " << collection_.table();
    if (!where_sql_.empty()) {
        sql << " WHERE " << where_sql_;
    }
    sql << " ORDER BY " << order_sql_;
    // SQLite requires LIMIT before OFFSET; -1 means unbounded
    sql << " LIMIT " << (limit ? static_cast<int64_t>(*limit) : -1) << " OFFSET " << offset;

    auto stmt = txn.conn().prepare(sql.str());
    stmt.bind_all(params_);
    LOG_DEBUG("query", "%s", sql.str().c_str());
    return sqlite_cursor(txn, std::move(stmt), collection_, collections_);
}

int64_t sqlite_query::count(sqlite_txn& txn) const {
    std::string sql = "SELECT COUNT(*) FROM " + collection_.table();
    if (!where_sql_.empty()) {
        sql += " WHERE " + where_sql_;
    }
    auto stmt = txn.conn().prepare(sql);
    stmt.bind_all(params_);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

int64_t sqlite_query::remove(sqlite_txn& txn) const {
    if (!txn.is_write()) {
        throw illegal_argument_error("Deleting from '" + collection_.name + "' requires a write transaction");
    }
    std::string sql = "DELETE FROM " + collection_.table();
    if (!where_sql_.empty()) {
        sql += " WHERE " + where_sql_;
    }
    auto& conn = txn.conn();
    conn.execute(sql, params_);
    return conn.changes();
}

// ============================================================================
// sqlite_query_builder
// ============================================================================

void sqlite_query_builder::add_sort(size_t property, sort_order order, bool case_sensitive) {
    std::string term = collection_.column(property);
    if (!case_sensitive) {
        term += " COLLATE NOCASE";
    }
    term += order == sort_order::ascending ? " ASC" : " DESC";
    sort_terms_.push_back(std::move(term));
    if (property == 0) {
        sorted_by_id_ = true;
    }
}

sqlite_query sqlite_query_builder::build() const {
    std::string where_sql;
    std::vector<column_value_t> params;
    if (filter_) {
        std::ostringstream sql;
        filter_->to_sql(collection_, sql, params);
        where_sql = sql.str();
    }

    // Documents come back in id order unless sorted otherwise; the id also
    // breaks ties between equal sort keys
    std::string order_sql;
    for (const auto& term : sort_terms_) {
        if (!order_sql.empty()) order_sql += ", ";
        order_sql += term;
    }
    if (!sorted_by_id_) {
        if (!order_sql.empty()) order_sql += ", ";
        order_sql += collection_.column(0) + " ASC";
    }

    return sqlite_query(collection_, collections_, std::move(where_sql), std::move(params), std::move(order_sql));
}

} // namespace folio

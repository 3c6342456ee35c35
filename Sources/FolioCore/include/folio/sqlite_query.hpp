#pragma once

#include "connection.hpp"
#include "sqlite_collection.hpp"
#include "sqlite_filter.hpp"
#include "sqlite_txn.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio {

/// Positional view of the current row of a cursor.
///
/// Index 0 is the id, index i >= 1 is the i-th declared property. Reading a
/// NULL numeric property yields the null sentinel of its type (INT32_MIN,
/// INT64_MIN, NaN, false, 0); strings yield nullopt.
class sqlite_reader {
public:
    sqlite_reader(const statement& stmt, const sqlite_collection& collection,
                  const collection_map& collections)
        : stmt_(stmt), collection_(collection), collections_(collections) {}

    document_id_t read_id() const;
    bool is_null(size_t index) const;
    bool read_bool(size_t index) const;
    uint8_t read_byte(size_t index) const;
    int32_t read_int(size_t index) const;
    float read_float(size_t index) const;
    int64_t read_long(size_t index) const;
    double read_double(size_t index) const;
    std::optional<std::string> read_string(size_t index) const;

    /// Lists, objects and Json properties. NULL reads as a JSON null.
    nlohmann::json read_json(size_t index) const;

    /// Embedded collection an Object / ObjectList property decodes into,
    /// nullptr for every other property.
    const sqlite_collection* object_collection(size_t index) const;

    const sqlite_collection& collection() const { return collection_; }

private:
    int column(size_t index) const;

    const statement& stmt_;
    const sqlite_collection& collection_;
    const collection_map& collections_;
};

/// Forward-only iteration over query results within the transaction it was
/// opened with. next() throws illegal_argument_error once that transaction is
/// committed or aborted.
class sqlite_cursor {
public:
    sqlite_cursor(const sqlite_txn& txn, statement stmt, const sqlite_collection& collection,
                  const collection_map& collections)
        : txn_(txn), stmt_(std::move(stmt)), reader_(stmt_, collection, collections) {}

    // The reader refers to stmt_, so the cursor stays where it was built
    sqlite_cursor(const sqlite_cursor&) = delete;
    sqlite_cursor& operator=(const sqlite_cursor&) = delete;
    sqlite_cursor(sqlite_cursor&&) = delete;
    sqlite_cursor& operator=(sqlite_cursor&&) = delete;

    /// The next row, or nullptr once exhausted.
    const sqlite_reader* next();

private:
    const sqlite_txn& txn_;
    statement stmt_;
    sqlite_reader reader_;
    bool done_ = false;
};

/// A built query: SQL and bound values fixed, executable against any
/// transaction of the owning instance.
class sqlite_query {
public:
    sqlite_query(const sqlite_collection& collection, const collection_map& collections,
                 std::string where_sql, std::vector<column_value_t> params, std::string order_sql)
        : collection_(collection)
        , collections_(collections)
        , where_sql_(std::move(where_sql))
        , params_(std::move(params))
        , order_sql_(std::move(order_sql)) {}

    sqlite_cursor cursor(sqlite_txn& txn, uint32_t offset = 0,
                         std::optional<uint32_t> limit = std::nullopt) const;

    int64_t count(sqlite_txn& txn) const;

    /// Delete every matching document. Requires a write transaction.
    int64_t remove(sqlite_txn& txn) const;

    const std::string& where_sql() const { return where_sql_; }

private:
    const sqlite_collection& collection_;
    const collection_map& collections_;
    std::string where_sql_;
    std::vector<column_value_t> params_;
    std::string order_sql_;
};

/// Collects filter and sort order for one collection. Created by
/// sqlite_instance::query() without a transaction.
class sqlite_query_builder {
public:
    sqlite_query_builder(const sqlite_collection& collection, const collection_map& collections)
        : collection_(collection), collections_(collections) {}

    void set_filter(filter f) { filter_ = std::move(f); }

    /// Throws illegal_argument_error for an unknown property index.
    void add_sort(size_t property, sort_order order = sort_order::ascending, bool case_sensitive = true);

    sqlite_query build() const;

private:
    const sqlite_collection& collection_;
    const collection_map& collections_;
    std::optional<filter> filter_;
    std::vector<std::string> sort_terms_;
    bool sorted_by_id_ = false;
};

} // namespace folio

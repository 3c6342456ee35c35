#pragma once

#include "connection.hpp"
#include "sqlite_collection.hpp"
#include "sqlite_txn.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace folio {

/// Builds one document positionally: write_id() first (top-level documents
/// only), then exactly one value per declared property, in order.
class sqlite_writer {
public:
    sqlite_writer(const sqlite_collection& collection, const collection_map& collections);

    void write_id(document_id_t id);
    void write_null();
    void write_bool(bool value);
    void write_byte(uint8_t value);
    void write_int(int32_t value);
    void write_float(float value);
    void write_long(int64_t value);
    void write_double(double value);
    void write_string(std::optional<std::string_view> value);

    /// Json, Object and list properties.
    void write_json(const nlohmann::json& value);

    /// Writer for the embedded collection of the next (Object) property.
    sqlite_writer begin_object() const;

    /// Store a completed child writer as the next property's value.
    void end_object(const sqlite_writer& child);

    [[nodiscard]] bool is_complete() const;
    [[nodiscard]] std::optional<document_id_t> id() const { return id_; }
    [[nodiscard]] const std::vector<column_value_t>& values() const { return values_; }

    /// Property values keyed by name (the stored form of embedded objects).
    nlohmann::json to_json_object() const;

    void reset();

private:
    const sqlite_property& next_property(const char* written, bool (*accepts)(data_type));

    const sqlite_collection& collection_;
    const collection_map& collections_;
    std::optional<document_id_t> id_;
    std::vector<column_value_t> values_;
};

/// Writes up to `count` documents into one collection within a write
/// transaction. Documents with an existing id are replaced.
class sqlite_insert {
public:
    sqlite_insert(sqlite_txn& txn, const sqlite_collection& collection,
                  const collection_map& collections, size_t count);

    sqlite_writer& writer() { return writer_; }

    /// Persist the document held by writer() and reset it for the next one.
    /// Throws illegal_argument_error once the transaction is committed or aborted.
    void insert();

    [[nodiscard]] size_t inserted() const noexcept { return inserted_; }
    [[nodiscard]] size_t remaining() const noexcept { return count_ - inserted_; }

    /// Release the prepared statement. Returns the number of documents written.
    size_t finish();

private:
    sqlite_txn& txn_;
    const sqlite_collection& collection_;
    statement stmt_;
    size_t count_;
    size_t inserted_ = 0;
    bool finished_ = false;
    sqlite_writer writer_;
};

} // namespace folio

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <vector>
#include <variant>

namespace folio {

// Stable collection identifier (hash of the collection name)
using collection_id_t = uint64_t;

// Document id, stored as the table's INTEGER PRIMARY KEY
using document_id_t = int64_t;

// Values exchanged with SQLite
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Column affinity used when creating tables
enum class column_type {
    integer,
    real,
    text,
    blob
};

// Declared property type
enum class data_type {
    boolean,
    byte,
    integer,
    floating,
    long_integer,
    double_floating,
    string,
    object,
    json,
    bool_list,
    byte_list,
    int_list,
    float_list,
    long_list,
    double_list,
    string_list,
    object_list
};

/// Schema spelling of a data type ("Bool", "Long", "StringList", ...).
std::string_view data_type_name(data_type type) noexcept;

/// Inverse of data_type_name. Returns nullopt for unknown names.
std::optional<data_type> data_type_from_name(std::string_view name) noexcept;

/// Lists, objects and raw JSON are all stored as JSON text.
inline bool is_json_encoded(data_type type) noexcept {
    switch (type) {
        case data_type::object:
        case data_type::json:
        case data_type::bool_list:
        case data_type::byte_list:
        case data_type::int_list:
        case data_type::float_list:
        case data_type::long_list:
        case data_type::double_list:
        case data_type::string_list:
        case data_type::object_list:
            return true;
        default:
            return false;
    }
}

inline bool is_object_type(data_type type) noexcept {
    return type == data_type::object || type == data_type::object_list;
}

inline column_type column_type_for(data_type type) noexcept {
    switch (type) {
        case data_type::boolean:
        case data_type::byte:
        case data_type::integer:
        case data_type::long_integer:
            return column_type::integer;
        case data_type::floating:
        case data_type::double_floating:
            return column_type::real;
        default:
            return column_type::text;
    }
}

inline const char* sql_type_string(column_type type) noexcept {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "TEXT";
}

/// Conditions under which an instance compacts its file on open.
struct compact_condition {
    uint64_t min_file_size = 0;
    uint64_t min_bytes = 0;
    double min_ratio = 0.0;
};

} // namespace folio

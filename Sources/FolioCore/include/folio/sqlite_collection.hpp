#pragma once

#include "types.hpp"
#include "error.hpp"
#include "connection.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace folio {

// Primary key column of every collection table
inline constexpr const char* id_column = "_id";

struct sqlite_property {
    std::string name;
    data_type type;
    std::optional<collection_id_t> target_id;

    sqlite_property(std::string n, data_type t, std::optional<collection_id_t> target)
        : name(std::move(n)), type(t), target_id(target) {}
};

/// Runtime descriptor of one collection: its table name and the addressable
/// properties in declaration order.
///
/// Property indexes used by readers, writers and filters: 0 is the id,
/// i >= 1 is properties[i - 1].
struct sqlite_collection {
    std::string name;
    std::vector<sqlite_property> properties;
    bool embedded = false;

    sqlite_collection(std::string n, std::vector<sqlite_property> props, bool emb = false)
        : name(std::move(n)), properties(std::move(props)), embedded(emb) {}

    size_t property_count() const { return properties.size(); }

    /// Property for a reader/filter index (>= 1). Throws for the id or out of range.
    const sqlite_property& property_at(size_t index) const {
        if (index == 0 || index > properties.size()) {
            throw illegal_argument_error("Invalid property index " + std::to_string(index) +
                                         " for collection '" + name + "'");
        }
        return properties[index - 1];
    }

    /// Quoted column for a reader/filter index, including the id at 0.
    std::string column(size_t index) const {
        if (index == 0) return quote_identifier(id_column);
        return quote_identifier(property_at(index).name);
    }

    std::string table() const { return quote_identifier(name); }
};

using collection_map = std::unordered_map<collection_id_t, sqlite_collection>;

} // namespace folio

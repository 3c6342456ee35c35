#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace folio {

/// 64-bit FNV-1a. Used for collection ids, link targets and registry keys.
uint64_t hash_name(std::string_view text) noexcept;

struct property_schema {
    // Unnamed properties keep their slot in the schema but are not addressable
    std::optional<std::string> name;
    data_type type = data_type::long_integer;
    // Embedded collection for object / object list properties
    std::optional<std::string> target;

    property_schema() = default;
    property_schema(std::optional<std::string> n, data_type t, std::optional<std::string> tgt = std::nullopt)
        : name(std::move(n)), type(t), target(std::move(tgt)) {}

    std::optional<collection_id_t> target_id() const {
        if (!target) return std::nullopt;
        return hash_name(*target);
    }
};

struct index_schema {
    std::string name;
    std::vector<std::string> properties;
    bool unique = false;
    bool hash = false;

    index_schema() = default;
    index_schema(std::string n, std::vector<std::string> props, bool u, bool h = false)
        : name(std::move(n)), properties(std::move(props)), unique(u), hash(h) {}
};

struct collection_schema {
    std::string name;
    std::vector<property_schema> properties;
    std::vector<index_schema> indexes;
    bool embedded = false;

    collection_schema() = default;
    collection_schema(std::string n, std::vector<property_schema> props,
                      std::vector<index_schema> idx, bool emb)
        : name(std::move(n)), properties(std::move(props)), indexes(std::move(idx)), embedded(emb) {}

    collection_id_t id() const { return hash_name(name); }
};

struct schema {
    std::vector<collection_schema> collections;

    schema() = default;
    explicit schema(std::vector<collection_schema> cols) : collections(std::move(cols)) {}
};

/// Structural validation. Throws schema_error describing the first problem found.
void verify_schema(const schema& s);

/// Deterministic fingerprint. Index declaration order does not contribute;
/// collection and property order do, because both are positional.
uint64_t hash_schema(const schema& s);

/// JSON form: an array of collection objects.
schema parse_schema(const std::string& json_text);
std::string to_json_string(const schema& s);

} // namespace folio

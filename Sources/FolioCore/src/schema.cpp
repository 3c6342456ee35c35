#include "folio/schema.hpp"
#include "folio/error.hpp"
#include "folio/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace folio {

uint64_t hash_name(std::string_view text) noexcept {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

// ============================================================================
// JSON mapping
// ============================================================================

void to_json(json& j, const property_schema& p) {
    j = json::object();
    j["name"] = p.name ? json(*p.name) : json(nullptr);
    j["type"] = std::string(data_type_name(p.type));
    if (p.target) {
        j["target"] = *p.target;
    }
}

void from_json(const json& j, property_schema& p) {
    auto name_it = j.find("name");
    if (name_it != j.end() && !name_it->is_null()) {
        p.name = name_it->get<std::string>();
    } else {
        p.name = std::nullopt;
    }

    auto type_name = j.at("type").get<std::string>();
    auto type = data_type_from_name(type_name);
    if (!type) {
        throw schema_error("Unknown property type '" + type_name + "'");
    }
    p.type = *type;

    auto target_it = j.find("target");
    if (target_it != j.end() && !target_it->is_null()) {
        p.target = target_it->get<std::string>();
    } else {
        p.target = std::nullopt;
    }
}

void to_json(json& j, const index_schema& idx) {
    j = json{
        {"name", idx.name},
        {"properties", idx.properties},
        {"unique", idx.unique},
        {"hash", idx.hash}
    };
}

void from_json(const json& j, index_schema& idx) {
    j.at("name").get_to(idx.name);
    j.at("properties").get_to(idx.properties);
    idx.unique = j.value("unique", false);
    idx.hash = j.value("hash", false);
}

void to_json(json& j, const collection_schema& c) {
    j = json{
        {"name", c.name},
        {"embedded", c.embedded},
        {"properties", c.properties},
        {"indexes", c.indexes}
    };
}

void from_json(const json& j, collection_schema& c) {
    j.at("name").get_to(c.name);
    c.embedded = j.value("embedded", false);
    c.properties = j.value("properties", std::vector<property_schema>{});
    c.indexes = j.value("indexes", std::vector<index_schema>{});
}

schema parse_schema(const std::string& json_text) {
    try {
        auto j = json::parse(json_text);
        if (!j.is_array()) {
            throw schema_error("Schema JSON must be an array of collections");
        }
        return schema(j.get<std::vector<collection_schema>>());
    } catch (const json::exception& e) {
        throw schema_error(std::string("Invalid schema JSON: ") + e.what());
    }
}

std::string to_json_string(const schema& s) {
    json j = s.collections;
    return j.dump();
}

uint64_t hash_schema(const schema& s) {
    // Canonical form: indexes sorted by name, object keys sorted by nlohmann
    json canonical = json::array();
    for (const auto& col : s.collections) {
        auto indexes = col.indexes;
        std::sort(indexes.begin(), indexes.end(),
                  [](const index_schema& a, const index_schema& b) { return a.name < b.name; });
        json c = col;
        c["indexes"] = indexes;
        canonical.push_back(std::move(c));
    }
    return hash_name(canonical.dump());
}

// ============================================================================
// Validation
// ============================================================================

void verify_schema(const schema& s) {
    if (s.collections.empty()) {
        throw schema_error("Schema must declare at least one collection");
    }

    std::unordered_map<std::string, const collection_schema*> by_name;
    std::unordered_set<collection_id_t> ids;
    for (const auto& col : s.collections) {
        if (col.name.empty()) {
            throw schema_error("Collection name must not be empty");
        }
        if (col.name[0] == '_') {
            throw schema_error("Collection name '" + col.name + "' must not start with '_'");
        }
        if (!by_name.emplace(col.name, &col).second) {
            throw schema_error("Duplicate collection name '" + col.name + "'");
        }
        if (!ids.insert(col.id()).second) {
            throw schema_error("Collection id of '" + col.name + "' collides with another collection");
        }
    }

    for (const auto& col : s.collections) {
        std::unordered_set<std::string> prop_names;
        for (const auto& prop : col.properties) {
            if (prop.name) {
                if (prop.name->empty()) {
                    throw schema_error("Empty property name in collection '" + col.name + "'");
                }
                if ((*prop.name)[0] == '_') {
                    throw schema_error("Property name '" + *prop.name + "' in '" + col.name +
                                       "' must not start with '_'");
                }
                if (!prop_names.insert(*prop.name).second) {
                    throw schema_error("Duplicate property '" + *prop.name + "' in collection '" +
                                       col.name + "'");
                }
            }

            if (is_object_type(prop.type)) {
                if (!prop.target) {
                    throw schema_error("Object property in '" + col.name + "' has no target collection");
                }
                auto target = by_name.find(*prop.target);
                if (target == by_name.end()) {
                    throw schema_error("Target collection '" + *prop.target + "' of '" + col.name +
                                       "' does not exist");
                }
                if (!target->second->embedded) {
                    throw schema_error("Target collection '" + *prop.target + "' must be embedded");
                }
            } else if (prop.target) {
                throw schema_error("Only object properties may declare a target (collection '" +
                                   col.name + "')");
            }
        }

        if (col.embedded && !col.indexes.empty()) {
            throw schema_error("Embedded collection '" + col.name + "' must not declare indexes");
        }

        std::unordered_set<std::string> index_names;
        for (const auto& idx : col.indexes) {
            if (idx.name.empty() || !index_names.insert(idx.name).second) {
                throw schema_error("Invalid or duplicate index name '" + idx.name + "' in '" + col.name + "'");
            }
            if (idx.properties.empty()) {
                throw schema_error("Index '" + idx.name + "' in '" + col.name + "' has no properties");
            }
            for (const auto& prop : idx.properties) {
                if (prop_names.find(prop) == prop_names.end()) {
                    throw schema_error("Index '" + idx.name + "' references unknown property '" + prop +
                                       "' in '" + col.name + "'");
                }
            }
        }
    }

    LOG_DEBUG("schema", "Verified schema with %zu collections", s.collections.size());
}

} // namespace folio

#pragma once

#include "types.hpp"
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace folio {

struct instance_config {
    std::string name;

    // Directory holding <name>.sqlite. Must be set and must already exist.
    std::optional<std::string> directory;

    // Accepted for parity with size-capped backends; SQLite grows on demand
    int64_t max_size_mib = 128;

    bool relaxed_durability = false;

    // Run VACUUM at open time when the free space crosses all thresholds
    std::optional<compact_condition> compact;

    instance_config() = default;
    instance_config(std::string n, std::optional<std::string> dir)
        : name(std::move(n)), directory(std::move(dir)) {}
};

/// What a storage backend must provide to serve as an instance.
template<typename T>
concept instance_backend = requires(T& inst, const T& cinst, typename T::txn_type txn,
                                    size_t index, collection_id_t id, bool write) {
    typename T::txn_type;
    typename T::query_builder_type;
    typename T::insert_type;
    { cinst.schema_hash() } -> std::convertible_to<uint64_t>;
    { cinst.collection_id(index) } -> std::same_as<std::optional<collection_id_t>>;
    { inst.begin_txn(write) } -> std::same_as<typename T::txn_type>;
    inst.commit_txn(std::move(txn));
    inst.abort_txn(std::move(txn));
    { cinst.query(id) } -> std::same_as<typename T::query_builder_type>;
    { inst.insert(txn, id, index) } -> std::same_as<typename T::insert_type>;
};

} // namespace folio

#pragma once

#include "connection_pool.hpp"
#include "instance.hpp"
#include "instance_registry.hpp"
#include "schema.hpp"
#include "sqlite_collection.hpp"
#include "sqlite_insert.hpp"
#include "sqlite_query.hpp"
#include "sqlite_txn.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio {

/// One open database file: the collections derived from its schema, the
/// schema fingerprint and the per-thread connection pool.
///
/// Everything except the pool is fixed at construction. Instances are shared
/// through an instance_registry so every open of a name sees the same object.
class sqlite_instance {
public:
    using txn_type = sqlite_txn;
    using query_builder_type = sqlite_query_builder;
    using insert_type = sqlite_insert;
    using registry_type = instance_registry<sqlite_instance>;

    /// Process-wide registry behind open(config, schema).
    static registry_type& default_registry();

    static std::shared_ptr<sqlite_instance> open(const instance_config& config, const schema& s);

    /// Returns the instance already registered under config.name when its
    /// fingerprint matches, otherwise validates, migrates and registers a
    /// new one. Throws illegal_argument_error when config.directory is unset,
    /// schema_error, schema_mismatch_error, migration_error or db_error.
    static std::shared_ptr<sqlite_instance> open(registry_type& registry,
                                                 const instance_config& config, const schema& s);

    sqlite_instance(const sqlite_instance&) = delete;
    sqlite_instance& operator=(const sqlite_instance&) = delete;

    const std::string& name() const { return name_; }
    const std::string& path() const { return path_; }
    uint64_t schema_hash() const noexcept { return schema_hash_; }

    /// Id of the index-th collection in schema order, embedded ones included.
    std::optional<collection_id_t> collection_id(size_t index) const;
    size_t collection_count() const { return collection_ids_.size(); }

    /// nullptr for an unknown id.
    const sqlite_collection* collection(collection_id_t id) const;

    connection_pool& pool() { return *pool_; }

    // Transactions

    sqlite_txn begin_txn(bool write);
    void commit_txn(sqlite_txn txn);
    void abort_txn(sqlite_txn txn) noexcept;

    // Dispatch. Unknown or embedded collection ids throw illegal_argument_error.

    sqlite_query_builder query(collection_id_t id) const;

    /// Requires a write transaction.
    sqlite_insert insert(sqlite_txn& txn, collection_id_t id, size_t count) const;

    int64_t count(sqlite_txn& txn, collection_id_t id) const;
    int64_t clear(sqlite_txn& txn, collection_id_t id) const;

    /// Delete one document. Returns false if no document had that id.
    bool remove(sqlite_txn& txn, collection_id_t id, document_id_t document) const;

private:
    sqlite_instance(std::string name, std::string path, uint64_t schema_hash,
                    collection_map collections, std::vector<collection_id_t> collection_ids,
                    std::shared_ptr<connection_pool> pool);

    static std::shared_ptr<sqlite_instance> open_instance(const instance_config& config, const schema& s,
                                                          uint64_t schema_hash);
    static void compact_if_needed(connection& conn, const compact_condition& condition);
    static collection_map get_collections(const schema& s);

    const sqlite_collection& table_collection(collection_id_t id) const;

    std::string name_;
    std::string path_;
    uint64_t schema_hash_;
    collection_map collections_;
    std::vector<collection_id_t> collection_ids_;
    std::shared_ptr<connection_pool> pool_;
};

static_assert(instance_backend<sqlite_instance>);

} // namespace folio

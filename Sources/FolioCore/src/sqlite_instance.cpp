#include "folio/sqlite_instance.hpp"
#include "folio/log.hpp"
#include "folio/sqlite_schema_manager.hpp"
#include <cinttypes>

namespace folio {

namespace {

constexpr const char* file_extension = ".sqlite";

std::string instance_path(const std::string& directory, const std::string& name) {
    std::string path = directory;
    if (!path.empty() && path.back() != '/') {
        path += '/';
    }
    return path + name + file_extension;
}

int64_t pragma_value(connection& conn, const char* pragma) {
    auto stmt = conn.prepare(std::string("PRAGMA ") + pragma);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

} // namespace

sqlite_instance::sqlite_instance(std::string name, std::string path, uint64_t schema_hash,
                                 collection_map collections, std::vector<collection_id_t> collection_ids,
                                 std::shared_ptr<connection_pool> pool)
    : name_(std::move(name))
    , path_(std::move(path))
    , schema_hash_(schema_hash)
    , collections_(std::move(collections))
    , collection_ids_(std::move(collection_ids))
    , pool_(std::move(pool)) {}

std::shared_ptr<sqlite_instance> sqlite_instance::open(const instance_config& config, const schema& s) {
    return open(default_registry(), config, s);
}

std::shared_ptr<sqlite_instance> sqlite_instance::open(registry_type& registry,
                                                       const instance_config& config, const schema& s) {
    if (config.name.empty()) {
        throw illegal_argument_error("Instance name must not be empty");
    }
    if (!config.directory) {
        throw illegal_argument_error("Instance '" + config.name + "' requires a directory");
    }

    const uint64_t hash = hash_schema(s);
    return registry.get_or_open(config.name, hash, [&] {
        return open_instance(config, s, hash);
    });
}

std::shared_ptr<sqlite_instance> sqlite_instance::open_instance(const instance_config& config, const schema& s,
                                                                uint64_t schema_hash) {
    verify_schema(s);

    auto path = instance_path(*config.directory, config.name);
    connection_options options;
    options.relaxed_durability = config.relaxed_durability;

    {
        connection conn(path, options);
        sqlite_schema_manager(conn).perform_migration(s);
        if (config.compact) {
            compact_if_needed(conn, *config.compact);
        }
    }

    std::vector<collection_id_t> ids;
    ids.reserve(s.collections.size());
    for (const auto& col : s.collections) {
        ids.push_back(col.id());
    }

    LOG_INFO("instance", "Opened %s at %s (schema %016" PRIx64 ")",
             config.name.c_str(), path.c_str(), schema_hash);

    auto pool = std::make_shared<connection_pool>(path, options);
    return std::shared_ptr<sqlite_instance>(new sqlite_instance(
        config.name, std::move(path), schema_hash, get_collections(s), std::move(ids), std::move(pool)));
}

void sqlite_instance::compact_if_needed(connection& conn, const compact_condition& condition) {
    try {
        const auto page_size = static_cast<uint64_t>(pragma_value(conn, "page_size"));
        const auto file_size = static_cast<uint64_t>(pragma_value(conn, "page_count")) * page_size;
        const auto free_bytes = static_cast<uint64_t>(pragma_value(conn, "freelist_count")) * page_size;
        if (file_size == 0) return;

        const double ratio = static_cast<double>(free_bytes) / static_cast<double>(file_size);
        if (file_size >= condition.min_file_size && free_bytes >= condition.min_bytes &&
            ratio >= condition.min_ratio) {
            LOG_INFO("instance", "Compacting %s: %" PRIu64 " of %" PRIu64 " bytes free",
                     conn.path().c_str(), free_bytes, file_size);
            conn.execute("VACUUM");
        }
    } catch (const db_error& e) {
        // The file is still usable uncompacted
        LOG_WARN("instance", "Compaction of %s failed: %s", conn.path().c_str(), e.what());
    }
}

collection_map sqlite_instance::get_collections(const schema& s) {
    collection_map collections;
    for (const auto& col : s.collections) {
        std::vector<sqlite_property> properties;
        for (const auto& prop : col.properties) {
            if (!prop.name) continue;
            properties.emplace_back(*prop.name, prop.type, prop.target_id());
        }
        collections.emplace(col.id(), sqlite_collection(col.name, std::move(properties), col.embedded));
    }
    return collections;
}

std::optional<collection_id_t> sqlite_instance::collection_id(size_t index) const {
    if (index >= collection_ids_.size()) return std::nullopt;
    return collection_ids_[index];
}

const sqlite_collection* sqlite_instance::collection(collection_id_t id) const {
    auto it = collections_.find(id);
    return it != collections_.end() ? &it->second : nullptr;
}

const sqlite_collection& sqlite_instance::table_collection(collection_id_t id) const {
    const auto* col = collection(id);
    if (!col) {
        throw illegal_argument_error("Unknown collection id " + std::to_string(id) +
                                     " in instance '" + name_ + "'");
    }
    if (col->embedded) {
        throw illegal_argument_error("Collection '" + col->name + "' is embedded and has no table");
    }
    return *col;
}

// ============================================================================
// Transactions
// ============================================================================

sqlite_txn sqlite_instance::begin_txn(bool write) {
    return sqlite_txn(pool_, pool_->acquire(), write);
}

void sqlite_instance::commit_txn(sqlite_txn txn) {
    txn.commit();
}

void sqlite_instance::abort_txn(sqlite_txn txn) noexcept {
    txn.abort();
}

// ============================================================================
// Dispatch
// ============================================================================

sqlite_query_builder sqlite_instance::query(collection_id_t id) const {
    return sqlite_query_builder(table_collection(id), collections_);
}

sqlite_insert sqlite_instance::insert(sqlite_txn& txn, collection_id_t id, size_t count) const {
    const auto& col = table_collection(id);
    if (!txn.is_write()) {
        throw illegal_argument_error("Inserting into '" + col.name + "' requires a write transaction");
    }
    return sqlite_insert(txn, col, collections_, count);
}

int64_t sqlite_instance::count(sqlite_txn& txn, collection_id_t id) const {
    return query(id).build().count(txn);
}

int64_t sqlite_instance::clear(sqlite_txn& txn, collection_id_t id) const {
    return query(id).build().remove(txn);
}

bool sqlite_instance::remove(sqlite_txn& txn, collection_id_t id, document_id_t document) const {
    const auto& col = table_collection(id);
    if (!txn.is_write()) {
        throw illegal_argument_error("Deleting from '" + col.name + "' requires a write transaction");
    }
    auto& conn = txn.conn();
    conn.execute("DELETE FROM " + col.table() + " WHERE " + col.column(0) + " = ?", {document});
    return conn.changes() > 0;
}

} // namespace folio

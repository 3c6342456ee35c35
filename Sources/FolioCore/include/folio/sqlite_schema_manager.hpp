#pragma once

#include "connection.hpp"
#include "schema.hpp"
#include <string>

namespace folio {

/// Brings the tables of a SQLite file in line with a validated schema.
///
/// All changes are applied in a single write transaction: new tables are
/// created, columns added, dropped or retyped, indexes synchronized and
/// tables of collections that left the schema dropped. Any failure rolls
/// the whole migration back and surfaces as migration_error.
class sqlite_schema_manager {
public:
    explicit sqlite_schema_manager(connection& conn) : conn_(conn) {}

    void perform_migration(const schema& s);

    static std::string index_name(const collection_schema& collection, const index_schema& index);

private:
    void create_collection_table(const collection_schema& collection);
    void migrate_collection_table(const collection_schema& collection);
    void drop_stale_indexes(const collection_schema& collection);
    void create_missing_indexes(const collection_schema& collection);
    void drop_removed_tables(const schema& s);

    static std::string index_sql(const collection_schema& collection, const index_schema& index);

    connection& conn_;
};

} // namespace folio

#include "folio/sqlite_schema_manager.hpp"
#include "folio/sqlite_collection.hpp"
#include "folio/log.hpp"
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace folio {

std::string sqlite_schema_manager::index_name(const collection_schema& collection, const index_schema& index) {
    return "_i_" + collection.name + "_" + index.name;
}

std::string sqlite_schema_manager::index_sql(const collection_schema& collection, const index_schema& index) {
    std::ostringstream sql;
    sql << "CREATE " << (index.unique ? "UNIQUE " : "") << "INDEX "
        << quote_identifier(index_name(collection, index))
        << " ON " << quote_identifier(collection.name) << " (";
    bool first = true;
    for (const auto& prop : index.properties) {
        if (!first) sql << ", ";
        sql << quote_identifier(prop);
        first = false;
    }
    sql << ")";
    return sql.str();
}

void sqlite_schema_manager::perform_migration(const schema& s) {
    std::string current = "<schema>";
    conn_.begin_transaction(true);
    try {
        for (const auto& collection : s.collections) {
            if (collection.embedded) {
                continue;  // Stored inline as JSON in the owning collection
            }
            current = collection.name;
            if (!conn_.table_exists(collection.name)) {
                create_collection_table(collection);
            } else {
                drop_stale_indexes(collection);
                migrate_collection_table(collection);
            }
            create_missing_indexes(collection);
        }

        current = "<schema>";
        drop_removed_tables(s);
        conn_.commit();
    } catch (const folio_error& e) {
        try {
            conn_.rollback();
        } catch (const db_error& rollback_error) {
            LOG_WARN("migration", "Rollback of failed migration failed: %s", rollback_error.what());
        }
        LOG_ERROR("migration", "Migration failed at %s: %s", current.c_str(), e.what());
        if (e.kind() == error_kind::migration) {
            throw;
        }
        throw migration_error(current, e.what());
    }
}

void sqlite_schema_manager::create_collection_table(const collection_schema& collection) {
    std::ostringstream sql;
    sql << "CREATE TABLE " << quote_identifier(collection.name) << " ("
        << quote_identifier(id_column) << " INTEGER PRIMARY KEY";
    for (const auto& prop : collection.properties) {
        if (!prop.name) continue;
        sql << ", " << quote_identifier(*prop.name) << " "
            << sql_type_string(column_type_for(prop.type));
    }
    sql << ")";
    conn_.execute(sql.str());
    LOG_INFO("migration", "Created table %s", collection.name.c_str());
}

void sqlite_schema_manager::migrate_collection_table(const collection_schema& collection) {
    auto existing = conn_.get_table_info(collection.name);

    std::unordered_map<std::string, std::string> model_cols;
    for (const auto& prop : collection.properties) {
        if (!prop.name) continue;
        model_cols[*prop.name] = sql_type_string(column_type_for(prop.type));
    }

    const auto table = quote_identifier(collection.name);

    // Removed columns, and columns whose type changed (re-added below)
    std::unordered_set<std::string> dropped;
    for (const auto& [col, type] : existing) {
        if (col == id_column) continue;
        auto it = model_cols.find(col);
        if (it == model_cols.end() || it->second != type) {
            dropped.insert(col);
        }
    }

    // SQLite refuses to drop an indexed column. Indexes still declared are
    // recreated by create_missing_indexes().
    if (!dropped.empty()) {
        for (const auto& index : conn_.get_index_names(collection.name)) {
            auto columns = conn_.query("SELECT name FROM pragma_index_info(?)", {index});
            for (const auto& row : columns) {
                const auto* name = std::get_if<std::string>(&row.at("name"));
                if (name && dropped.count(*name)) {
                    conn_.execute("DROP INDEX " + quote_identifier(index));
                    LOG_INFO("migration", "Dropped index %s", index.c_str());
                    break;
                }
            }
        }
    }

    for (const auto& col : dropped) {
        conn_.execute("ALTER TABLE " + table + " DROP COLUMN " + quote_identifier(col));
        LOG_INFO("migration", "Dropped column %s.%s", collection.name.c_str(), col.c_str());
    }

    // Added columns, in declaration order
    for (const auto& prop : collection.properties) {
        if (!prop.name) continue;
        auto it = existing.find(*prop.name);
        const auto& type = model_cols[*prop.name];
        if (it == existing.end() || it->second != type) {
            conn_.execute("ALTER TABLE " + table + " ADD COLUMN " + quote_identifier(*prop.name) + " " + type);
            LOG_INFO("migration", "Added column %s.%s %s", collection.name.c_str(), prop.name->c_str(), type.c_str());
        }
    }
}

void sqlite_schema_manager::drop_stale_indexes(const collection_schema& collection) {
    std::unordered_map<std::string, std::string> expected;
    for (const auto& index : collection.indexes) {
        expected[index_name(collection, index)] = index_sql(collection, index);
    }

    auto rows = conn_.query(
        "SELECT name, sql FROM sqlite_master WHERE type='index' AND tbl_name=? AND sql IS NOT NULL",
        {collection.name});
    for (const auto& row : rows) {
        const auto& name = std::get<std::string>(row.at("name"));
        const auto& sql = std::get<std::string>(row.at("sql"));
        auto it = expected.find(name);
        if (it == expected.end() || it->second != sql) {
            conn_.execute("DROP INDEX " + quote_identifier(name));
            LOG_INFO("migration", "Dropped index %s", name.c_str());
        }
    }
}

void sqlite_schema_manager::create_missing_indexes(const collection_schema& collection) {
    for (const auto& index : collection.indexes) {
        auto name = index_name(collection, index);
        auto rows = conn_.query("SELECT 1 FROM sqlite_master WHERE type='index' AND name=?", {name});
        if (rows.empty()) {
            conn_.execute(index_sql(collection, index));
            LOG_INFO("migration", "Created index %s", name.c_str());
        }
    }
}

void sqlite_schema_manager::drop_removed_tables(const schema& s) {
    std::unordered_set<std::string> declared;
    for (const auto& collection : s.collections) {
        if (!collection.embedded) {
            declared.insert(collection.name);
        }
    }

    for (const auto& table : conn_.table_names()) {
        // Internal tables are never part of a schema
        if (table.rfind("sqlite_", 0) == 0 || (!table.empty() && table[0] == '_')) {
            continue;
        }
        if (declared.find(table) == declared.end()) {
            conn_.execute("DROP TABLE " + quote_identifier(table));
            LOG_INFO("migration", "Dropped table %s", table.c_str());
        }
    }
}

} // namespace folio

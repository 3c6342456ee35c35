#pragma once

// FolioCore - Embedded document database core on SQLite
//
// Usage:
//   #include <FolioCore.hpp>
//
//   folio::schema s = folio::parse_schema(R"([{"name": "Test", "embedded": false,
//       "properties": [{"name": "title", "type": "String"}], "indexes": []}])");
//
//   folio::instance_config config("notes", "/var/lib/notes");
//   auto db = folio::sqlite_instance::open(config, s);
//   auto test = *db->collection_id(0);
//
//   auto txn = db->begin_txn(true);
//   auto ins = db->insert(txn, test, 1);
//   ins.writer().write_id(1);
//   ins.writer().write_string("hello");
//   ins.insert();
//   ins.finish();
//   db->commit_txn(std::move(txn));

#include "folio/log.hpp"
#include "folio/types.hpp"
#include "folio/error.hpp"
#include "folio/schema.hpp"
#include "folio/connection.hpp"
#include "folio/connection_pool.hpp"
#include "folio/sqlite_txn.hpp"
#include "folio/sqlite_collection.hpp"
#include "folio/sqlite_schema_manager.hpp"
#include "folio/sqlite_filter.hpp"
#include "folio/sqlite_query.hpp"
#include "folio/sqlite_insert.hpp"
#include "folio/instance.hpp"
#include "folio/instance_registry.hpp"
#include "folio/sqlite_instance.hpp"

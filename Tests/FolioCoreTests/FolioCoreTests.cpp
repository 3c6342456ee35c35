#undef NDEBUG
#include <FolioCore.hpp>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "ConcurrencyTests.hpp"

using folio_tests::collect_ids;
using folio_tests::fresh_dir;
using folio_tests::pragma_int;
using folio_tests::test_schema;
using folio_tests::write_test_doc;

// ============================================================================
// Schemas used below
// ============================================================================

// Person: 1 name, 2 age, 3 score, 4 tags, 5 address (embedded Address)
static folio::schema person_schema() {
    return folio::schema({
        folio::collection_schema("Person", {
            {"name", folio::data_type::string},
            {"age", folio::data_type::long_integer},
            {"score", folio::data_type::double_floating},
            {"tags", folio::data_type::string_list},
            {"address", folio::data_type::object, "Address"}
        }, {folio::index_schema("age_idx", {"age"}, false)}, false),
        folio::collection_schema("Address", {
            {"city", folio::data_type::string},
            {"zip", folio::data_type::integer}
        }, {}, true)
    });
}

static void write_person(folio::sqlite_writer& w, int64_t id, std::optional<std::string> name, int64_t age,
                         std::optional<double> score, const nlohmann::json& tags,
                         std::optional<std::pair<std::string, int32_t>> address) {
    w.write_id(id);
    if (name) {
        w.write_string(*name);
    } else {
        w.write_string(std::nullopt);
    }
    w.write_long(age);
    if (score) {
        w.write_double(*score);
    } else {
        w.write_null();
    }
    w.write_json(tags);
    if (address) {
        auto child = w.begin_object();
        child.write_string(address->first);
        child.write_int(address->second);
        w.end_object(child);
    } else {
        w.write_null();
    }
}

// ============================================================================
// Test: Schema JSON, fingerprint and validation
// ============================================================================

void test_schema_json() {
    std::cout << "Testing schema JSON and fingerprint..." << std::endl;

    auto s = folio::parse_schema(R"([
        {"name": "Test", "embedded": false,
         "properties": [
            {"name": "prop1", "type": "String"},
            {"name": null, "type": "Long"},
            {"name": "prop2", "type": "StringList"}
         ],
         "indexes": [
            {"name": "b", "properties": ["prop2"], "unique": false, "hash": false},
            {"name": "a", "properties": ["prop1"], "unique": true, "hash": false}
         ]}
    ])");
    assert(s.collections.size() == 1);
    assert(s.collections[0].properties.size() == 3);
    assert(!s.collections[0].properties[1].name.has_value());
    assert(s.collections[0].properties[2].type == folio::data_type::string_list);
    assert(s.collections[0].indexes[1].unique);
    folio::verify_schema(s);

    // The JSON form describes the same schema
    auto again = folio::parse_schema(folio::to_json_string(s));
    assert(folio::hash_schema(again) == folio::hash_schema(s));

    // Index order does not matter, property order does
    auto reordered = s;
    std::swap(reordered.collections[0].indexes[0], reordered.collections[0].indexes[1]);
    assert(folio::hash_schema(reordered) == folio::hash_schema(s));
    std::swap(reordered.collections[0].properties[0], reordered.collections[0].properties[2]);
    assert(folio::hash_schema(reordered) != folio::hash_schema(s));

    // Names and types round-trip
    for (auto type : {folio::data_type::boolean, folio::data_type::double_floating,
                      folio::data_type::object_list, folio::data_type::json}) {
        assert(folio::data_type_from_name(folio::data_type_name(type)) == type);
    }
    assert(folio::data_type_name(folio::data_type::long_integer) == "Long");
    assert(!folio::data_type_from_name("Decimal").has_value());

    bool threw = false;
    try {
        folio::parse_schema("{not json");
    } catch (const folio::schema_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        folio::parse_schema(R"([{"name": "T", "properties": [{"name": "x", "type": "Decimal"}]}])");
    } catch (const folio::schema_error& e) {
        threw = std::string(e.what()).find("Decimal") != std::string::npos;
    }
    assert(threw);

    std::cout << "  Schema JSON test passed!" << std::endl;
}

static bool rejects(const folio::schema& s) {
    try {
        folio::verify_schema(s);
    } catch (const folio::schema_error& e) {
        assert(e.kind() == folio::error_kind::schema_validation);
        return true;
    }
    return false;
}

void test_verify_schema() {
    std::cout << "Testing schema validation..." << std::endl;

    using folio::collection_schema;
    using folio::data_type;
    using folio::index_schema;

    assert(!rejects(person_schema()));
    assert(rejects(folio::schema()));

    // Duplicate collection
    assert(rejects(folio::schema({
        collection_schema("A", {{"x", data_type::integer}}, {}, false),
        collection_schema("A", {{"y", data_type::integer}}, {}, false)
    })));

    // Reserved collection and property names
    assert(rejects(folio::schema({collection_schema("_A", {{"x", data_type::integer}}, {}, false)})));
    assert(rejects(folio::schema({collection_schema("A", {{"_id", data_type::long_integer}}, {}, false)})));

    // Duplicate property
    assert(rejects(folio::schema({
        collection_schema("A", {{"x", data_type::integer}, {"x", data_type::string}}, {}, false)
    })));

    // Index over an unknown property, index without properties
    assert(rejects(folio::schema({
        collection_schema("A", {{"x", data_type::integer}}, {index_schema("i", {"y"}, false)}, false)
    })));
    assert(rejects(folio::schema({
        collection_schema("A", {{"x", data_type::integer}}, {index_schema("i", {}, false)}, false)
    })));

    // Object property without an embedded target
    assert(rejects(folio::schema({
        collection_schema("A", {{"o", data_type::object}}, {}, false)
    })));
    assert(rejects(folio::schema({
        collection_schema("A", {{"o", data_type::object, "B"}}, {}, false),
        collection_schema("B", {{"x", data_type::integer}}, {}, false)
    })));

    // Embedded collections have no table to index
    assert(rejects(folio::schema({
        collection_schema("A", {{"o", data_type::object, "B"}}, {}, false),
        collection_schema("B", {{"x", data_type::integer}}, {index_schema("i", {"x"}, false)}, true)
    })));

    std::cout << "  Schema validation test passed!" << std::endl;
}

// ============================================================================
// Test: Opening instances
// ============================================================================

void test_missing_directory() {
    std::cout << "Testing open without a directory..." << std::endl;

    folio::sqlite_instance::registry_type registry;
    folio::instance_config config("nodir", std::nullopt);

    // Also fails for a schema that would not validate
    for (const auto& s : {test_schema(), folio::schema()}) {
        bool threw = false;
        try {
            folio::sqlite_instance::open(registry, config, s);
        } catch (const folio::illegal_argument_error& e) {
            assert(e.kind() == folio::error_kind::illegal_argument);
            assert(std::string(e.what()).find("nodir") != std::string::npos);
            threw = true;
        }
        assert(threw);
    }
    assert(registry.size() == 0);

    std::cout << "  Missing directory test passed!" << std::endl;
}

void test_collection_registry() {
    std::cout << "Testing collection registry..." << std::endl;

    auto dir = fresh_dir("collections");
    folio::sqlite_instance::registry_type registry;

    auto s = folio::parse_schema(R"([
        {"name": "Test", "properties": [
            {"name": "a", "type": "String"},
            {"name": null, "type": "Long"},
            {"name": "b", "type": "Long"}
        ]},
        {"name": "Point", "embedded": true, "properties": [
            {"name": "x", "type": "Double"}
        ]}
    ])");
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("collections", dir), s);

    assert(db->name() == "collections");
    assert(db->path() == dir + "/collections.sqlite");
    assert(std::filesystem::exists(db->path()));
    assert(db->schema_hash() == folio::hash_schema(s));

    assert(db->collection_count() == 2);
    assert(db->collection_id(0) == folio::hash_name("Test"));
    assert(db->collection_id(1) == folio::hash_name("Point"));
    assert(!db->collection_id(2).has_value());

    // Unnamed properties are dropped, the rest keep their order
    const auto* test = db->collection(*db->collection_id(0));
    assert(test != nullptr);
    assert(test->properties.size() == 2);
    assert(test->properties[0].name == "a");
    assert(test->properties[1].name == "b");
    assert(test->properties[1].type == folio::data_type::long_integer);
    assert(db->collection(12345) == nullptr);

    // Embedded collections have no table
    bool threw = false;
    try {
        db->query(*db->collection_id(1));
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);

    auto txn = db->begin_txn(false);
    auto columns = txn.conn().get_table_info("Test");
    assert(columns.size() == 3);
    assert(columns.at("_id") == "INTEGER");
    assert(columns.at("a") == "TEXT");
    assert(columns.at("b") == "INTEGER");
    assert(!txn.conn().table_exists("Point"));
    db->commit_txn(std::move(txn));

    std::cout << "  Collection registry test passed!" << std::endl;
}

void test_reopen_same_schema() {
    std::cout << "Testing reopen with the same schema..." << std::endl;

    auto dir = fresh_dir("reopen");
    folio::sqlite_instance::registry_type registry;
    folio::instance_config config("reopen", dir);

    auto first = folio::sqlite_instance::open(registry, config, test_schema());

    // Migration would drop a table the schema does not declare
    {
        auto txn = first->begin_txn(true);
        txn.conn().execute("CREATE TABLE Stray (x INTEGER)");
        first->commit_txn(std::move(txn));
    }

    auto second = folio::sqlite_instance::open(registry, config, test_schema());
    assert(first == second);
    assert(registry.size() == 1);
    assert(registry.get("reopen") == first);
    assert(registry.get("other") == nullptr);

    auto txn = second->begin_txn(false);
    assert(txn.conn().table_exists("Stray"));
    second->commit_txn(std::move(txn));

    std::cout << "  Reopen test passed!" << std::endl;
}

void test_schema_mismatch() {
    std::cout << "Testing schema mismatch..." << std::endl;

    auto dir = fresh_dir("mismatch");
    folio::sqlite_instance::registry_type registry;
    folio::instance_config config("mismatch", dir);

    auto db = folio::sqlite_instance::open(registry, config, test_schema());

    auto changed = test_schema();
    changed.collections[0].properties.emplace_back("prop3", folio::data_type::long_integer);

    bool threw = false;
    try {
        folio::sqlite_instance::open(registry, config, changed);
    } catch (const folio::schema_mismatch_error& e) {
        assert(e.kind() == folio::error_kind::schema_mismatch);
        assert(e.instance_name() == "mismatch");
        assert(e.existing_hash() == db->schema_hash());
        assert(e.requested_hash() == folio::hash_schema(changed));
        threw = true;
    }
    assert(threw);

    // The first instance is untouched and usable
    assert(registry.get("mismatch") == db);
    auto test = *db->collection_id(0);
    auto txn = db->begin_txn(true);
    auto ins = db->insert(txn, test, 1);
    write_test_doc(ins.writer(), 1, "a", "b");
    ins.insert();
    assert(ins.finish() == 1);
    assert(db->count(txn, test) == 1);
    db->commit_txn(std::move(txn));

    std::cout << "  Schema mismatch test passed!" << std::endl;
}

// ============================================================================
// Test: Transactions
// ============================================================================

void test_insert_then_read() {
    std::cout << "Testing insert then read on one thread..." << std::endl;

    auto dir = fresh_dir("insert_read");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("insert_read", dir), test_schema());
    auto test = *db->collection_id(0);

    auto t1 = db->begin_txn(true);
    {
        auto ins = db->insert(t1, test, 2);
        write_test_doc(ins.writer(), 997, "val1", "vala");
        ins.insert();
        write_test_doc(ins.writer(), 998, "val2", "valb");
        ins.insert();
        assert(ins.remaining() == 0);
        assert(ins.finish() == 2);
    }
    db->commit_txn(std::move(t1));

    auto t2 = db->begin_txn(false);
    auto builder = db->query(test);
    builder.set_filter(folio::filter::not_null(2));
    auto query = builder.build();

    auto cursor = query.cursor(t2);
    const auto* row = cursor.next();
    assert(row != nullptr);
    assert(row->read_id() == 997);
    assert(row->read_string(1) == "val1");
    assert(row->read_string(2) == "vala");
    row = cursor.next();
    assert(row != nullptr);
    assert(row->read_id() == 998);
    assert(row->read_string(1) == "val2");
    assert(row->read_string(2) == "valb");
    assert(cursor.next() == nullptr);
    assert(cursor.next() == nullptr);
    assert(query.count(t2) == 2);
    db->commit_txn(std::move(t2));

    std::cout << "  Insert then read test passed!" << std::endl;
}

void test_abort_discards() {
    std::cout << "Testing abort..." << std::endl;

    auto dir = fresh_dir("abort");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("abort", dir), test_schema());
    auto test = *db->collection_id(0);

    auto txn = db->begin_txn(true);
    auto ins = db->insert(txn, test, 3);
    for (int64_t id = 1; id <= 3; ++id) {
        write_test_doc(ins.writer(), id, "x", "y");
        ins.insert();
    }
    ins.finish();
    assert(db->count(txn, test) == 3);
    db->abort_txn(std::move(txn));
    assert(db->pool().has_idle());

    auto read = db->begin_txn(false);
    assert(db->count(read, test) == 0);
    db->commit_txn(std::move(read));

    std::cout << "  Abort test passed!" << std::endl;
}

void test_invalid_collection_id() {
    std::cout << "Testing unknown collection ids..." << std::endl;

    auto dir = fresh_dir("invalid_id");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("invalid_id", dir), test_schema());
    const folio::collection_id_t unknown = 42;

    assert(db->pool().opened_count() == 0);
    bool threw = false;
    try {
        db->query(unknown);
    } catch (const folio::illegal_argument_error& e) {
        assert(std::string(e.what()).find("42") != std::string::npos);
        threw = true;
    }
    assert(threw);
    assert(db->pool().opened_count() == 0);

    auto txn = db->begin_txn(true);
    assert(db->pool().opened_count() == 1);
    threw = false;
    try {
        db->insert(txn, unknown, 1);
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);
    assert(db->pool().opened_count() == 1);

    // The transaction is unaffected
    assert(txn.is_active());
    assert(db->count(txn, *db->collection_id(0)) == 0);
    db->commit_txn(std::move(txn));

    std::cout << "  Unknown collection id test passed!" << std::endl;
}

void test_connection_reuse() {
    std::cout << "Testing connection reuse..." << std::endl;

    auto dir = fresh_dir("reuse");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("reuse", dir), test_schema());
    auto& pool = db->pool();

    assert(!pool.has_idle());
    assert(pool.slot_count() == 0);

    auto t1 = db->begin_txn(true);
    assert(pool.opened_count() == 1);
    assert(pool.slot_count() == 1);
    assert(!pool.has_idle());
    db->commit_txn(std::move(t1));
    assert(pool.has_idle());

    for (int i = 0; i < 5; ++i) {
        auto txn = db->begin_txn(i % 2 == 0);
        assert(!pool.has_idle());
        db->commit_txn(std::move(txn));
    }
    assert(pool.opened_count() == 1);
    assert(pool.slot_count() == 1);

    std::cout << "  Connection reuse test passed!" << std::endl;
}

void test_two_transactions_one_thread() {
    std::cout << "Testing two open transactions on one thread..." << std::endl;

    auto dir = fresh_dir("two_txns");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("two_txns", dir), test_schema());
    auto& pool = db->pool();

    auto t1 = db->begin_txn(false);
    auto t2 = db->begin_txn(false);
    assert(pool.opened_count() == 2);
    assert(&t1.conn() != &t2.conn());

    db->commit_txn(std::move(t1));
    assert(pool.has_idle());

    // Only one idle connection is kept per thread
    db->commit_txn(std::move(t2));
    assert(pool.has_idle());
    assert(pool.slot_count() == 1);

    auto t3 = db->begin_txn(false);
    assert(pool.opened_count() == 2);
    db->commit_txn(std::move(t3));

    std::cout << "  Two transactions test passed!" << std::endl;
}

void test_scoped_transaction() {
    std::cout << "Testing transaction destructor..." << std::endl;

    auto dir = fresh_dir("scoped");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("scoped", dir), test_schema());
    auto test = *db->collection_id(0);

    try {
        auto txn = db->begin_txn(true);
        auto ins = db->insert(txn, test, 1);
        write_test_doc(ins.writer(), 1, "x", "y");
        ins.insert();
        throw std::runtime_error("early exit");
    } catch (const std::runtime_error& e) {
        assert(std::string(e.what()) == "early exit");
    }

    // Rolled back and recycled
    assert(db->pool().has_idle());
    auto txn = db->begin_txn(false);
    assert(db->pool().opened_count() == 1);
    assert(db->count(txn, test) == 0);
    db->commit_txn(std::move(txn));

    std::cout << "  Transaction destructor test passed!" << std::endl;
}

void test_consumed_transaction() {
    std::cout << "Testing consumed transactions..." << std::endl;

    auto dir = fresh_dir("consumed");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("consumed", dir), test_schema());

    auto txn = db->begin_txn(true);
    assert(txn.is_write());
    txn.commit();
    assert(!txn.is_active());

    bool threw = false;
    try {
        txn.commit();
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        txn.conn();
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);

    // No-op
    txn.abort();

    auto a = db->begin_txn(false);
    auto b = std::move(a);
    assert(!a.is_active());
    assert(b.is_active());
    db->abort_txn(std::move(b));
    assert(db->pool().has_idle());
    assert(db->pool().opened_count() == 1);

    auto test = *db->collection_id(0);

    // An insert cannot outlive an aborted transaction
    auto aborted = db->begin_txn(true);
    auto late = db->insert(aborted, test, 2);
    db->abort_txn(std::move(aborted));
    write_test_doc(late.writer(), 1, "a", "b");
    threw = false;
    try {
        late.insert();
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);
    assert(late.inserted() == 0);

    // Nor a committed one
    auto committed = db->begin_txn(true);
    auto ins = db->insert(committed, test, 3);
    write_test_doc(ins.writer(), 2, "a", "b");
    ins.insert();
    write_test_doc(ins.writer(), 3, "c", "d");
    ins.insert();
    db->commit_txn(std::move(committed));
    write_test_doc(ins.writer(), 4, "e", "f");
    threw = false;
    try {
        ins.insert();
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);
    ins.finish();

    // The next transaction on this thread reuses the connection and sees
    // only the committed documents
    auto check = db->begin_txn(false);
    assert(db->count(check, test) == 2);
    db->commit_txn(std::move(check));

    // A cursor stops once its transaction is committed
    auto read = db->begin_txn(false);
    auto query = db->query(test).build();
    auto cursor = query.cursor(read);
    const auto* row = cursor.next();
    assert(row != nullptr);
    assert(row->read_id() == 2);
    assert(cursor.next() != nullptr);
    assert(cursor.next() == nullptr);
    db->commit_txn(std::move(read));
    threw = false;
    try {
        cursor.next();
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);
    assert(db->pool().opened_count() == 1);

    std::cout << "  Consumed transaction test passed!" << std::endl;
}

void test_insert_requires_write() {
    std::cout << "Testing insert in a read transaction..." << std::endl;

    auto dir = fresh_dir("read_insert");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("read_insert", dir), test_schema());
    auto test = *db->collection_id(0);

    auto txn = db->begin_txn(false);
    bool threw = false;
    try {
        db->insert(txn, test, 1);
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        db->clear(txn, test);
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);
    db->commit_txn(std::move(txn));

    std::cout << "  Insert requires write test passed!" << std::endl;
}

// ============================================================================
// Test: Writer and reader
// ============================================================================

void test_writer_checks() {
    std::cout << "Testing writer checks..." << std::endl;

    auto dir = fresh_dir("writer");
    folio::sqlite_instance::registry_type registry;
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("writer", dir), test_schema());
    auto test = *db->collection_id(0);

    auto txn = db->begin_txn(true);
    auto ins = db->insert(txn, test, 1);
    auto& w = ins.writer();

    auto expect_illegal = [](auto&& fn) {
        bool threw = false;
        try {
            fn();
        } catch (const folio::illegal_argument_error&) {
            threw = true;
        }
        assert(threw);
    };

    // Property before id, wrong type, incomplete document
    expect_illegal([&] { w.write_string("x"); });
    w.write_id(5);
    expect_illegal([&] { w.write_id(6); });
    expect_illegal([&] { w.write_long(1); });
    w.write_string("x");
    expect_illegal([&] { ins.insert(); });
    expect_illegal([&] { w.begin_object(); });
    w.write_null();
    expect_illegal([&] { w.write_string("too many"); });
    assert(w.is_complete());
    ins.insert();

    // Opened for one document
    write_test_doc(w, 6, "a", "b");
    expect_illegal([&] { ins.insert(); });
    assert(ins.finish() == 1);
    expect_illegal([&] { ins.insert(); });

    db->commit_txn(std::move(txn));

    std::cout << "  Writer checks test passed!" << std::endl;
}

void test_all_types() {
    std::cout << "Testing all property types..." << std::endl;

    auto dir = fresh_dir("types");
    folio::sqlite_instance::registry_type registry;
    auto s = folio::schema({
        folio::collection_schema("Types", {
            {"b", folio::data_type::boolean},
            {"y", folio::data_type::byte},
            {"i", folio::data_type::integer},
            {"f", folio::data_type::floating},
            {"l", folio::data_type::long_integer},
            {"d", folio::data_type::double_floating},
            {"s", folio::data_type::string},
            {"j", folio::data_type::json},
            {"il", folio::data_type::int_list}
        }, {}, false)
    });
    auto db = folio::sqlite_instance::open(registry, folio::instance_config("types", dir), s);
    auto types = *db->collection_id(0);

    auto txn = db->begin_txn(true);
    {
        auto ins = db->insert(txn, types, 2);
        auto& w = ins.writer();
        w.write_id(1);
        w.write_bool(true);
        w.write_byte(200);
        w.write_int(-7);
        w.write_float(1.5f);
        w.write_long(int64_t{1} << 40);
        w.write_double(2.25);
        w.write_string("hello");
        w.write_json(nlohmann::json{{"k", "v"}});
        w.write_json(nlohmann::json::array({1, 2, 3}));
        ins.insert();

        w.write_id(2);
        for (int i = 0; i < 9; ++i) {
            w.write_null();
        }
        ins.insert();
        ins.finish();
    }
    db->commit_txn(std::move(txn));

    auto read = db->begin_txn(false);
    auto query = db->query(types).build();
    auto cursor = query.cursor(read);

    const auto* row = cursor.next();
    assert(row != nullptr);
    assert(row->read_id() == 1);
    assert(row->read_bool(1));
    assert(row->read_byte(2) == 200);
    assert(row->read_int(3) == -7);
    assert(row->read_float(4) == 1.5f);
    assert(row->read_long(5) == (int64_t{1} << 40));
    assert(row->read_double(6) == 2.25);
    assert(row->read_string(7) == "hello");
    assert(row->read_json(8)["k"] == "v");
    assert(row->read_json(9) == nlohmann::json::array({1, 2, 3}));
    assert(row->object_collection(9) == nullptr);

    bool threw = false;
    try {
        row->read_long(10);
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);

    // Null sentinels
    row = cursor.next();
    assert(row != nullptr);
    assert(row->read_id() == 2);
    assert(row->is_null(1));
    assert(!row->read_bool(1));
    assert(row->read_byte(2) == 0);
    assert(row->read_int(3) == std::numeric_limits<int32_t>::min());
    assert(std::isnan(row->read_float(4)));
    assert(row->read_long(5) == std::numeric_limits<int64_t>::min());
    assert(std::isnan(row->read_double(6)));
    assert(!row->read_string(7).has_value());
    assert(row->read_json(8).is_null());
    assert(cursor.next() == nullptr);
    db->commit_txn(std::move(read));

    std::cout << "  All types test passed!" << std::endl;
}

// ============================================================================
// Test: Queries
// ============================================================================

static std::shared_ptr<folio::sqlite_instance> open_people(folio::sqlite_instance::registry_type& registry,
                                                           const std::string& name) {
    auto db = folio::sqlite_instance::open(registry, folio::instance_config(name, fresh_dir(name)),
                                           person_schema());
    auto person = *db->collection_id(0);

    auto txn = db->begin_txn(true);
    auto ins = db->insert(txn, person, 5);
    write_person(ins.writer(), 1, "Alice", 31, 1.5, nlohmann::json::array({"a", "b"}),
                 std::make_pair(std::string("Oslo"), 150));
    ins.insert();
    write_person(ins.writer(), 2, "bob", 25, std::nullopt, nlohmann::json::array(), std::nullopt);
    ins.insert();
    write_person(ins.writer(), 3, "Carol", 42, 3.0, nlohmann::json::array({"c"}),
                 std::make_pair(std::string("Rome"), 100));
    ins.insert();
    write_person(ins.writer(), 4, "alfred", 31, 2.5, nullptr, std::nullopt);
    ins.insert();
    write_person(ins.writer(), 5, std::nullopt, 19, 0.5, nlohmann::json::array({"x"}), std::nullopt);
    ins.insert();
    ins.finish();
    db->commit_txn(std::move(txn));
    return db;
}

static std::vector<int64_t> ids_where(folio::sqlite_instance& db, folio::sqlite_txn& txn, folio::filter f) {
    auto builder = db.query(*db.collection_id(0));
    builder.set_filter(std::move(f));
    return collect_ids(builder.build(), txn);
}

void test_filters() {
    std::cout << "Testing filters..." << std::endl;

    folio::sqlite_instance::registry_type registry;
    auto db = open_people(registry, "filters");
    using folio::filter;
    using ids = std::vector<int64_t>;

    auto txn = db->begin_txn(false);
    assert(ids_where(*db, txn, filter::not_null(1)) == (ids{1, 2, 3, 4}));
    assert(ids_where(*db, txn, filter::is_null(1)) == (ids{5}));
    assert(ids_where(*db, txn, filter::greater_than(2, int64_t{30})) == (ids{1, 3, 4}));
    assert(ids_where(*db, txn, filter::greater_than(2, int64_t{31}, true)) == (ids{1, 3, 4}));
    assert(ids_where(*db, txn, filter::greater_than(2, int64_t{31})) == (ids{3}));
    assert(ids_where(*db, txn, filter::less_than(2, int64_t{31})) == (ids{2, 5}));
    assert(ids_where(*db, txn, filter::between(2, int64_t{25}, int64_t{31})) == (ids{1, 2, 4}));
    assert(ids_where(*db, txn, filter::equal_to(0, int64_t{3})) == (ids{3}));
    assert(ids_where(*db, txn, filter::less_than(3, 2.0)) == (ids{1, 5}));

    // Strings
    assert(ids_where(*db, txn, filter::equal_to(1, std::string("BOB"))).empty());
    assert(ids_where(*db, txn, filter::equal_to(1, std::string("BOB"), false)) == (ids{2}));
    assert(ids_where(*db, txn, filter::starts_with(1, "al")) == (ids{4}));
    assert(ids_where(*db, txn, filter::starts_with(1, "al", false)) == (ids{1, 4}));
    assert(ids_where(*db, txn, filter::ends_with(1, "ol")) == (ids{3}));
    assert(ids_where(*db, txn, filter::ends_with(1, "OL", false)) == (ids{3}));
    assert(ids_where(*db, txn, filter::contains(1, "LI", false)) == (ids{1}));
    assert(ids_where(*db, txn, filter::contains(1, "LI")).empty());

    // Groups
    assert(ids_where(*db, txn, filter::or_({filter::equal_to(2, int64_t{25}),
                                            filter::equal_to(2, int64_t{42})})) == (ids{2, 3}));
    assert(ids_where(*db, txn, filter::and_({filter::equal_to(2, int64_t{31}),
                                             filter::starts_with(1, "A")})) == (ids{1}));
    assert(ids_where(*db, txn, filter::not_(filter::is_null(3))) == (ids{1, 3, 4, 5}));
    assert(ids_where(*db, txn, filter::and_({})) == (ids{1, 2, 3, 4, 5}));
    assert(ids_where(*db, txn, filter::or_({})).empty());

    bool threw = false;
    try {
        ids_where(*db, txn, filter::is_null(6));
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);
    db->commit_txn(std::move(txn));

    std::cout << "  Filters test passed!" << std::endl;
}

void test_sort_and_paging() {
    std::cout << "Testing sort, offset and limit..." << std::endl;

    folio::sqlite_instance::registry_type registry;
    auto db = open_people(registry, "sorting");
    auto person = *db->collection_id(0);
    using ids = std::vector<int64_t>;

    auto txn = db->begin_txn(false);

    // Equal ages fall back to id order
    auto by_age = db->query(person);
    by_age.add_sort(2, folio::sort_order::descending);
    auto query = by_age.build();
    assert(collect_ids(query, txn) == (ids{3, 1, 4, 2, 5}));
    assert(collect_ids(query, txn, 1, 2) == (ids{1, 4}));
    assert(collect_ids(query, txn, 4) == (ids{5}));
    assert(collect_ids(query, txn, 5).empty());
    assert(collect_ids(query, txn, 0, 0).empty());

    // NULL sorts first ascending
    auto by_name = db->query(person);
    by_name.add_sort(1, folio::sort_order::ascending, false);
    assert(collect_ids(by_name.build(), txn) == (ids{5, 4, 1, 2, 3}));

    auto by_id = db->query(person);
    by_id.add_sort(0, folio::sort_order::descending);
    assert(collect_ids(by_id.build(), txn) == (ids{5, 4, 3, 2, 1}));

    bool threw = false;
    try {
        db->query(person).add_sort(9);
    } catch (const folio::illegal_argument_error&) {
        threw = true;
    }
    assert(threw);
    db->commit_txn(std::move(txn));

    std::cout << "  Sort and paging test passed!" << std::endl;
}

void test_embedded_objects() {
    std::cout << "Testing embedded objects and lists..." << std::endl;

    folio::sqlite_instance::registry_type registry;
    auto db = open_people(registry, "embedded");

    auto txn = db->begin_txn(false);
    auto cursor = db->query(*db->collection_id(0)).build().cursor(txn);

    const auto* row = cursor.next();
    assert(row != nullptr);
    assert(row->read_string(1) == "Alice");
    assert(row->read_long(2) == 31);
    assert(row->read_json(4) == nlohmann::json::array({"a", "b"}));
    auto address = row->read_json(5);
    assert(address["city"] == "Oslo");
    assert(address["zip"] == 150);
    const auto* address_collection = row->object_collection(5);
    assert(address_collection != nullptr);
    assert(address_collection->name == "Address");
    assert(address_collection->embedded);

    row = cursor.next();
    assert(row->read_id() == 2);
    assert(std::isnan(row->read_double(3)));
    assert(row->read_json(4).empty());
    assert(row->read_json(5).is_null());

    row = cursor.next();
    assert(row->read_json(5)["city"] == "Rome");

    row = cursor.next();
    assert(row->read_id() == 4);
    assert(row->is_null(4));

    row = cursor.next();
    assert(!row->read_string(1).has_value());
    db->commit_txn(std::move(txn));

    std::cout << "  Embedded objects test passed!" << std::endl;
}

void test_count_clear_remove() {
    std::cout << "Testing count, remove and clear..." << std::endl;

    folio::sqlite_instance::registry_type registry;
    auto db = open_people(registry, "remove");
    auto person = *db->collection_id(0);

    auto txn = db->begin_txn(true);
    assert(db->count(txn, person) == 5);
    assert(db->remove(txn, person, 2));
    assert(!db->remove(txn, person, 2));
    assert(db->count(txn, person) == 4);

    auto young = db->query(person);
    young.set_filter(folio::filter::less_than(2, int64_t{30}));
    assert(young.build().remove(txn) == 1);
    assert(db->count(txn, person) == 3);

    assert(db->clear(txn, person) == 3);
    assert(db->count(txn, person) == 0);
    db->abort_txn(std::move(txn));

    auto read = db->begin_txn(false);
    assert(db->count(read, person) == 5);
    db->commit_txn(std::move(read));

    std::cout << "  Count, remove and clear test passed!" << std::endl;
}

// ============================================================================
// Test: Migration
// ============================================================================

void test_migration() {
    std::cout << "Testing schema migration..." << std::endl;

    auto dir = fresh_dir("migration");
    folio::instance_config config("migration", dir);

    auto v1 = folio::schema({
        folio::collection_schema("Item", {
            {"a", folio::data_type::string},
            {"b", folio::data_type::long_integer}
        }, {folio::index_schema("b_idx", {"b"}, false)}, false),
        folio::collection_schema("Old", {{"x", folio::data_type::integer}}, {}, false)
    });
    {
        folio::sqlite_instance::registry_type registry;
        auto db = folio::sqlite_instance::open(registry, config, v1);
        auto txn = db->begin_txn(true);
        auto ins = db->insert(txn, *db->collection_id(0), 1);
        ins.writer().write_id(1);
        ins.writer().write_string("kept");
        ins.writer().write_long(7);
        ins.insert();
        ins.finish();
        db->commit_txn(std::move(txn));
    }

    // b changes type, c is new, Old goes away
    auto v2 = folio::schema({
        folio::collection_schema("Item", {
            {"a", folio::data_type::string},
            {"b", folio::data_type::string},
            {"c", folio::data_type::double_floating}
        }, {folio::index_schema("b_idx", {"b"}, false)}, false)
    });
    {
        folio::sqlite_instance::registry_type registry;
        auto db = folio::sqlite_instance::open(registry, config, v2);
        auto txn = db->begin_txn(false);
        auto& conn = txn.conn();

        auto columns = conn.get_table_info("Item");
        assert(columns.size() == 4);
        assert(columns.at("a") == "TEXT");
        assert(columns.at("b") == "TEXT");
        assert(columns.at("c") == "REAL");
        assert(!conn.table_exists("Old"));
        auto indexes = conn.get_index_names("Item");
        assert(indexes.size() == 1);
        assert(indexes[0] == "_i_Item_b_idx");

        auto cursor = db->query(*db->collection_id(0)).build().cursor(txn);
        const auto* row = cursor.next();
        assert(row != nullptr);
        assert(row->read_string(1) == "kept");
        assert(!row->read_string(2).has_value());
        assert(row->is_null(3));
        db->commit_txn(std::move(txn));
    }

    // Dropping the index again
    auto v3 = v2;
    v3.collections[0].indexes.clear();
    {
        folio::sqlite_instance::registry_type registry;
        auto db = folio::sqlite_instance::open(registry, config, v3);
        auto txn = db->begin_txn(false);
        assert(txn.conn().get_index_names("Item").empty());
        db->commit_txn(std::move(txn));
    }

    std::cout << "  Migration test passed!" << std::endl;
}

void test_migration_failure() {
    std::cout << "Testing failed migration..." << std::endl;

    auto dir = fresh_dir("migration_failure");
    folio::instance_config config("migration_failure", dir);
    {
        folio::sqlite_instance::registry_type registry;
        auto db = folio::sqlite_instance::open(registry, config, test_schema());
        auto txn = db->begin_txn(true);
        auto ins = db->insert(txn, *db->collection_id(0), 2);
        write_test_doc(ins.writer(), 1, "dup", "x");
        ins.insert();
        write_test_doc(ins.writer(), 2, "dup", "y");
        ins.insert();
        ins.finish();
        db->commit_txn(std::move(txn));
    }

    // A unique index over duplicate values cannot be built
    auto unique = test_schema();
    unique.collections[0].indexes.emplace_back("prop1_unique", std::vector<std::string>{"prop1"}, true);
    unique.collections[0].properties.emplace_back("prop3", folio::data_type::long_integer);

    folio::sqlite_instance::registry_type registry;
    bool threw = false;
    try {
        folio::sqlite_instance::open(registry, config, unique);
    } catch (const folio::migration_error& e) {
        assert(e.kind() == folio::error_kind::migration);
        assert(e.collection() == "Test");
        threw = true;
    }
    assert(threw);
    assert(registry.size() == 0);

    // Nothing was applied
    auto db = folio::sqlite_instance::open(registry, config, test_schema());
    auto txn = db->begin_txn(false);
    assert(txn.conn().get_table_info("Test").count("prop3") == 0);
    assert(db->count(txn, *db->collection_id(0)) == 2);
    db->commit_txn(std::move(txn));

    std::cout << "  Failed migration test passed!" << std::endl;
}

// ============================================================================
// Test: Open-time options
// ============================================================================

void test_durability() {
    std::cout << "Testing durability setting..." << std::endl;

    auto dir = fresh_dir("durability");
    folio::sqlite_instance::registry_type registry;

    folio::instance_config strict("strict", dir);
    folio::instance_config relaxed("relaxed", dir);
    relaxed.relaxed_durability = true;

    auto strict_db = folio::sqlite_instance::open(registry, strict, test_schema());
    auto relaxed_db = folio::sqlite_instance::open(registry, relaxed, test_schema());
    assert(registry.size() == 2);
    assert(strict_db != relaxed_db);

    auto t1 = strict_db->begin_txn(false);
    assert(pragma_int(t1, "synchronous") == 2);  // FULL
    strict_db->commit_txn(std::move(t1));

    auto t2 = relaxed_db->begin_txn(false);
    assert(pragma_int(t2, "synchronous") == 1);  // NORMAL
    relaxed_db->commit_txn(std::move(t2));

    std::cout << "  Durability test passed!" << std::endl;
}

void test_compaction() {
    std::cout << "Testing compaction on open..." << std::endl;

    auto dir = fresh_dir("compaction");
    folio::instance_config config("compaction", dir);
    int64_t pages_before = 0;
    {
        folio::sqlite_instance::registry_type registry;
        auto db = folio::sqlite_instance::open(registry, config, test_schema());
        auto test = *db->collection_id(0);
        const std::string payload(1000, 'x');

        auto txn = db->begin_txn(true);
        auto ins = db->insert(txn, test, 2000);
        for (int64_t id = 0; id < 2000; ++id) {
            ins.writer().write_id(id);
            ins.writer().write_string(payload);
            ins.writer().write_null();
            ins.insert();
        }
        ins.finish();
        db->commit_txn(std::move(txn));

        auto clear = db->begin_txn(true);
        assert(db->clear(clear, test) == 2000);
        db->commit_txn(std::move(clear));

        auto read = db->begin_txn(false);
        pages_before = pragma_int(read, "page_count");
        assert(pragma_int(read, "freelist_count") > 0);
        db->commit_txn(std::move(read));
    }

    // Threshold not reached
    {
        config.compact = folio::compact_condition{0, 0, 2.0};
        folio::sqlite_instance::registry_type registry;
        auto db = folio::sqlite_instance::open(registry, config, test_schema());
        auto read = db->begin_txn(false);
        assert(pragma_int(read, "freelist_count") > 0);
        db->commit_txn(std::move(read));
    }

    {
        config.compact = folio::compact_condition{4096, 4096, 0.5};
        folio::sqlite_instance::registry_type registry;
        auto db = folio::sqlite_instance::open(registry, config, test_schema());
        auto read = db->begin_txn(false);
        assert(pragma_int(read, "freelist_count") == 0);
        assert(pragma_int(read, "page_count") < pages_before);
        db->commit_txn(std::move(read));
    }

    std::cout << "  Compaction test passed!" << std::endl;
}

void test_log_level() {
    std::cout << "Testing log level..." << std::endl;

    assert(folio::get_log_level() == folio::log_level::off);
    folio::set_log_level(folio::log_level::debug);
    assert(folio::get_log_level() == folio::log_level::debug);
    LOG_DEBUG("test", "debug logging enabled (%d)", 1);

    // Messages below the threshold never reach the sink
    struct entry {
        folio::log_level level;
        std::string tag;
        std::string message;
    };
    std::vector<entry> captured;
    folio::set_log_sink([&](folio::log_level level, const char* tag, const std::string& message) {
        captured.push_back({level, tag, message});
    });
    folio::set_log_level(folio::log_level::warn);
    LOG_INFO("test", "dropped");
    LOG_DEBUG("test", "dropped");
    LOG_WARN("test", "kept %d of %s", 1, "two");
    assert(captured.size() == 1);
    assert(captured[0].level == folio::log_level::warn);
    assert(captured[0].tag == "test");
    assert(captured[0].message == "kept 1 of two");

    // A rejected reopen is reported under the registry tag
    folio::instance_registry<concurrency_tests::counted_instance> registry;
    registry.get_or_open("logged", 1, [] {
        return std::make_shared<concurrency_tests::counted_instance>(concurrency_tests::counted_instance{1});
    });
    bool threw = false;
    try {
        registry.get_or_open("logged", 2, [] {
            return std::make_shared<concurrency_tests::counted_instance>(concurrency_tests::counted_instance{2});
        });
    } catch (const folio::schema_mismatch_error&) {
        threw = true;
    }
    assert(threw);
    assert(captured.size() == 2);
    assert(captured[1].tag == "registry");
    assert(captured[1].message.find("logged") != std::string::npos);

    folio::set_log_sink(nullptr);
    folio::set_log_level(folio::log_level::off);
    assert(std::string(folio::log_level_name(folio::log_level::error)) == "ERROR");

    assert(std::string(folio::error_kind_name(folio::error_kind::schema_mismatch)).size() > 0);

    std::cout << "  Log level test passed!" << std::endl;
}

int main() {
    std::cout << "=== FolioCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Schema tests
        test_schema_json();
        test_verify_schema();
        test_log_level();

        // Open tests
        test_missing_directory();
        test_collection_registry();
        test_reopen_same_schema();
        test_schema_mismatch();

        // Transaction tests
        test_insert_then_read();
        test_abort_discards();
        test_invalid_collection_id();
        test_connection_reuse();
        test_two_transactions_one_thread();
        test_scoped_transaction();
        test_consumed_transaction();
        test_insert_requires_write();

        // Writer / reader tests
        test_writer_checks();
        test_all_types();

        // Query tests
        test_filters();
        test_sort_and_paging();
        test_embedded_objects();
        test_count_clear_remove();

        // Migration tests
        test_migration();
        test_migration_failure();

        // Open options
        test_durability();
        test_compaction();

        // Concurrency tests
        concurrency_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

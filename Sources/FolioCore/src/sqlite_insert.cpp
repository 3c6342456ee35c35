#include "folio/sqlite_insert.hpp"
#include "folio/log.hpp"
#include "folio/schema.hpp"
#include <sstream>

namespace folio {

namespace {

bool accepts_bool(data_type t) { return t == data_type::boolean; }
bool accepts_byte(data_type t) { return t == data_type::byte; }
bool accepts_int(data_type t) { return t == data_type::integer; }
bool accepts_float(data_type t) { return t == data_type::floating; }
bool accepts_long(data_type t) { return t == data_type::long_integer; }
bool accepts_double(data_type t) { return t == data_type::double_floating; }
bool accepts_string(data_type t) { return t == data_type::string; }
bool accepts_json(data_type t) { return is_json_encoded(t); }
bool accepts_object(data_type t) { return t == data_type::object; }
bool accepts_any(data_type) { return true; }

nlohmann::json value_to_json(const sqlite_property& prop, const column_value_t& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return nullptr;
    }
    if (prop.type == data_type::boolean) {
        return std::get<int64_t>(value) != 0;
    }
    if (is_json_encoded(prop.type)) {
        return nlohmann::json::parse(std::get<std::string>(value));
    }
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

} // namespace

// ============================================================================
// sqlite_writer
// ============================================================================

sqlite_writer::sqlite_writer(const sqlite_collection& collection, const collection_map& collections)
    : collection_(collection), collections_(collections) {
    values_.reserve(collection.property_count());
}

const sqlite_property& sqlite_writer::next_property(const char* written, bool (*accepts)(data_type)) {
    if (!collection_.embedded && !id_) {
        throw illegal_argument_error("write_id() must be called before writing properties of '" +
                                     collection_.name + "'");
    }
    if (values_.size() >= collection_.property_count()) {
        throw illegal_argument_error("All " + std::to_string(collection_.property_count()) +
                                     " properties of '" + collection_.name + "' are already written");
    }
    const auto& prop = collection_.properties[values_.size()];
    if (!accepts(prop.type)) {
        throw illegal_argument_error("Property '" + prop.name + "' of '" + collection_.name + "' is " +
                                     std::string(data_type_name(prop.type)) + ", cannot write " + written);
    }
    return prop;
}

void sqlite_writer::write_id(document_id_t id) {
    if (collection_.embedded) {
        throw illegal_argument_error("Embedded objects of '" + collection_.name + "' have no id");
    }
    if (id_ || !values_.empty()) {
        throw illegal_argument_error("Id of the current '" + collection_.name + "' document is already written");
    }
    id_ = id;
}

void sqlite_writer::write_null() {
    next_property("null", accepts_any);
    values_.emplace_back(nullptr);
}

void sqlite_writer::write_bool(bool value) {
    next_property("Bool", accepts_bool);
    values_.emplace_back(static_cast<int64_t>(value ? 1 : 0));
}

void sqlite_writer::write_byte(uint8_t value) {
    next_property("Byte", accepts_byte);
    values_.emplace_back(static_cast<int64_t>(value));
}

void sqlite_writer::write_int(int32_t value) {
    next_property("Int", accepts_int);
    values_.emplace_back(static_cast<int64_t>(value));
}

void sqlite_writer::write_float(float value) {
    next_property("Float", accepts_float);
    values_.emplace_back(static_cast<double>(value));
}

void sqlite_writer::write_long(int64_t value) {
    next_property("Long", accepts_long);
    values_.emplace_back(value);
}

void sqlite_writer::write_double(double value) {
    next_property("Double", accepts_double);
    values_.emplace_back(value);
}

void sqlite_writer::write_string(std::optional<std::string_view> value) {
    next_property("String", accepts_string);
    if (value) {
        values_.emplace_back(std::string(*value));
    } else {
        values_.emplace_back(nullptr);
    }
}

void sqlite_writer::write_json(const nlohmann::json& value) {
    next_property("Json", accepts_json);
    if (value.is_null()) {
        values_.emplace_back(nullptr);
    } else {
        values_.emplace_back(value.dump());
    }
}

sqlite_writer sqlite_writer::begin_object() const {
    if (values_.size() >= collection_.property_count()) {
        throw illegal_argument_error("No property left for an object in '" + collection_.name + "'");
    }
    const auto& prop = collection_.properties[values_.size()];
    if (!accepts_object(prop.type) || !prop.target_id) {
        throw illegal_argument_error("Property '" + prop.name + "' of '" + collection_.name +
                                     "' is not an object property");
    }
    auto it = collections_.find(*prop.target_id);
    if (it == collections_.end()) {
        throw illegal_argument_error("Embedded collection of '" + prop.name + "' is unknown");
    }
    return sqlite_writer(it->second, collections_);
}

void sqlite_writer::end_object(const sqlite_writer& child) {
    const auto& prop = next_property("Object", accepts_object);
    if (!prop.target_id || *prop.target_id != hash_name(child.collection_.name)) {
        throw illegal_argument_error("Object written to '" + prop.name + "' belongs to '" +
                                     child.collection_.name + "'");
    }
    if (!child.is_complete()) {
        throw illegal_argument_error("Embedded '" + child.collection_.name + "' object is incomplete");
    }
    values_.emplace_back(child.to_json_object().dump());
}

bool sqlite_writer::is_complete() const {
    return (collection_.embedded || id_.has_value()) && values_.size() == collection_.property_count();
}

nlohmann::json sqlite_writer::to_json_object() const {
    auto obj = nlohmann::json::object();
    for (size_t i = 0; i < values_.size(); ++i) {
        const auto& prop = collection_.properties[i];
        obj[prop.name] = value_to_json(prop, values_[i]);
    }
    return obj;
}

void sqlite_writer::reset() {
    id_.reset();
    values_.clear();
}

// ============================================================================
// sqlite_insert
// ============================================================================

sqlite_insert::sqlite_insert(sqlite_txn& txn, const sqlite_collection& collection,
                             const collection_map& collections, size_t count)
    : txn_(txn), collection_(collection), count_(count), writer_(collection, collections) {
    std::ostringstream sql;
    sql << "INSERT OR REPLACE INTO " << collection.table() << " (" << collection.column(0);
    for (size_t i = 1; i <= collection.property_count(); ++i) {
        sql << ", " << collection.column(i);
    }
    sql << ") VALUES (?";
    for (size_t i = 0; i < collection.property_count(); ++i) {
        sql << ", ?";
    }
    sql << ")";
    stmt_ = txn_.conn().prepare(sql.str());
}

void sqlite_insert::insert() {
    if (finished_) {
        throw illegal_argument_error("Insert into '" + collection_.name + "' is already finished");
    }
    if (!txn_.is_active()) {
        throw illegal_argument_error("Insert into '" + collection_.name +
                                     "' outlived its transaction, which was already committed or aborted");
    }
    if (inserted_ >= count_) {
        throw illegal_argument_error("Insert into '" + collection_.name + "' was opened for " +
                                     std::to_string(count_) + " documents");
    }
    if (!writer_.is_complete()) {
        throw illegal_argument_error("Document for '" + collection_.name + "' is incomplete");
    }

    stmt_.reset();
    stmt_.bind(1, *writer_.id());
    int index = 2;
    for (const auto& value : writer_.values()) {
        stmt_.bind(index++, value);
    }
    stmt_.step();

    ++inserted_;
    writer_.reset();
}

size_t sqlite_insert::finish() {
    if (!finished_) {
        finished_ = true;
        stmt_ = statement();
        if (inserted_ < count_) {
            LOG_WARN("insert", "Insert into %s finished with %zu of %zu documents",
                     collection_.name.c_str(), inserted_, count_);
        }
    }
    return inserted_;
}

} // namespace folio

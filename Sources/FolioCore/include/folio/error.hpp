#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace folio {

enum class error_kind {
    illegal_argument,
    schema_validation,
    schema_mismatch,
    migration,
    io
};

const char* error_kind_name(error_kind kind) noexcept;

class folio_error : public std::runtime_error {
public:
    folio_error(error_kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

/// Bad input from the caller: missing directory, unknown collection id,
/// consumed transaction, wrongly typed write.
class illegal_argument_error : public folio_error {
public:
    explicit illegal_argument_error(const std::string& msg)
        : folio_error(error_kind::illegal_argument, msg) {}
};

/// Structurally invalid schema (or schema JSON that does not parse).
class schema_error : public folio_error {
public:
    explicit schema_error(const std::string& msg)
        : folio_error(error_kind::schema_validation, msg) {}
};

/// An instance with the same name is already open with another schema.
class schema_mismatch_error : public folio_error {
public:
    schema_mismatch_error(const std::string& name, uint64_t existing_hash, uint64_t requested_hash);

    [[nodiscard]] const std::string& instance_name() const noexcept { return name_; }
    [[nodiscard]] uint64_t existing_hash() const noexcept { return existing_hash_; }
    [[nodiscard]] uint64_t requested_hash() const noexcept { return requested_hash_; }

private:
    std::string name_;
    uint64_t existing_hash_;
    uint64_t requested_hash_;
};

class migration_error : public folio_error {
public:
    migration_error(const std::string& collection, const std::string& msg)
        : folio_error(error_kind::migration, "Migration of '" + collection + "' failed: " + msg)
        , collection_(collection) {}

    [[nodiscard]] const std::string& collection() const noexcept { return collection_; }

private:
    std::string collection_;
};

/// Storage engine failure (open, prepare, step, commit).
class db_error : public folio_error {
public:
    explicit db_error(const std::string& msg) : folio_error(error_kind::io, msg) {}
};

} // namespace folio

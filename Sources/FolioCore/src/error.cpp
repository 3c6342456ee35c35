#include "folio/error.hpp"
#include <cinttypes>
#include <cstdio>

namespace folio {

namespace {

std::string mismatch_message(const std::string& name, uint64_t existing, uint64_t requested) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "' is already open with schema %016" PRIx64 " but schema %016" PRIx64 " was requested",
                  existing, requested);
    return "Instance '" + name + buf;
}

} // namespace

const char* error_kind_name(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::illegal_argument: return "illegal_argument";
        case error_kind::schema_validation: return "schema_validation";
        case error_kind::schema_mismatch: return "schema_mismatch";
        case error_kind::migration: return "migration";
        case error_kind::io: return "io";
    }
    return "unknown";
}

schema_mismatch_error::schema_mismatch_error(const std::string& name, uint64_t existing_hash,
                                             uint64_t requested_hash)
    : folio_error(error_kind::schema_mismatch, mismatch_message(name, existing_hash, requested_hash))
    , name_(name)
    , existing_hash_(existing_hash)
    , requested_hash_(requested_hash) {}

} // namespace folio

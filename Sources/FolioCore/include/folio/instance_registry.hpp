#pragma once

#include "error.hpp"
#include "log.hpp"
#include "schema.hpp"
#include <concepts>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace folio {

template<typename T>
concept fingerprinted_instance = requires(const T& inst) {
    { inst.schema_hash() } -> std::convertible_to<uint64_t>;
};

/// Name -> open instance map shared by everyone who opens the same name.
///
/// Lookups take a shared lock. Opening takes the exclusive lock, re-checks,
/// and runs the factory while holding it, so at most one instance is ever
/// constructed for a name. Entries hold their instance strongly for the
/// lifetime of the registry.
template<typename Instance>
class instance_registry {
public:
    instance_registry() = default;

    instance_registry(const instance_registry&) = delete;
    instance_registry& operator=(const instance_registry&) = delete;

    /// The instance registered under `name`, or the one `factory()` builds.
    /// Throws schema_mismatch_error if `name` is open with another fingerprint.
    /// A factory that throws leaves the registry unchanged.
    template<typename Factory>
    std::shared_ptr<Instance> get_or_open(const std::string& name, uint64_t schema_hash, Factory&& factory) {
        static_assert(fingerprinted_instance<Instance>);
        const uint64_t key = hash_name(name);
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = instances_.find(key);
            if (it != instances_.end()) {
                return check(name, it->second, schema_hash);
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = instances_.find(key);
        if (it != instances_.end()) {
            return check(name, it->second, schema_hash);
        }

        LOG_DEBUG("registry", "Opening instance %s", name.c_str());
        std::shared_ptr<Instance> inst = factory();
        instances_.emplace(key, inst);
        return inst;
    }

    std::shared_ptr<Instance> get(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = instances_.find(hash_name(name));
        return it != instances_.end() ? it->second : nullptr;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return instances_.size();
    }

private:
    static std::shared_ptr<Instance> check(const std::string& name,
                                           const std::shared_ptr<Instance>& existing,
                                           uint64_t schema_hash) {
        if (existing->schema_hash() != schema_hash) {
            LOG_WARN("registry", "Schema mismatch for instance %s", name.c_str());
            throw schema_mismatch_error(name, existing->schema_hash(), schema_hash);
        }
        return existing;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<Instance>> instances_;
};

} // namespace folio

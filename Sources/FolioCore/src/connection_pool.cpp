#include "folio/connection_pool.hpp"
#include "folio/log.hpp"
#include <mutex>

namespace folio {

connection_pool::connection_pool(std::string path, connection_options options)
    : path_(std::move(path)), options_(options) {}

connection_pool::slot* connection_pool::find_local_slot() const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    auto it = slots_.find(std::this_thread::get_id());
    return it != slots_.end() ? it->second.get() : nullptr;
}

connection_pool::slot& connection_pool::local_slot() {
    if (auto* existing = find_local_slot()) {
        return *existing;
    }

    std::unique_lock<std::shared_mutex> lock(slots_mutex_);
    // Slots are heap-allocated so the reference stays valid across rehashing
    auto& entry = slots_[std::this_thread::get_id()];
    if (!entry) {
        entry = std::make_unique<slot>();
        LOG_DEBUG("pool", "Created slot for new thread (%zu slots) on %s", slots_.size(), path_.c_str());
    }
    return *entry;
}

std::unique_ptr<connection> connection_pool::open_connection() {
    auto conn = std::make_unique<connection>(path_, options_);
    opened_.fetch_add(1, std::memory_order_relaxed);
    return conn;
}

std::unique_ptr<connection> connection_pool::acquire() {
    auto& s = local_slot();
    if (s.idle) {
        LOG_DEBUG("pool", "Reusing idle connection for %s", path_.c_str());
        return std::move(s.idle);
    }
    LOG_DEBUG("pool", "No idle connection on this thread, opening one for %s", path_.c_str());
    return open_connection();
}

void connection_pool::release(std::unique_ptr<connection> conn) {
    if (!conn) return;

    auto& s = local_slot();
    if (s.idle) {
        LOG_DEBUG("pool", "Slot already holds an idle connection, closing the older one");
    }
    s.idle = std::move(conn);
}

bool connection_pool::has_idle() const {
    auto* s = find_local_slot();
    return s != nullptr && s->idle != nullptr;
}

size_t connection_pool::slot_count() const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    return slots_.size();
}

} // namespace folio

#pragma once

#include "connection.hpp"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace folio {

/// Thread-affine lend/return store for one instance's connections.
///
/// Every thread that touches the instance gets its own slot holding at most
/// one idle connection. acquire() takes the idle connection out of the
/// calling thread's slot (or opens a fresh one when the slot is empty) and
/// release() puts one back, replacing whatever was idle there. A slot is only
/// ever read or written by its owning thread; the map of slots is the only
/// shared state and is guarded for lazy slot creation.
///
/// A thread that begins a second transaction before the first one returned
/// its connection simply gets a second connection.
class connection_pool {
public:
    connection_pool(std::string path, connection_options options);

    connection_pool(const connection_pool&) = delete;
    connection_pool& operator=(const connection_pool&) = delete;

    /// Take the calling thread's idle connection, or open a new one.
    /// Throws db_error when a new connection cannot be opened.
    std::unique_ptr<connection> acquire();

    /// Return a connection to the calling thread's slot. Any connection that
    /// was already idle there is closed.
    void release(std::unique_ptr<connection> conn);

    /// True if the calling thread's slot holds an idle connection.
    [[nodiscard]] bool has_idle() const;

    /// Number of threads that have used this pool.
    [[nodiscard]] size_t slot_count() const;

    /// Total connections opened by this pool over its lifetime.
    [[nodiscard]] size_t opened_count() const noexcept {
        return opened_.load(std::memory_order_relaxed);
    }

    const std::string& path() const { return path_; }
    const connection_options& options() const { return options_; }

private:
    struct slot {
        std::unique_ptr<connection> idle;
    };

    slot& local_slot();
    slot* find_local_slot() const;
    std::unique_ptr<connection> open_connection();

    std::string path_;
    connection_options options_;

    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::thread::id, std::unique_ptr<slot>> slots_;
    std::atomic<size_t> opened_{0};
};

} // namespace folio

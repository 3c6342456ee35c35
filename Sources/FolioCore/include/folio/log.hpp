#pragma once

#include <atomic>
#include <functional>
#include <string>

namespace folio {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide threshold, defined in FolioCore/src/log.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

const char* log_level_name(log_level level);

/// Receives every formatted message that passes the threshold. `tag` names
/// the subsystem ("instance", "txn", "migration", ...).
using log_sink = std::function<void(log_level level, const char* tag, const std::string& message)>;

/// Replace the destination of log output. An empty sink restores the
/// default, which writes "[LEVEL] [tag] message" lines to stderr.
void set_log_sink(log_sink sink);

namespace detail {

#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
void write_log(log_level level, const char* tag, const char* fmt, ...);

} // namespace detail

} // namespace folio

#define FOLIO_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(folio::g_log_level.load(std::memory_order_relaxed))) { \
            folio::detail::write_log(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) FOLIO_LOG(folio::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  FOLIO_LOG(folio::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  FOLIO_LOG(folio::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) FOLIO_LOG(folio::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

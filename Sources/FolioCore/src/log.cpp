#include "folio/log.hpp"
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <utility>
#include <vector>

namespace folio {

std::atomic<log_level> g_log_level{log_level::off};

namespace {

std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
}

log_sink& current_sink() {
    static log_sink sink;
    return sink;
}

} // namespace

const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::off: return "OFF";
        case log_level::error: return "ERROR";
        case log_level::warn: return "WARN";
        case log_level::info: return "INFO";
        case log_level::debug: return "DEBUG";
    }
    return "UNKNOWN";
}

void set_log_sink(log_sink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = std::move(sink);
}

namespace detail {

void write_log(log_level level, const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list sized;
    va_copy(sized, args);
    int length = std::vsnprintf(nullptr, 0, fmt, sized);
    va_end(sized);

    std::string message;
    if (length > 0) {
        std::vector<char> buffer(static_cast<size_t>(length) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        message.assign(buffer.data(), static_cast<size_t>(length));
    }
    va_end(args);

    std::lock_guard<std::mutex> lock(sink_mutex());
    if (current_sink()) {
        current_sink()(level, tag, message);
    } else {
        std::fprintf(stderr, "[%s] [%s] %s\n", log_level_name(level), tag, message.c_str());
    }
}

} // namespace detail

} // namespace folio

/**
 * @file logging.cpp
 * @brief Implementation of the droidglue logging layer.
 *
 * Thread-safety: callback registration is protected by a mutex; the level
 * check is a relaxed atomic load so filtered messages cost no locking.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/logging.h"

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <mutex>
#include <atomic>

namespace {

// Mutex for callback registration (not for logging itself)
std::mutex g_log_mutex;

// Current callback and userdata
droidglue::LogCallback g_log_callback = nullptr;
void* g_log_userdata = nullptr;

// Minimum log level (atomic for lock-free reads in hot path)
std::atomic<droidglue::LogLevel> g_min_log_level{droidglue::LogLevel::Info};

// Android's logger caps a single line at roughly 4K; stay well under it
constexpr size_t LOG_BUFFER_SIZE = 1024;

void dispatch(droidglue::LogLevel level, const char* subsystem, const char* message) noexcept {
    droidglue::LogCallback callback = nullptr;
    void* userdata = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        callback = g_log_callback;
        userdata = g_log_userdata;
    }

    if (callback) {
        callback(level, subsystem, message, userdata);
    } else {
        droidglue::detail::default_log_handler(level, subsystem, message, nullptr);
    }
}

} // anonymous namespace

namespace droidglue {

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "UNKNOWN";
}

void set_log_callback(LogCallback callback, void* userdata) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = callback;
    g_log_userdata = userdata;
}

void get_log_callback(LogCallback& callback, void*& userdata) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    callback = g_log_callback;
    userdata = g_log_userdata;
}

void set_log_level(LogLevel level) noexcept {
    g_min_log_level.store(level, std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
    return g_min_log_level.load(std::memory_order_relaxed);
}

namespace detail {

void default_log_handler(
    LogLevel level,
    const char* subsystem,
    const char* message,
    void* /*userdata*/
) noexcept {
    std::fprintf(stderr, "[%s] %s: %s\n", log_level_name(level), subsystem, message);
}

} // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// Core Logging Functions
// ─────────────────────────────────────────────────────────────────────────────

void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    // string_view is not guaranteed to be null-terminated
    char buffer[LOG_BUFFER_SIZE];
    const size_t len = message.size() < LOG_BUFFER_SIZE ? message.size() : LOG_BUFFER_SIZE - 1;
    std::memcpy(buffer, message.data(), len);
    buffer[len] = '\0';

    dispatch(level, subsystem, buffer);
}

void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    char buffer[LOG_BUFFER_SIZE];
    va_list args;
    va_start(args, fmt);
    int written = std::vsnprintf(buffer, LOG_BUFFER_SIZE, fmt, args);
    va_end(args);

    if (written < 0) {
        // Encoding error
        buffer[0] = '\0';
    } else if (static_cast<size_t>(written) >= LOG_BUFFER_SIZE) {
        // Truncated - add ellipsis
        buffer[LOG_BUFFER_SIZE - 4] = '.';
        buffer[LOG_BUFFER_SIZE - 3] = '.';
        buffer[LOG_BUFFER_SIZE - 2] = '.';
        buffer[LOG_BUFFER_SIZE - 1] = '\0';
    }

    dispatch(level, subsystem, buffer);
}

} // namespace droidglue

/**
 * @file logging.h
 * @brief Leveled, subsystem-tagged logging with a replaceable sink.
 *
 * - All library output goes through one callback
 * - With no callback set, messages go to stderr
 * - While a bridge is running the callback forwards to the platform log
 *   (IHost::writeLog), with the subsystem as the log tag
 *
 * Usage:
 *   LOG_MSG("bridge", "user thread started");
 *   LOG_ERROR("asset", "failed to open %s", name);
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef DROIDGLUE_LOGGING_H
#define DROIDGLUE_LOGGING_H

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace droidglue {

// ─────────────────────────────────────────────────────────────────────────────
// Log Level
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log severity levels.
 *
 * Ordered from most to least severe for filtering.
 */
enum class LogLevel : int {
    Error = 0,   ///< Errors that affect operation
    Warn  = 1,   ///< Warnings about potential issues
    Info  = 2,   ///< Informational messages
    Debug = 3,   ///< Debug information
    Trace = 4    ///< Detailed trace for debugging
};

/**
 * @brief Convert LogLevel to string.
 */
[[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Callback
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log callback function type.
 *
 * @param level     Severity level of the message
 * @param subsystem Subsystem identifier (e.g., "bridge", "input", "asset")
 * @param message   The log message (null-terminated)
 * @param userdata  User-provided context from registration
 */
using LogCallback = void (*)(
    LogLevel level,
    const char* subsystem,
    const char* message,
    void* userdata
);

/**
 * @brief Set the log callback (nullptr restores the stderr handler).
 */
void set_log_callback(LogCallback callback, void* userdata) noexcept;

/**
 * @brief Get the current log callback and its userdata.
 */
void get_log_callback(LogCallback& callback, void*& userdata) noexcept;

/**
 * @brief Set minimum log level (messages below this are filtered).
 *
 * @param level  Minimum level to log (default: LogLevel::Info)
 */
void set_log_level(LogLevel level) noexcept;

/**
 * @brief Get current minimum log level.
 */
[[nodiscard]] LogLevel get_log_level() noexcept;

/**
 * @brief Check if a log level is enabled.
 *
 * Use this to guard expensive log argument computation.
 */
[[nodiscard]] inline bool log_level_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

// ─────────────────────────────────────────────────────────────────────────────
// Logging Functions
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log a pre-formatted message (fast path).
 *
 * No formatting is performed; message is passed directly to the callback.
 * Messages longer than the internal buffer are truncated.
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with printf-style formatting.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

namespace detail {

/**
 * @brief Default log handler that writes to stderr.
 *
 * Format: [LEVEL] subsystem: message
 */
void default_log_handler(
    LogLevel level,
    const char* subsystem,
    const char* message,
    void* userdata
) noexcept;

} // namespace detail

} // namespace droidglue

// ═══════════════════════════════════════════════════════════════════════════════
// Logging Macros
// ═══════════════════════════════════════════════════════════════════════════════

// Guard macro for expensive argument computation
#define LOG_LEVEL_ENABLED(level) \
    ::droidglue::log_level_enabled(::droidglue::LogLevel::level)

#define LOG_MSG(subsys, ...) \
    ::droidglue::log_printf(::droidglue::LogLevel::Info, subsys, __VA_ARGS__)

#define LOG_ERROR(subsys, ...) \
    ::droidglue::log_printf(::droidglue::LogLevel::Error, subsys, __VA_ARGS__)

#define LOG_WARN(subsys, ...) \
    ::droidglue::log_printf(::droidglue::LogLevel::Warn, subsys, __VA_ARGS__)

#define LOG_DEBUG(subsys, ...) \
    ::droidglue::log_printf(::droidglue::LogLevel::Debug, subsys, __VA_ARGS__)

#define LOG_TRACE(subsys, ...) \
    ::droidglue::log_printf(::droidglue::LogLevel::Trace, subsys, __VA_ARGS__)

// Fast path for pre-formatted messages
#define LOG_RAW(level, subsys, msg) \
    ::droidglue::log_raw(::droidglue::LogLevel::level, subsys, msg)

#endif /* DROIDGLUE_LOGGING_H */

/**
 * @file error.h
 * @brief Error handling infrastructure using C++23 std::expected.
 *
 * Provides:
 * - Error class with code, message, and source location
 * - Result<T> type alias for std::expected<T, Error>
 * - Ok(), Err(), make_error() helper functions
 *
 * Recoverable failures (a missing asset, a wait that timed out) travel as
 * Result<T>. Caller-contract violations do not; see exceptions.h.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <expected>
#include <source_location>
#include <string>
#include <utility>
#include <cstdint>

namespace droidglue {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Categorized error codes for Result<T> failures.
 */
enum class ErrorCode : int {
    // Success (not stored in Error)
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 3,
    InvalidState = 4,
    NotInitialized = 5,
    AlreadyInitialized = 6,
    Timeout = 7,
    ShutDown = 8,

    // Asset errors (200-299)
    AssetMissing = 200,
    EmptyBuffer = 201,

    // Host errors (500-599)
    NullPointer = 500,
    PollFailed = 501,
};

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::NotInitialized: return "NotInitialized";
        case ErrorCode::AlreadyInitialized: return "AlreadyInitialized";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ShutDown: return "ShutDown";
        case ErrorCode::AssetMissing: return "AssetMissing";
        case ErrorCode::EmptyBuffer: return "EmptyBuffer";
        case ErrorCode::NullPointer: return "NullPointer";
        case ErrorCode::PollFailed: return "PollFailed";
        default: return "Unknown";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error with code, message, and source location.
 *
 * Used as the error type in Result<T> (std::expected<T, Error>).
 *
 * Example:
 * @code
 *   Error err(ErrorCode::AssetMissing, "asset not found: shaders/quad.vert");
 *   write_log(err.format());
 *   // AssetMissing at assets.cpp:31 (load_asset): asset not found: shaders/quad.vert
 * @endcode
 */
class Error {
public:
    /**
     * @brief Construct an error with code and message.
     * @param code Error category
     * @param message Human-readable description
     * @param location Source location (auto-captured by default)
     */
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , message_(std::move(message))
        , location_(location)
    {}

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    [[nodiscard]] const char* file() const noexcept {
        return location_.file_name();
    }

    [[nodiscard]] uint_least32_t line() const noexcept {
        return location_.line();
    }

    [[nodiscard]] const char* function() const noexcept {
        return location_.function_name();
    }

    /**
     * @brief Format error for display/logging.
     * @return Formatted string: "CODE at file:line (func): message"
     */
    [[nodiscard]] std::string format() const {
        std::string out = error_code_name(code_);
        out += " at ";
        out += location_.file_name();
        out += ':';
        out += std::to_string(location_.line());
        out += " (";
        out += location_.function_name();
        out += "): ";
        out += message_;
        return out;
    }

    /**
     * @brief Check if this is a specific error code.
     */
    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Result type for fallible operations.
 *
 * Represents either a success value of type T, or an Error.
 *
 * @code
 *   auto bytes = droidglue::load_asset("config.json");
 *   if (!bytes) {
 *       if (bytes.error().is(ErrorCode::AssetMissing)) { ... }
 *   }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Create a successful Result.
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

/**
 * @brief Create a void successful Result.
 */
[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

/**
 * @brief Create a failed Result.
 */
[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

/**
 * @brief Create error with code and message.
 *
 * @param code Error code
 * @param msg Error message
 * @param loc Source location (auto-captured)
 * @return std::unexpected<Error> convertible to any Result<T>
 */
[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return error if condition is false.
 *
 * Usage:
 *   DROIDGLUE_CHECK(ms > 0, ErrorCode::InvalidArgument, "interval must be positive");
 */
#define DROIDGLUE_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::droidglue::make_error(code, msg); \
        } \
    } while (0)

} // namespace droidglue

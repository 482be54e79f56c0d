/**
 * @file exceptions.h
 * @brief Exception hierarchy for caller-contract violations.
 *
 * These exceptions represent programming errors in the embedding code
 * (for example, asking for the native window before bridge_main() has
 * run). They are never used for recoverable conditions; those are
 * reported through Result<T> (see error.h).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace droidglue {

/**
 * @brief Base class for all droidglue exceptions.
 */
class GlueException : public std::runtime_error {
public:
    explicit GlueException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception replacing abort() in library mode.
 *
 * Thrown when an accessor is used outside the bridge's lifetime. Left
 * uncaught on the user thread it terminates the process, which is the
 * intended outcome; tests catch it to observe the violation.
 */
class FatalException : public GlueException {
public:
    explicit FatalException(const std::string& msg)
        : GlueException("Fatal error: " + msg)
        , file_("")
        , line_(0)
    {}

    FatalException(const std::string& msg, const char* file, int line)
        : GlueException("Fatal error at " + std::string(file) + ":" +
                        std::to_string(line) + ": " + msg)
        , file_(file)
        , line_(line)
    {}

    [[nodiscard]] const char* file() const noexcept { return file_; }
    [[nodiscard]] int line() const noexcept { return line_; }

private:
    const char* file_;
    int line_;
};

namespace detail {

/// Log a fatal message and abort the process
[[noreturn]] void fatal_abort(const std::string& msg, const char* file, int line) noexcept;

} // namespace detail

} // namespace droidglue

// ─────────────────────────────────────────────────────────────────────────────
// abort() Replacement Macro
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Report a caller-contract violation.
 *
 * In library mode, throws FatalException.
 * Otherwise logs the message through the active log sink and aborts.
 */
#ifdef DROIDGLUE_LIBRARY_MODE
    #define DROIDGLUE_FATAL(msg) \
        throw ::droidglue::FatalException(msg, __FILE__, __LINE__)
#else
    #define DROIDGLUE_FATAL(msg) \
        ::droidglue::detail::fatal_abort(msg, __FILE__, __LINE__)
#endif

/**
 * @file config.h
 * @brief Bridge configuration and its fluent builder.
 */

#pragma once

#include "droidglue/error.h"
#include "droidglue/logging.h"

#include <chrono>
#include <string>

namespace droidglue {

/**
 * @brief Settings applied by bridge_main().
 */
struct BridgeConfig {
    /// Re-check interval of the native window wait
    std::chrono::milliseconds window_poll_interval{10};

    /// Route std::cout / std::cerr to the platform log while the bridge runs
    bool redirect_stdio = true;

    /// Minimum level forwarded to the platform log
    LogLevel log_level = LogLevel::Info;

    static constexpr std::chrono::milliseconds MinWindowPollInterval{1};
    static constexpr std::chrono::milliseconds MaxWindowPollInterval{1000};
};

// ─────────────────────────────────────────────────────────────────────────────
// BridgeBuilder
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Fluent builder for BridgeConfig.
 *
 * Example:
 * @code
 *   auto config = BridgeBuilder()
 *       .with_window_poll_interval(std::chrono::milliseconds{5})
 *       .with_stdio_redirect(false)
 *       .with_log_level(LogLevel::Debug)
 *       .build();
 *
 *   if (config) {
 *       bridge_main(host, entry, *config);
 *   }
 * @endcode
 */
class BridgeBuilder {
public:
    BridgeBuilder() = default;

    /**
     * @brief Set the window wait re-check interval (1 ms to 1000 ms).
     */
    BridgeBuilder& with_window_poll_interval(std::chrono::milliseconds interval) noexcept {
        config_.window_poll_interval = interval;
        return *this;
    }

    /**
     * @brief Enable/disable redirection of std::cout and std::cerr.
     */
    BridgeBuilder& with_stdio_redirect(bool enabled = true) noexcept {
        config_.redirect_stdio = enabled;
        return *this;
    }

    /**
     * @brief Set the minimum log level.
     */
    BridgeBuilder& with_log_level(LogLevel level) noexcept {
        config_.log_level = level;
        return *this;
    }

    /**
     * @brief Configure for verbose diagnostics.
     */
    BridgeBuilder& verbose() noexcept {
        config_.log_level = LogLevel::Trace;
        return *this;
    }

    /**
     * @brief Validate and build configuration.
     * @return Result with valid config or InvalidArgument
     */
    [[nodiscard]] Result<BridgeConfig> build() const {
        if (config_.window_poll_interval < BridgeConfig::MinWindowPollInterval ||
            config_.window_poll_interval > BridgeConfig::MaxWindowPollInterval) {
            return make_error(ErrorCode::InvalidArgument,
                "window poll interval must be between 1 and 1000 ms, got " +
                std::to_string(config_.window_poll_interval.count()));
        }
        if (static_cast<int>(config_.log_level) < static_cast<int>(LogLevel::Error) ||
            static_cast<int>(config_.log_level) > static_cast<int>(LogLevel::Trace)) {
            return make_error(ErrorCode::InvalidArgument, "log level out of range");
        }
        return Ok(config_);
    }

private:
    BridgeConfig config_;
};

} // namespace droidglue

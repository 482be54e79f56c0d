/**
 * @file bridge_context.h
 * @brief Per-bridge shared state stored in the host's user-data slot.
 *
 * One BridgeContext is created by each bridge_main() call. The poll
 * thread's callbacks reach it through the host's user-data slot; the user
 * thread's accessors hold a shared_ptr copy from bridge_state, so a
 * context outlives bridge_main() for as long as an accessor is inside it.
 */

#pragma once

#include "droidglue/config.h"
#include "droidglue/error.h"
#include "droidglue/host/host.h"
#include "droidglue/subscriber_registry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace droidglue {

/**
 * @brief Notification fired when the host creates its window.
 *
 * await_window() checks the host's window field under the signal's lock,
 * so a notify() between the check and the wait is never lost. Once
 * shut_down() has returned the host is never touched again.
 */
class WindowSignal {
public:
    WindowSignal() = default;

    WindowSignal(const WindowSignal&) = delete;
    WindowSignal& operator=(const WindowSignal&) = delete;

    /// Mark the window ready and wake every waiter
    void notify();

    /// Mark the window gone
    void reset();

    /// Wake every waiter for good; called before the host goes away
    void shut_down();

    /// True between notify() and reset()
    [[nodiscard]] bool is_ready() const;

    [[nodiscard]] bool is_shut_down() const;

    /// Counter bumped by every notify() and reset()
    [[nodiscard]] uint64_t generation() const;

    /// Wait until generation() differs from seen, or timeout expires
    /// @return true if the generation changed
    bool wait_for_change(uint64_t seen, std::chrono::milliseconds timeout);

    /**
     * @brief Return the host's window, waiting up to timeout for a change.
     * @return The window, Timeout if none appeared, or ShutDown
     */
    [[nodiscard]] Result<host::NativeWindow*> await_window(const host::IHost& host,
                                                           std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_ = 0;
    bool ready_ = false;
    bool shut_down_ = false;
};

/**
 * @brief State shared between the poll thread and the user thread.
 */
class BridgeContext {
public:
    explicit BridgeContext(const BridgeConfig& config)
        : config_(config) {}

    BridgeContext(const BridgeContext&) = delete;
    BridgeContext& operator=(const BridgeContext&) = delete;

    [[nodiscard]] SubscriberRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] WindowSignal& window_signal() noexcept { return window_signal_; }
    [[nodiscard]] const BridgeConfig& config() const noexcept { return config_; }

    [[nodiscard]] bool has_focus() const noexcept {
        return focused_.load(std::memory_order_acquire);
    }

    void set_focus(bool focused) noexcept {
        focused_.store(focused, std::memory_order_release);
    }

private:
    const BridgeConfig config_;
    SubscriberRegistry registry_;
    WindowSignal window_signal_;
    std::atomic<bool> focused_{false};
};

} // namespace droidglue

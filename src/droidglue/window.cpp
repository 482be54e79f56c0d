/**
 * @file window.cpp
 * @brief Native window accessor.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/window.h"
#include "droidglue/bridge_context.h"
#include "droidglue/bridge_state.h"
#include "droidglue/exceptions.h"

#include <algorithm>
#include <memory>
#include <string>

namespace droidglue {

host::NativeWindow* get_native_window() {
    host::IHost& host = bridge_state::require("get_native_window");
    const std::shared_ptr<BridgeContext> context = bridge_state::require_context("get_native_window");
    WindowSignal& signal = context->window_signal();

    for (;;) {
        auto window = signal.await_window(host, context->config().window_poll_interval);
        if (window) {
            return *window;
        }
        if (window.error().is(ErrorCode::ShutDown)) {
            DROIDGLUE_FATAL("get_native_window: bridge shut down before the native window was created");
        }
    }
}

Result<host::NativeWindow*> wait_native_window(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    host::IHost& host = bridge_state::require("wait_native_window");
    const std::shared_ptr<BridgeContext> context = bridge_state::require_context("wait_native_window");
    WindowSignal& signal = context->window_signal();

    const auto deadline = Clock::now() + timeout;
    for (;;) {
        const auto remaining = std::max(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()),
            std::chrono::milliseconds::zero());

        auto window = signal.await_window(host, std::min(remaining, context->config().window_poll_interval));
        if (window || window.error().is(ErrorCode::ShutDown)) {
            return window;
        }
        if (Clock::now() >= deadline) {
            return make_error(ErrorCode::Timeout,
                "native window not available after " + std::to_string(timeout.count()) + " ms");
        }
    }
}

} // namespace droidglue

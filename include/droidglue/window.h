/**
 * @file window.h
 * @brief Access to the host's native window from the user thread.
 */

#pragma once

#include "droidglue/error.h"
#include "droidglue/host/types.h"

#include <chrono>

namespace droidglue {

/**
 * @brief Block until the host has created its window, then return it.
 *
 * Wakes as soon as the InitWindow command is dispatched, and re-checks
 * the host every BridgeConfig::window_poll_interval in any case.
 * A fatal contract violation if called outside bridge_main(), or if the
 * bridge shuts down before a window is created.
 */
host::NativeWindow* get_native_window();

/**
 * @brief Like get_native_window(), but gives up after timeout.
 * @return The window, Timeout, or ShutDown if the bridge exits first
 */
[[nodiscard]] Result<host::NativeWindow*> wait_native_window(std::chrono::milliseconds timeout);

} // namespace droidglue

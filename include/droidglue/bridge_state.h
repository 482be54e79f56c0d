/**
 * @file bridge_state.h
 * @brief Process-wide record of the running bridge's host.
 *
 * Written once by bridge_main() before the callbacks are installed and
 * before the user thread is spawned, cleared when the poll loop exits.
 * The BridgeContext is held by shared_ptr so an accessor that fetched it
 * keeps it alive past clear().
 * The pointer is stored with release and loaded with acquire, so any
 * thread that observes it also observes the fully wired host.
 *
 * Only one bridge may run per process: a second install() fails with
 * AlreadyInitialized.
 */

#pragma once

#include "droidglue/error.h"
#include "droidglue/host/host.h"

#include <memory>

namespace droidglue {

class BridgeContext;

namespace bridge_state {

/**
 * @brief Record the host of the bridge that is starting.
 * @return Ok, or AlreadyInitialized if another bridge is running
 */
[[nodiscard]] Result<void> install(host::IHost& host);

/**
 * @brief Publish the running bridge's context to the user thread.
 */
void attach_context(std::shared_ptr<BridgeContext> context) noexcept;

/**
 * @brief Forget the current host and context.
 */
void clear() noexcept;

/**
 * @brief The current host, or nullptr outside a bridge's lifetime.
 */
[[nodiscard]] host::IHost* current() noexcept;

/**
 * @brief The current host; a fatal contract violation if there is none.
 * @param caller Name reported in the failure message
 */
host::IHost& require(const char* caller);

/**
 * @brief The running bridge's context.
 *
 * Fatal if no bridge is running or no context has been attached.
 */
std::shared_ptr<BridgeContext> require_context(const char* caller);

} // namespace bridge_state
} // namespace droidglue

/**
 * @file bridge.h
 * @brief Bootstrap of the bridge and the entry points user code calls.
 *
 * bridge_main() takes over the thread the host handed control to, runs the
 * host's event loop on it, and runs the user's entry function on a second,
 * detached thread. While it runs, user code may:
 *
 * - subscribe() / subscribe_channel() to receive pointer events
 * - get_native_window() / wait_native_window() to obtain the render surface
 * - load_asset() to read bundled files
 * - write_log() or std::cout / std::cerr to reach the platform log
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "droidglue/channel.h"
#include "droidglue/config.h"
#include "droidglue/error.h"
#include "droidglue/host/host.h"

#include <cstddef>
#include <functional>
#include <string_view>

namespace droidglue {

/// The user's program; run once on its own thread
using UserEntry = std::function<void()>;

/// Platform log tag of write_log() and redirected stdio
inline constexpr const char* StdioLogTag = "DroidGlueStdouterr";

/**
 * @brief Run the bridge on the calling thread until the host requests destroy.
 *
 * Only one bridge may run per process. The user thread is detached and
 * never joined; it may outlive this call.
 *
 * @param host   The native application handle
 * @param entry  User program (must not be empty)
 * @param config Bridge settings
 * @return Ok after the host requested destroy, or AlreadyInitialized
 */
[[nodiscard]] Result<void> bridge_main(host::IHost& host, UserEntry entry,
                                       const BridgeConfig& config = {});

/**
 * @brief bridge_main() for process entry points.
 *
 * Logs and aborts if the bridge cannot start.
 */
void run_app(host::IHost& host, UserEntry entry, const BridgeConfig& config = {});

/**
 * @brief Register an endpoint for every pointer event published from now on.
 *
 * Fatal if no bridge is running.
 */
void subscribe(EventSender endpoint);

/**
 * @brief Create a channel, subscribe its sender and return the receiver.
 * @param capacity Maximum queued events (0 = unbounded)
 */
[[nodiscard]] EventReceiver subscribe_channel(size_t capacity = 0);

/**
 * @brief True while the application window has input focus.
 *
 * Fatal if no bridge is running.
 */
[[nodiscard]] bool has_focus();

/**
 * @brief Write one line to the platform log under StdioLogTag.
 *
 * Not subject to the log level filter. Outside a bridge the line goes to
 * the default stderr handler.
 */
void write_log(std::string_view line);

} // namespace droidglue

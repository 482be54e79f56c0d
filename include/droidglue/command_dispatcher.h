/**
 * @file command_dispatcher.h
 * @brief Lifecycle command handling.
 *
 * Commands never become portable events; they only update the bridge
 * context. Recognized commands:
 *
 * | Command       | Effect                                  |
 * |---------------|-----------------------------------------|
 * | InitWindow    | fires the window-ready signal           |
 * | TermWindow    | resets the window-ready signal          |
 * | GainedFocus   | BridgeContext::has_focus() becomes true |
 * | LostFocus     | BridgeContext::has_focus() becomes false|
 * | SaveState     | acknowledged; no state is saved         |
 *
 * Every other command is ignored.
 */

#pragma once

#include "droidglue/bridge_context.h"
#include "droidglue/host/types.h"

namespace droidglue {

void dispatch_command(host::AppCommand command, BridgeContext& context);

} // namespace droidglue

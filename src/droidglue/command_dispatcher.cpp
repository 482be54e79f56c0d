/**
 * @file command_dispatcher.cpp
 * @brief Lifecycle command handling.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/command_dispatcher.h"
#include "droidglue/logging.h"

namespace droidglue {

void dispatch_command(host::AppCommand command, BridgeContext& context) {
    switch (command) {
        case host::AppCommand::InitWindow:
            LOG_DEBUG("command", "window created");
            context.window_signal().notify();
            break;

        case host::AppCommand::SaveState:
            // Persistence across lifecycle transitions is not supported
            LOG_DEBUG("command", "save state requested");
            break;

        case host::AppCommand::TermWindow:
            LOG_DEBUG("command", "window terminating");
            context.window_signal().reset();
            break;

        case host::AppCommand::GainedFocus:
            context.set_focus(true);
            break;

        case host::AppCommand::LostFocus:
            context.set_focus(false);
            break;

        default:
            break;
    }
}

} // namespace droidglue

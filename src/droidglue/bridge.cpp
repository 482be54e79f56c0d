/**
 * @file bridge.cpp
 * @brief Bridge bootstrap and poll loop.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/bridge.h"
#include "droidglue/bridge_context.h"
#include "droidglue/bridge_state.h"
#include "droidglue/command_dispatcher.h"
#include "droidglue/exceptions.h"
#include "droidglue/gsl.hpp"
#include "droidglue/input_translator.h"
#include "droidglue/logging.h"
#include "droidglue/stdio_redirect.h"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace droidglue {

namespace {

host::LogPriority to_priority(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return host::LogPriority::Error;
        case LogLevel::Warn:  return host::LogPriority::Warn;
        case LogLevel::Info:  return host::LogPriority::Info;
        case LogLevel::Debug: return host::LogPriority::Debug;
        case LogLevel::Trace: return host::LogPriority::Verbose;
    }
    return host::LogPriority::Info;
}

// Log callback installed while a bridge runs; userdata is the host
void host_log_sink(LogLevel level, const char* subsystem, const char* message, void* userdata) {
    static_cast<host::IHost*>(userdata)->writeLog(to_priority(level), subsystem, message);
}

// ─────────────────────────────────────────────────────────────────────────────
// Host callbacks (poll thread)
// ─────────────────────────────────────────────────────────────────────────────

void on_command(host::IHost& host, int32_t command) {
    auto* context = static_cast<BridgeContext*>(host.userData());
    if (context == nullptr) {
        return;
    }
    const auto app_command = static_cast<host::AppCommand>(command);
    LOG_TRACE("bridge", "command %s", host::toString(app_command));
    dispatch_command(app_command, *context);
}

int32_t on_input(host::IHost& host, const host::IMotionEvent& event) {
    auto* context = static_cast<BridgeContext*>(host.userData());
    if (context == nullptr) {
        return 0;
    }
    return translate_input(event, context->registry());
}

// ─────────────────────────────────────────────────────────────────────────────
// User thread
// ─────────────────────────────────────────────────────────────────────────────

void run_user_entry(UserEntry entry) {
    LOG_DEBUG("bridge", "user thread running");
    try {
        entry();
    } catch (const std::exception& e) {
        LOG_ERROR("bridge", "user thread failed: %s", e.what());
        std::terminate();
    } catch (...) {
        LOG_ERROR("bridge", "user thread failed with a non-standard exception");
        std::terminate();
    }
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Bootstrap
// ─────────────────────────────────────────────────────────────────────────────

Result<void> bridge_main(host::IHost& host, UserEntry entry, const BridgeConfig& config) {
    gsl_Expects(static_cast<bool>(entry));

    auto context = std::make_shared<BridgeContext>(config);

    if (auto installed = bridge_state::install(host); !installed) {
        return installed;
    }

    LogCallback previous_callback = nullptr;
    void* previous_userdata = nullptr;
    get_log_callback(previous_callback, previous_userdata);
    const LogLevel previous_level = get_log_level();

    std::optional<StdioRedirect> redirect;

    // Window waiters are released last, once nothing routes to the host
    auto teardown = gsl::finally([&] {
        redirect.reset();
        host.setCallbacks(nullptr, nullptr);
        host.setUserData(nullptr);
        set_log_callback(previous_callback, previous_userdata);
        set_log_level(previous_level);
        bridge_state::clear();
        context->window_signal().shut_down();
    });

    host.setCallbacks(&on_command, &on_input);
    host.setUserData(context.get());
    bridge_state::attach_context(context);

    set_log_callback(&host_log_sink, &host);
    set_log_level(config.log_level);
    if (config.redirect_stdio) {
        redirect.emplace([&host](std::string_view line) {
            const std::string text(line);
            host.writeLog(host::LogPriority::Debug, StdioLogTag, text.c_str());
        });
    }

    std::thread(run_user_entry, std::move(entry)).detach();

    while (!host.isDestroyRequested()) {
        const host::PollStatus status = host.pollOnce(-1);
        if (status == host::PollStatus::Error) {
            LOG_ERROR("bridge", "event loop poll failed");
        }
    }

    LOG_DEBUG("bridge", "destroy requested, leaving event loop");
    return Ok();
}

void run_app(host::IHost& host, UserEntry entry, const BridgeConfig& config) {
    auto result = bridge_main(host, std::move(entry), config);
    if (!result) {
        detail::fatal_abort("bridge failed to start: " + result.error().format(),
                            __FILE__, __LINE__);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// User-facing entry points
// ─────────────────────────────────────────────────────────────────────────────

void subscribe(EventSender endpoint) {
    bridge_state::require_context("subscribe")->registry().subscribe(std::move(endpoint));
}

EventReceiver subscribe_channel(size_t capacity) {
    auto [sender, receiver] = make_event_channel(capacity);
    subscribe(std::move(sender));
    return std::move(receiver);
}

bool has_focus() {
    return bridge_state::require_context("has_focus")->has_focus();
}

void write_log(std::string_view line) {
    const std::string text(line);
    if (host::IHost* host = bridge_state::current()) {
        host->writeLog(host::LogPriority::Debug, StdioLogTag, text.c_str());
    } else {
        detail::default_log_handler(LogLevel::Debug, StdioLogTag, text.c_str(), nullptr);
    }
}

} // namespace droidglue

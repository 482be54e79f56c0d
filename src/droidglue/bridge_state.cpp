/**
 * @file bridge_state.cpp
 * @brief Process-wide bridge state.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/bridge_state.h"
#include "droidglue/bridge_context.h"
#include "droidglue/exceptions.h"

#include <atomic>
#include <mutex>
#include <string>
#include <utility>

namespace droidglue {
namespace bridge_state {

namespace {

std::atomic<host::IHost*> g_host{nullptr};

std::mutex g_context_mutex;
std::shared_ptr<BridgeContext> g_context;

} // anonymous namespace

Result<void> install(host::IHost& host) {
    host::IHost* expected = nullptr;
    if (!g_host.compare_exchange_strong(expected, &host,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
        return make_error(ErrorCode::AlreadyInitialized,
                          "a bridge is already running in this process");
    }
    return Ok();
}

void attach_context(std::shared_ptr<BridgeContext> context) noexcept {
    std::lock_guard<std::mutex> lock(g_context_mutex);
    g_context = std::move(context);
}

void clear() noexcept {
    {
        std::lock_guard<std::mutex> lock(g_context_mutex);
        g_context.reset();
    }
    g_host.store(nullptr, std::memory_order_release);
}

host::IHost* current() noexcept {
    return g_host.load(std::memory_order_acquire);
}

host::IHost& require(const char* caller) {
    host::IHost* host = current();
    if (host == nullptr) {
        DROIDGLUE_FATAL(std::string(caller) +
                        " called outside bridge_main(); the application was not started by the bridge");
    }
    return *host;
}

std::shared_ptr<BridgeContext> require_context(const char* caller) {
    require(caller);
    std::shared_ptr<BridgeContext> context;
    {
        std::lock_guard<std::mutex> lock(g_context_mutex);
        context = g_context;
    }
    if (!context) {
        DROIDGLUE_FATAL(std::string(caller) + " called before the bridge context was attached");
    }
    return context;
}

} // namespace bridge_state
} // namespace droidglue

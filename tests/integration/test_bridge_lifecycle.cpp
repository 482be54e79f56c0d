/**
 * @file test_bridge_lifecycle.cpp
 * @brief Integration tests for bridge_main() on the headless host.
 *
 * Tests end-to-end: start -> post host events -> observe from the user
 * thread -> request destroy.
 */

#include <gtest/gtest.h>
#include <droidglue/bridge.h>
#include <droidglue/bridge_state.h>
#include <droidglue/exceptions.h>
#include <droidglue/host/headless_host.h>
#include <droidglue/logging.h>
#include <droidglue/stdio_redirect.h>
#include <droidglue/window.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace droidglue;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

size_t stdio_lines(const host::HeadlessHost& host) {
    const auto logs = host.logs();
    return static_cast<size_t>(std::count_if(logs.begin(), logs.end(),
        [](const host::LogRecord& record) { return record.tag == StdioLogTag; }));
}

BridgeConfig quiet_config() {
    BridgeConfig config;
    config.redirect_stdio = false;
    return config;
}

} // namespace

class BridgeLifecycleTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (poll_thread_.joinable()) {
            stop();
        }
    }

    void start(UserEntry entry, BridgeConfig config = quiet_config()) {
        poll_thread_ = std::thread([this, entry = std::move(entry), config]() mutable {
            poll_thread_id_ = std::this_thread::get_id();
            result_ = bridge_main(host, std::move(entry), config);
        });
        ASSERT_TRUE(wait_until([this] {
            return bridge_state::current() == &host && host.userData() != nullptr;
        }));
    }

    void stop() {
        host.requestDestroy();
        poll_thread_.join();
    }

    host::HeadlessHost host;
    std::thread poll_thread_;
    std::thread::id poll_thread_id_;
    Result<void> result_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Bootstrap and Shutdown
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(BridgeLifecycleTest, UserEntryRunsOnItsOwnThread) {
    std::promise<std::thread::id> user_thread;

    start([&user_thread] { user_thread.set_value(std::this_thread::get_id()); });

    auto future = user_thread.get_future();
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    const std::thread::id user_id = future.get();
    stop();

    EXPECT_NE(user_id, poll_thread_id_);
    EXPECT_NE(user_id, std::this_thread::get_id());
}

TEST_F(BridgeLifecycleTest, ReturnsOkAfterDestroyAndClearsState) {
    LogCallback callback_before = nullptr;
    void* userdata_before = nullptr;
    get_log_callback(callback_before, userdata_before);

    start([] {});
    stop();

    EXPECT_TRUE(result_.has_value());
    EXPECT_EQ(bridge_state::current(), nullptr);
    EXPECT_EQ(host.userData(), nullptr);

    LogCallback callback_after = nullptr;
    void* userdata_after = nullptr;
    get_log_callback(callback_after, userdata_after);
    EXPECT_EQ(callback_after, callback_before);
    EXPECT_EQ(userdata_after, userdata_before);
}

TEST_F(BridgeLifecycleTest, CallbacksDetachedAfterShutdown) {
    start([] {});
    stop();

    // Nothing is listening any more; processing must be a no-op
    host.postCommand(host::AppCommand::InitWindow);
    host.postMotion(host::motion::ActionDown, 1.0f, 1.0f);
    EXPECT_EQ(host.pollOnce(0), host::PollStatus::Processed);
    EXPECT_EQ(host.pollOnce(0), host::PollStatus::Processed);
}

TEST_F(BridgeLifecycleTest, SecondBridgeRejected) {
    start([] {});

    host::HeadlessHost other;
    auto second = bridge_main(other, [] {}, quiet_config());

    ASSERT_FALSE(second.has_value());
    EXPECT_TRUE(second.error().is(ErrorCode::AlreadyInitialized));
    EXPECT_EQ(bridge_state::current(), &host);

    stop();
    EXPECT_TRUE(result_.has_value());
}

TEST_F(BridgeLifecycleTest, NewBridgeAfterShutdown) {
    start([] {});
    stop();

    host::HeadlessHost next;
    next.requestDestroy();
    auto result = bridge_main(next, [] {}, quiet_config());

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(bridge_state::current(), nullptr);
}

#ifdef DROIDGLUE_LIBRARY_MODE
TEST_F(BridgeLifecycleTest, EmptyEntryViolatesContract) {
    EXPECT_ANY_THROW((void)bridge_main(host, UserEntry{}, quiet_config()));
    EXPECT_EQ(bridge_state::current(), nullptr);
}
#endif

TEST_F(BridgeLifecycleTest, PollErrorLoggedAndLoopContinues) {
    start([] {});

    host.injectPollError();
    host.postCommand(host::AppCommand::Resume);
    ASSERT_TRUE(wait_until([this] { return host.pendingSources() == 0; }));

    EXPECT_TRUE(host.hasLog("bridge", "poll failed"));
    EXPECT_EQ(bridge_state::current(), &host);
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Window and Focus
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(BridgeLifecycleTest, InitWindowWakesWaitingUserThread) {
    std::promise<host::NativeWindow*> got_window;
    auto* window = reinterpret_cast<host::NativeWindow*>(uintptr_t{0xabc0});

    // A long re-check interval: only the InitWindow signal can wake the waiter quickly
    auto config = quiet_config();
    config.window_poll_interval = 1000ms;

    start([&got_window] { got_window.set_value(get_native_window()); }, config);

    auto future = got_window.get_future();
    EXPECT_EQ(future.wait_for(20ms), std::future_status::timeout);

    const auto posted_at = std::chrono::steady_clock::now();
    host.postInitWindow(window);

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - posted_at, 500ms);
    EXPECT_EQ(future.get(), window);
    stop();
}

TEST_F(BridgeLifecycleTest, WindowGoneAfterTermWindow) {
    auto* window = reinterpret_cast<host::NativeWindow*>(uintptr_t{0xabc0});
    start([] {});

    host.postInitWindow(window);
    ASSERT_TRUE(wait_until([this] { return host.nativeWindow() != nullptr; }));
    host.postTermWindow();
    ASSERT_TRUE(wait_until([this] { return host.nativeWindow() == nullptr; }));

    auto result = wait_native_window(20ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Timeout));
    stop();
}

#ifdef DROIDGLUE_LIBRARY_MODE
TEST_F(BridgeLifecycleTest, DestroyReleasesUserThreadBlockedOnWindow) {
    std::promise<std::string> outcome;

    start([&outcome] {
        try {
            get_native_window();
            outcome.set_value("returned a window");
        } catch (const FatalException& e) {
            outcome.set_value(e.what());
        }
    });

    auto future = outcome.get_future();
    EXPECT_EQ(future.wait_for(20ms), std::future_status::timeout);
    stop();

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_NE(future.get().find("shut down"), std::string::npos);
}
#endif

TEST_F(BridgeLifecycleTest, BoundedWindowWaitOutlivesDestroyedHost) {
    auto owned = std::make_unique<host::HeadlessHost>();
    std::promise<ErrorCode> outcome;

    Result<void> result;
    std::thread poll([&] {
        result = bridge_main(*owned, [&outcome] {
            auto window = wait_native_window(10s);
            outcome.set_value(window ? ErrorCode::Ok : window.error().code());
        }, quiet_config());
    });
    ASSERT_TRUE(wait_until([&owned] {
        return bridge_state::current() == owned.get() && owned->userData() != nullptr;
    }));

    auto future = outcome.get_future();
    EXPECT_EQ(future.wait_for(20ms), std::future_status::timeout);

    owned->requestDestroy();
    poll.join();
    owned.reset();

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(future.get(), ErrorCode::ShutDown);
    EXPECT_TRUE(result.has_value());
}

TEST_F(BridgeLifecycleTest, FocusCommandsTracked) {
    start([] {});
    EXPECT_FALSE(has_focus());

    host.postCommand(host::AppCommand::GainedFocus);
    EXPECT_TRUE(wait_until([] { return has_focus(); }));

    host.postCommand(host::AppCommand::LostFocus);
    EXPECT_TRUE(wait_until([] { return !has_focus(); }));
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(BridgeLifecycleTest, LogsRoutedToHostWithPriority) {
    std::promise<void> logged;
    auto config = quiet_config();
    config.log_level = LogLevel::Debug;

    start([&logged] {
        LOG_WARN("game", "low on %s", "mana");
        write_log("plain line");
        logged.set_value();
    }, config);

    ASSERT_EQ(logged.get_future().wait_for(2s), std::future_status::ready);
    stop();

    EXPECT_TRUE(host.hasLog("game", "low on mana"));
    EXPECT_TRUE(host.hasLog(StdioLogTag, "plain line"));
    EXPECT_TRUE(host.hasLog("bridge", "user thread running"));

    for (const auto& record : host.logs()) {
        if (record.tag == "game") {
            EXPECT_EQ(record.priority, host::LogPriority::Warn);
        }
        if (record.tag == StdioLogTag) {
            EXPECT_EQ(record.priority, host::LogPriority::Debug);
        }
    }
}

TEST_F(BridgeLifecycleTest, WriteLogBypassesLevelFilter) {
    std::promise<void> logged;
    auto config = quiet_config();
    config.log_level = LogLevel::Error;

    start([&logged] {
        LOG_MSG("game", "filtered");
        write_log("always");
        logged.set_value();
    }, config);

    ASSERT_EQ(logged.get_future().wait_for(2s), std::future_status::ready);
    stop();

    EXPECT_FALSE(host.hasLog("game", "filtered"));
    EXPECT_TRUE(host.hasLog(StdioLogTag, "always"));
}

TEST_F(BridgeLifecycleTest, StdioRedirectedWhileRunning) {
    std::promise<void> printed;
    BridgeConfig config;
    config.redirect_stdio = true;

    start([&printed] {
        std::cout << "hello from the user thread" << std::endl;
        std::cerr << "and from stderr\n";
        printed.set_value();
    }, config);

    ASSERT_EQ(printed.get_future().wait_for(2s), std::future_status::ready);
    stop();

    EXPECT_EQ(std::cout.rdbuf(), &StdioRedirect::buffer());
    EXPECT_TRUE(host.hasLog(StdioLogTag, "hello from the user thread"));
    EXPECT_TRUE(host.hasLog(StdioLogTag, "and from stderr"));
}

TEST_F(BridgeLifecycleTest, PrintingAcrossDestroyStopsReachingHost) {
    std::atomic<bool> keep_printing{true};
    std::promise<void> printing;
    std::promise<void> finished;
    BridgeConfig config;
    config.redirect_stdio = true;

    start([&] {
        bool first = true;
        while (keep_printing.load()) {
            std::cout << "frame" << std::endl;
            if (first) {
                printing.set_value();
                first = false;
            }
            std::this_thread::sleep_for(200us);
        }
        finished.set_value();
    }, config);

    ASSERT_EQ(printing.get_future().wait_for(2s), std::future_status::ready);
    stop();

    const size_t at_shutdown = stdio_lines(host);
    std::this_thread::sleep_for(10ms);
    EXPECT_GT(at_shutdown, 0u);
    EXPECT_EQ(stdio_lines(host), at_shutdown);

    keep_printing.store(false);
    ASSERT_EQ(finished.get_future().wait_for(2s), std::future_status::ready);
}

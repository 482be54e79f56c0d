/**
 * @file test_window.cpp
 * @brief Unit tests for the native window accessor.
 */

#include <gtest/gtest.h>
#include <droidglue/bridge_context.h>
#include <droidglue/bridge_state.h>
#include <droidglue/command_dispatcher.h>
#include <droidglue/exceptions.h>
#include <droidglue/host/headless_host.h>
#include <droidglue/window.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace droidglue;
using namespace std::chrono_literals;

namespace {

host::NativeWindow* fake_window(uintptr_t value) {
    return reinterpret_cast<host::NativeWindow*>(value);
}

} // namespace

class WindowAccessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        bridge_state::clear();
        host.setUserData(context.get());
        ASSERT_TRUE(bridge_state::install(host).has_value());
        bridge_state::attach_context(context);
    }

    void TearDown() override {
        bridge_state::clear();
    }

    host::HeadlessHost host;
    std::shared_ptr<BridgeContext> context = std::make_shared<BridgeContext>(BridgeConfig{});
};

// ─────────────────────────────────────────────────────────────────────────────
// WindowSignal
// ─────────────────────────────────────────────────────────────────────────────

TEST(WindowSignalTest, NotifyBumpsGeneration) {
    WindowSignal signal;
    const uint64_t seen = signal.generation();

    signal.notify();

    EXPECT_TRUE(signal.is_ready());
    EXPECT_NE(signal.generation(), seen);
    EXPECT_TRUE(signal.wait_for_change(seen, 0ms));
}

TEST(WindowSignalTest, WaitTimesOutWithoutChange) {
    WindowSignal signal;
    EXPECT_FALSE(signal.wait_for_change(signal.generation(), 5ms));
}

TEST(WindowSignalTest, ResetClearsReady) {
    WindowSignal signal;
    signal.notify();
    signal.reset();
    EXPECT_FALSE(signal.is_ready());
}

TEST(WindowSignalTest, ShutDownWakesWaiter) {
    WindowSignal signal;
    const uint64_t seen = signal.generation();

    auto waiter = std::async(std::launch::async, [&signal, seen] {
        return signal.wait_for_change(seen, 5s);
    });
    std::this_thread::sleep_for(5ms);
    signal.shut_down();

    ASSERT_EQ(waiter.wait_for(1s), std::future_status::ready);
    EXPECT_TRUE(waiter.get());
    EXPECT_TRUE(signal.is_shut_down());
    EXPECT_FALSE(signal.is_ready());
}

TEST(WindowSignalTest, AwaitWindowIgnoresHostAfterShutDown) {
    WindowSignal signal;
    host::HeadlessHost host;
    host.setWindow(fake_window(0x6000));

    signal.shut_down();
    auto result = signal.await_window(host, 0ms);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ShutDown));
}

TEST(WindowSignalTest, AwaitWindowReleasedByShutDown) {
    WindowSignal signal;
    host::HeadlessHost host;

    auto waiter = std::async(std::launch::async, [&signal, &host] {
        return signal.await_window(host, 5s);
    });
    EXPECT_EQ(waiter.wait_for(10ms), std::future_status::timeout);
    signal.shut_down();

    ASSERT_EQ(waiter.wait_for(1s), std::future_status::ready);
    auto result = waiter.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ShutDown));
}

// ─────────────────────────────────────────────────────────────────────────────
// get_native_window
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(WindowAccessorTest, ReturnsImmediatelyWhenWindowExists) {
    host.setWindow(fake_window(0x1000));
    EXPECT_EQ(get_native_window(), fake_window(0x1000));
}

TEST_F(WindowAccessorTest, WaitsForInitWindowCommand) {
    auto waiter = std::async(std::launch::async, [] { return get_native_window(); });

    EXPECT_EQ(waiter.wait_for(30ms), std::future_status::timeout);

    host.setWindow(fake_window(0x2000));
    dispatch_command(host::AppCommand::InitWindow, *context);

    ASSERT_EQ(waiter.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(waiter.get(), fake_window(0x2000));
}

TEST_F(WindowAccessorTest, ObservesWindowWithoutCommandWithinInterval) {
    auto waiter = std::async(std::launch::async, [] { return get_native_window(); });
    std::this_thread::sleep_for(5ms);

    // No InitWindow: the periodic re-check must still see it
    host.setWindow(fake_window(0x3000));

    ASSERT_EQ(waiter.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(waiter.get(), fake_window(0x3000));
}

TEST_F(WindowAccessorTest, FatalWhenBridgeShutsDownWhileWaiting) {
    auto waiter = std::async(std::launch::async, [] { return get_native_window(); });
    EXPECT_EQ(waiter.wait_for(20ms), std::future_status::timeout);

    bridge_state::clear();
    context->window_signal().shut_down();

    ASSERT_EQ(waiter.wait_for(1s), std::future_status::ready);
    EXPECT_THROW(waiter.get(), FatalException);
}

TEST_F(WindowAccessorTest, FatalOutsideBridge) {
    bridge_state::clear();
    EXPECT_THROW(get_native_window(), FatalException);
}

// ─────────────────────────────────────────────────────────────────────────────
// wait_native_window
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(WindowAccessorTest, BoundedWaitTimesOut) {
    auto result = wait_native_window(20ms);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Timeout));
}

TEST_F(WindowAccessorTest, BoundedWaitReturnsWindow) {
    std::thread creator([this] {
        std::this_thread::sleep_for(10ms);
        host.setWindow(fake_window(0x4000));
        dispatch_command(host::AppCommand::InitWindow, *context);
    });

    auto result = wait_native_window(2s);
    creator.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, fake_window(0x4000));
}

TEST_F(WindowAccessorTest, BoundedWaitReportsShutDown) {
    auto waiter = std::async(std::launch::async, [] { return wait_native_window(5s); });
    EXPECT_EQ(waiter.wait_for(20ms), std::future_status::timeout);

    context->window_signal().shut_down();

    ASSERT_EQ(waiter.wait_for(1s), std::future_status::ready);
    auto result = waiter.get();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::ShutDown));
}

TEST_F(WindowAccessorTest, ZeroTimeoutWithWindowSucceeds) {
    host.setWindow(fake_window(0x5000));
    auto result = wait_native_window(0ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, fake_window(0x5000));
}

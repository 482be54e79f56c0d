/**
 * @file test_subscriber_registry.cpp
 * @brief Unit tests for SubscriberRegistry fan-out.
 */

#include <gtest/gtest.h>
#include <droidglue/subscriber_registry.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace droidglue;
using namespace droidglue::events;

class SubscriberRegistryTest : public ::testing::Test {
protected:
    SubscriberRegistry registry;
};

// ─────────────────────────────────────────────────────────────────────────────
// Delivery
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(SubscriberRegistryTest, PublishWithNoSubscribers) {
    auto stats = registry.publish(PointerPressed{});
    EXPECT_EQ(stats.delivered, 0u);
    EXPECT_EQ(stats.dropped, 0u);
    EXPECT_EQ(stats.pruned, 0u);
}

TEST_F(SubscriberRegistryTest, EverySubscriberReceivesEveryEvent) {
    auto [tx1, rx1] = make_event_channel();
    auto [tx2, rx2] = make_event_channel();
    registry.subscribe(tx1);
    registry.subscribe(tx2);

    registry.publish(PointerMoved{5, 6});
    registry.publish(PointerPressed{});

    for (EventReceiver* rx : {&rx1, &rx2}) {
        EXPECT_EQ(*rx->try_recv(), Event(PointerMoved{5, 6}));
        EXPECT_EQ(*rx->try_recv(), Event(PointerPressed{}));
        EXPECT_FALSE(rx->try_recv().has_value());
    }
}

TEST_F(SubscriberRegistryTest, SubscribingTwiceDeliversTwice) {
    auto [tx, rx] = make_event_channel();
    registry.subscribe(tx);
    registry.subscribe(tx);
    EXPECT_EQ(registry.size(), 2u);

    auto stats = registry.publish(PointerReleased{});

    EXPECT_EQ(stats.delivered, 2u);
    EXPECT_EQ(rx.pending(), 2u);
}

TEST_F(SubscriberRegistryTest, OnlyEventsAfterSubscribeAreSeen) {
    auto [early_tx, early_rx] = make_event_channel();
    registry.subscribe(early_tx);
    registry.publish(PointerMoved{1, 1});

    auto [late_tx, late_rx] = make_event_channel();
    registry.subscribe(late_tx);
    registry.publish(PointerMoved{2, 2});

    EXPECT_EQ(early_rx.pending(), 2u);
    ASSERT_EQ(late_rx.pending(), 1u);
    EXPECT_EQ(*late_rx.try_recv(), Event(PointerMoved{2, 2}));
}

// ─────────────────────────────────────────────────────────────────────────────
// Failed Sends
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(SubscriberRegistryTest, DisconnectedEndpointPrunedOthersStillServed) {
    auto [tx1, rx1] = make_event_channel();
    auto [tx2, rx2] = make_event_channel();
    auto [tx3, rx3] = make_event_channel();
    registry.subscribe(tx1);
    registry.subscribe(tx2);
    registry.subscribe(tx3);

    {
        EventReceiver gone = std::move(rx2);
    }

    auto stats = registry.publish(PointerPressed{});

    EXPECT_EQ(stats.delivered, 2u);
    EXPECT_EQ(stats.pruned, 1u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(rx1.pending(), 1u);
    EXPECT_EQ(rx3.pending(), 1u);

    // The pruned endpoint is not visited again
    stats = registry.publish(PointerReleased{});
    EXPECT_EQ(stats.pruned, 0u);
    EXPECT_EQ(stats.delivered, 2u);
}

TEST_F(SubscriberRegistryTest, FullEndpointDropsEventButStaysSubscribed) {
    auto [bounded_tx, bounded_rx] = make_event_channel(1);
    auto [open_tx, open_rx] = make_event_channel();
    registry.subscribe(bounded_tx);
    registry.subscribe(open_tx);

    registry.publish(PointerMoved{1, 1});
    auto stats = registry.publish(PointerMoved{2, 2});

    EXPECT_EQ(stats.delivered, 1u);
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(bounded_rx.pending(), 1u);
    EXPECT_EQ(open_rx.pending(), 2u);

    bounded_rx.try_recv();
    stats = registry.publish(PointerMoved{3, 3});
    EXPECT_EQ(stats.delivered, 2u);
}

// ─────────────────────────────────────────────────────────────────────────────
// Concurrency
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(SubscriberRegistryTest, ConcurrentSubscribeDuringPublish) {
    constexpr int kSubscribers = 16;
    constexpr int kEvents = 500;

    std::vector<EventReceiver> receivers;
    std::vector<EventSender> senders;
    for (int i = 0; i < kSubscribers; ++i) {
        auto [tx, rx] = make_event_channel();
        senders.push_back(std::move(tx));
        receivers.push_back(std::move(rx));
    }

    std::atomic<bool> done{false};
    std::thread publisher([&] {
        for (int i = 0; i < kEvents; ++i) {
            registry.publish(PointerMoved{i, i});
        }
        done = true;
    });

    for (auto& sender : senders) {
        registry.subscribe(sender);
    }
    publisher.join();

    EXPECT_TRUE(done);
    EXPECT_EQ(registry.size(), static_cast<size_t>(kSubscribers));

    // Each receiver sees a contiguous, in-order suffix of the published events
    for (auto& rx : receivers) {
        int previous = -1;
        while (auto event = rx.try_recv()) {
            const auto& moved = std::get<PointerMoved>(*event);
            if (previous >= 0) {
                EXPECT_EQ(moved.x, previous + 1);
            }
            previous = moved.x;
        }
        if (previous >= 0) {
            EXPECT_EQ(previous, kEvents - 1);
        }
    }
}

/**
 * @file subscriber_registry.h
 * @brief Locked fan-out of portable events to subscribed channels.
 *
 * Thread-safety: subscribe() may be called from any thread; publish() is
 * called from the poll thread inside the input callback. Both take the
 * same mutex, so every event published after subscribe() returns reaches
 * the new endpoint.
 */

#pragma once

#include "droidglue/channel.h"
#include "droidglue/events.h"

#include <cstddef>
#include <mutex>
#include <vector>

namespace droidglue {

/**
 * @brief Per-publish delivery counts.
 */
struct PublishStats {
    size_t delivered = 0;   ///< Endpoints that queued the event
    size_t dropped = 0;     ///< Endpoints whose bounded channel was full
    size_t pruned = 0;      ///< Disconnected endpoints removed by this publish
};

/**
 * @brief Ordered collection of event endpoints.
 *
 * Endpoints are kept in insertion order with no deduplication; an endpoint
 * subscribed twice receives each event twice. An endpoint whose receiver
 * has gone away is removed by the first publish that fails to reach it,
 * without affecting delivery to the endpoints after it.
 */
class SubscriberRegistry {
public:
    SubscriberRegistry() = default;

    // Non-copyable, non-movable (its address is handed to the host)
    SubscriberRegistry(const SubscriberRegistry&) = delete;
    SubscriberRegistry& operator=(const SubscriberRegistry&) = delete;
    SubscriberRegistry(SubscriberRegistry&&) = delete;
    SubscriberRegistry& operator=(SubscriberRegistry&&) = delete;

    /**
     * @brief Append an endpoint.
     */
    void subscribe(EventSender endpoint);

    /**
     * @brief Send an event to every endpoint, in registration order.
     */
    PublishStats publish(const Event& event);

    /**
     * @brief Number of endpoints currently registered.
     */
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<EventSender> endpoints_;
};

} // namespace droidglue

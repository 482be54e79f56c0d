/**
 * @file channel.h
 * @brief One-producer event channel connecting the poll thread to a subscriber.
 *
 * A channel has any number of EventSender copies (the registry holds one)
 * and exactly one EventReceiver. Dropping the receiver disconnects every
 * sender; the registry notices on its next publish and prunes the sender.
 *
 * Example:
 * @code
 *   auto [tx, rx] = droidglue::make_event_channel();
 *   droidglue::subscribe(std::move(tx));
 *
 *   while (auto event = rx.recv()) {
 *       if (auto* moved = std::get_if<events::PointerMoved>(&*event)) { ... }
 *   }
 * @endcode
 */

#pragma once

#include "droidglue/events.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace droidglue {

namespace detail {
struct ChannelState;
} // namespace detail

class EventSender;
class EventReceiver;

/**
 * @brief Create a connected sender/receiver pair.
 * @param capacity Maximum queued events, 0 for unbounded
 */
[[nodiscard]] std::pair<EventSender, EventReceiver> make_event_channel(size_t capacity = 0);

/**
 * @brief Outcome of EventSender::send().
 */
enum class SendStatus : uint8_t {
    Sent = 0,       ///< Event queued for the receiver
    Full,           ///< Bounded channel at capacity; event dropped
    Disconnected    ///< Receiver is gone; event dropped
};

[[nodiscard]] constexpr const char* toString(SendStatus status) noexcept {
    switch (status) {
        case SendStatus::Sent:         return "Sent";
        case SendStatus::Full:         return "Full";
        case SendStatus::Disconnected: return "Disconnected";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// EventSender
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Producing side of a channel. Copyable; every copy feeds the same receiver.
 */
class EventSender {
public:
    EventSender() = default;
    ~EventSender();

    EventSender(const EventSender& other);
    EventSender& operator=(const EventSender& other);
    EventSender(EventSender&& other) noexcept;
    EventSender& operator=(EventSender&& other) noexcept;

    /**
     * @brief Queue an event for the receiver. Never blocks.
     */
    SendStatus send(const Event& event) noexcept;

    /**
     * @brief Check whether the receiver is still alive.
     */
    [[nodiscard]] bool connected() const noexcept;

private:
    friend std::pair<EventSender, EventReceiver> make_event_channel(size_t capacity);

    explicit EventSender(std::shared_ptr<detail::ChannelState> state);
    void release() noexcept;

    std::shared_ptr<detail::ChannelState> state_;
};

// ─────────────────────────────────────────────────────────────────────────────
// EventReceiver
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Consuming side of a channel. Move-only.
 *
 * Destroying the receiver disconnects the channel and discards any
 * queued events.
 */
class EventReceiver {
public:
    EventReceiver() = default;
    ~EventReceiver();

    EventReceiver(const EventReceiver&) = delete;
    EventReceiver& operator=(const EventReceiver&) = delete;
    EventReceiver(EventReceiver&& other) noexcept;
    EventReceiver& operator=(EventReceiver&& other) noexcept;

    /**
     * @brief Block until an event arrives.
     * @return The event, or nullopt once every sender is gone and the queue is empty
     */
    std::optional<Event> recv();

    /**
     * @brief Take the next event if one is queued.
     */
    std::optional<Event> try_recv();

    /**
     * @brief Wait up to timeout for an event.
     */
    std::optional<Event> recv_for(std::chrono::milliseconds timeout);

    /**
     * @brief Number of queued events.
     */
    [[nodiscard]] size_t pending() const;

    /**
     * @brief Check if this receiver owns a channel.
     */
    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

private:
    friend std::pair<EventSender, EventReceiver> make_event_channel(size_t capacity);

    explicit EventReceiver(std::shared_ptr<detail::ChannelState> state);
    void disconnect() noexcept;

    std::shared_ptr<detail::ChannelState> state_;
};

} // namespace droidglue

/**
 * @file events.h
 * @brief Portable pointer events delivered to subscribers.
 *
 * Events are plain copyable values. They are produced only by the input
 * translator on the poll thread and fanned out to every subscribed
 * channel.
 */

#pragma once

#include <cstdint>
#include <type_traits>
#include <variant>

namespace droidglue {

namespace events {

/**
 * @brief The primary pointer was lifted (or the gesture was cancelled).
 */
struct PointerReleased {
    [[nodiscard]] bool operator==(const PointerReleased&) const noexcept = default;
};

/**
 * @brief The primary pointer touched down.
 *
 * Always preceded by a PointerMoved carrying the touch position.
 */
struct PointerPressed {
    [[nodiscard]] bool operator==(const PointerPressed&) const noexcept = default;
};

/**
 * @brief The primary pointer is at (x, y), in device pixels.
 */
struct PointerMoved {
    int32_t x = 0;
    int32_t y = 0;

    [[nodiscard]] bool operator==(const PointerMoved&) const noexcept = default;
};

/**
 * @brief Event type discriminator.
 */
enum class EventType : uint8_t {
    PointerReleased = 0,
    PointerPressed,
    PointerMoved
};

} // namespace events

/**
 * @brief A portable event: one of the pointer event structs.
 */
using Event = std::variant<
    events::PointerReleased,
    events::PointerPressed,
    events::PointerMoved
>;

static_assert(std::is_trivially_copyable_v<Event>, "Event must stay a plain value");

/**
 * @brief Get the event type from an Event.
 */
[[nodiscard]] inline events::EventType get_event_type(const Event& event) noexcept {
    return std::visit([](auto&& e) -> events::EventType {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, events::PointerReleased>) {
            return events::EventType::PointerReleased;
        } else if constexpr (std::is_same_v<T, events::PointerPressed>) {
            return events::EventType::PointerPressed;
        } else {
            return events::EventType::PointerMoved;
        }
    }, event);
}

/**
 * @brief Convert EventType to string for debugging.
 */
[[nodiscard]] constexpr const char* toString(events::EventType type) noexcept {
    switch (type) {
        case events::EventType::PointerReleased: return "PointerReleased";
        case events::EventType::PointerPressed:  return "PointerPressed";
        case events::EventType::PointerMoved:    return "PointerMoved";
    }
    return "Unknown";
}

} // namespace droidglue

/**
 * @file input_translator.cpp
 * @brief Input event translation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/input_translator.h"
#include "droidglue/logging.h"

namespace droidglue {

namespace {

constexpr size_t PRIMARY_POINTER = 0;

// Fractional coordinates truncate toward zero
events::PointerMoved sample_primary(const host::IMotionEvent& event) {
    return events::PointerMoved{
        static_cast<int32_t>(event.x(PRIMARY_POINTER)),
        static_cast<int32_t>(event.y(PRIMARY_POINTER))
    };
}

} // anonymous namespace

PointerAction classify_action(int32_t action) noexcept {
    switch (action & host::motion::ActionMask) {
        case host::motion::ActionUp:
        case host::motion::ActionOutside:
        case host::motion::ActionCancel:
        case host::motion::ActionPointerUp:
            return PointerAction::Release;

        case host::motion::ActionDown:
        case host::motion::ActionPointerDown:
            return PointerAction::Press;

        default:
            return PointerAction::Motion;
    }
}

int32_t translate_input(const host::IMotionEvent& event, SubscriberRegistry& registry) {
    switch (classify_action(event.action())) {
        case PointerAction::Release:
            registry.publish(events::PointerReleased{});
            break;

        case PointerAction::Press: {
            // Position first, so consumers always know where the press landed
            const events::PointerMoved position = sample_primary(event);
            LOG_TRACE("input", "press at %d,%d", position.x, position.y);
            registry.publish(position);
            registry.publish(events::PointerPressed{});
            break;
        }

        case PointerAction::Motion:
            registry.publish(sample_primary(event));
            break;
    }
    return 0;
}

} // namespace droidglue

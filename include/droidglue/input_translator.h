/**
 * @file input_translator.h
 * @brief Native pointer events to portable events.
 */

#pragma once

#include "droidglue/host/host.h"
#include "droidglue/subscriber_registry.h"

#include <cstdint>

namespace droidglue {

/**
 * @brief Classification of a masked motion action code.
 */
enum class PointerAction : uint8_t {
    Release = 0,    ///< UP, OUTSIDE, CANCEL, POINTER_UP
    Press,          ///< DOWN, POINTER_DOWN
    Motion          ///< everything else (MOVE, HOVER_*, SCROLL, unknown)
};

/**
 * @brief Classify a raw action word.
 *
 * The pointer-index bits are masked off before matching.
 */
[[nodiscard]] PointerAction classify_action(int32_t action) noexcept;

/**
 * @brief Publish the portable events for one native pointer event.
 *
 * - Release: PointerReleased (coordinates are not read)
 * - Press:   PointerMoved(x, y), then PointerPressed
 * - Motion:  PointerMoved(x, y)
 *
 * Only pointer index 0 is sampled.
 *
 * @return Always 0: the host may continue its default handling
 */
int32_t translate_input(const host::IMotionEvent& event, SubscriberRegistry& registry);

} // namespace droidglue

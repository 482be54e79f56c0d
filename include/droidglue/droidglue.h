/**
 * @file droidglue.h
 * @brief Umbrella header for the droidglue public API.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "droidglue/assets.h"
#include "droidglue/bridge.h"
#include "droidglue/channel.h"
#include "droidglue/config.h"
#include "droidglue/error.h"
#include "droidglue/events.h"
#include "droidglue/logging.h"
#include "droidglue/window.h"

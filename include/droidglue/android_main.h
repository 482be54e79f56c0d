/**
 * @file android_main.h
 * @brief Process entry point for NativeActivity applications.
 *
 * Usage, in exactly one translation unit of the application:
 * @code
 *   #include <droidglue/android_main.h>
 *
 *   static void app_main() {
 *       auto events = droidglue::subscribe_channel();
 *       auto* window = droidglue::get_native_window();
 *       // ...
 *   }
 *
 *   DROIDGLUE_MAIN(app_main)
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "droidglue/bridge.h"
#include "droidglue/host/android_host.h"

#define DROIDGLUE_MAIN(fn)                                        \
    extern "C" void android_main(struct android_app* app) {       \
        ::droidglue::host::AndroidHost host(app);                 \
        ::droidglue::run_app(host, ::droidglue::UserEntry(fn));   \
    }

/**
 * @file exceptions.cpp
 * @brief Process abort used by DROIDGLUE_FATAL outside library mode.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/exceptions.h"
#include "droidglue/logging.h"

#include <cstdlib>

namespace droidglue {
namespace detail {

void fatal_abort(const std::string& msg, const char* file, int line) noexcept {
    log_printf(LogLevel::Error, "fatal", "%s at %s:%d", msg.c_str(), file, line);
    std::abort();
}

} // namespace detail
} // namespace droidglue

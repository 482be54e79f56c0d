/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * IMPORTANT: gsl-lite is a PRIVATE dependency of the droidglue library.
 *            Include this header from .cpp files only; public headers
 *            must not expose gsl-lite types.
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *   - Contract macros: gsl_Expects / gsl_Ensures
 *
 * Usage:
 * @code
 *   #include <droidglue/gsl.hpp>
 *
 *   auto closer = droidglue::gsl::finally([&] { host.closeAsset(asset); });
 *   gsl_Expects(sink != nullptr);
 * @endcode
 *
 * Contract violation behavior is set by the build:
 *   DROIDGLUE_LIBRARY_MODE=1  =>  gsl_CONFIG_CONTRACT_VIOLATION_THROWS=1
 *   otherwise                 =>  gsl_CONFIG_CONTRACT_VIOLATION_TERMINATES=1
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace droidglue {

/**
 * @brief Scoped alias for gsl-lite v1 namespace.
 */
namespace gsl = ::gsl_lite;

} // namespace droidglue

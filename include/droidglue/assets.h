/**
 * @file assets.h
 * @brief Read-only access to assets bundled with the application.
 */

#pragma once

#include "droidglue/error.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace droidglue {

/**
 * @brief Read a bundled asset fully into memory.
 *
 * The native asset handle is closed exactly once on every path; the
 * returned bytes are an independent copy.
 *
 * @param name Asset path relative to the asset root (e.g. "shaders/quad.vert")
 * @return The asset's bytes, AssetMissing if no such asset exists, or
 *         EmptyBuffer if the asset opened but its contents are unavailable
 */
[[nodiscard]] Result<std::vector<std::uint8_t>> load_asset(std::string_view name);

/**
 * @brief load_asset() returning the contents as a string.
 */
[[nodiscard]] Result<std::string> load_asset_text(std::string_view name);

} // namespace droidglue

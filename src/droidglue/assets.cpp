/**
 * @file assets.cpp
 * @brief Bundled asset loader.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/assets.h"
#include "droidglue/bridge_state.h"
#include "droidglue/gsl.hpp"
#include "droidglue/logging.h"

namespace droidglue {

Result<std::vector<std::uint8_t>> load_asset(std::string_view name) {
    host::IHost& host = bridge_state::require("load_asset");

    const std::string asset_name(name);
    host::NativeAsset* asset = host.openAsset(asset_name.c_str(), host::AssetMode::Streaming);
    if (asset == nullptr) {
        return make_error(ErrorCode::AssetMissing, "asset not found: " + asset_name);
    }
    auto closer = gsl::finally([&host, asset] { host.closeAsset(asset); });

    const int64_t length = host.assetLength(asset);
    const void* buffer = host.assetBuffer(asset);
    if (buffer == nullptr) {
        LOG_WARN("asset", "%s opened but has no buffer", asset_name.c_str());
        return make_error(ErrorCode::EmptyBuffer, "asset has no readable buffer: " + asset_name);
    }
    if (length < 0) {
        return make_error(ErrorCode::EmptyBuffer, "asset reported a negative length: " + asset_name);
    }

    const auto* bytes = static_cast<const std::uint8_t*>(buffer);
    return Ok(std::vector<std::uint8_t>(bytes, bytes + static_cast<size_t>(length)));
}

Result<std::string> load_asset_text(std::string_view name) {
    return load_asset(name).transform([](std::vector<std::uint8_t> bytes) {
        return std::string(bytes.begin(), bytes.end());
    });
}

} // namespace droidglue

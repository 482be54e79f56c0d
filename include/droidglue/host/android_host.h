// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 droidglue Contributors
//
// Host Layer - Android NativeActivity Implementation

#pragma once

#include "droidglue/host/host.h"

#include <atomic>

struct android_app;
struct AInputEvent;

namespace droidglue::host {

/// Host backed by android_native_app_glue
///
/// Takes over android_app::userData, onAppCmd and onInputEvent for its
/// lifetime; the bridge's own user data lives in a separate slot.
class AndroidHost : public IHost {
public:
    explicit AndroidHost(android_app* app);
    ~AndroidHost() override;

    AndroidHost(const AndroidHost&) = delete;
    AndroidHost& operator=(const AndroidHost&) = delete;

    void setUserData(void* data) override;
    void* userData() const override;
    void setCallbacks(CommandCallback on_command, InputCallback on_input) override;

    PollStatus pollOnce(int timeout_ms) override;
    bool isDestroyRequested() const override;

    NativeWindow* nativeWindow() const override;

    NativeAsset* openAsset(const char* name, AssetMode mode) override;
    int64_t assetLength(NativeAsset* asset) override;
    const void* assetBuffer(NativeAsset* asset) override;
    void closeAsset(NativeAsset* asset) override;

    void writeLog(LogPriority priority, const char* tag, const char* message) override;

    /// The wrapped glue object
    android_app* app() const { return app_; }

private:
    static void handleCommand(android_app* app, int32_t command);
    static int32_t handleInput(android_app* app, AInputEvent* event);

    android_app* app_;
    std::atomic<void*> user_data_{nullptr};
    std::atomic<CommandCallback> on_command_{nullptr};
    std::atomic<InputCallback> on_input_{nullptr};
};

} // namespace droidglue::host

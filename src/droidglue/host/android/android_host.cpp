// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 droidglue Contributors
//
// Host Layer - Android NativeActivity Implementation

#include "droidglue/host/android_host.h"

#include <android/asset_manager.h>
#include <android/input.h>
#include <android/log.h>
#include <android/looper.h>
#include <android_native_app_glue.h>

#include <pthread.h>

namespace droidglue::host {

static_assert(static_cast<int32_t>(AppCommand::InitWindow) == APP_CMD_INIT_WINDOW);
static_assert(static_cast<int32_t>(AppCommand::TermWindow) == APP_CMD_TERM_WINDOW);
static_assert(static_cast<int32_t>(AppCommand::GainedFocus) == APP_CMD_GAINED_FOCUS);
static_assert(static_cast<int32_t>(AppCommand::LostFocus) == APP_CMD_LOST_FOCUS);
static_assert(static_cast<int32_t>(AppCommand::SaveState) == APP_CMD_SAVE_STATE);
static_assert(static_cast<int32_t>(AppCommand::Destroy) == APP_CMD_DESTROY);

static_assert(motion::ActionMask == AMOTION_EVENT_ACTION_MASK);
static_assert(motion::ActionDown == AMOTION_EVENT_ACTION_DOWN);
static_assert(motion::ActionUp == AMOTION_EVENT_ACTION_UP);
static_assert(motion::ActionMove == AMOTION_EVENT_ACTION_MOVE);
static_assert(motion::ActionCancel == AMOTION_EVENT_ACTION_CANCEL);
static_assert(motion::ActionOutside == AMOTION_EVENT_ACTION_OUTSIDE);
static_assert(motion::ActionPointerDown == AMOTION_EVENT_ACTION_POINTER_DOWN);
static_assert(motion::ActionPointerUp == AMOTION_EVENT_ACTION_POINTER_UP);
static_assert(motion::ActionHoverMove == AMOTION_EVENT_ACTION_HOVER_MOVE);
static_assert(motion::ActionScroll == AMOTION_EVENT_ACTION_SCROLL);
static_assert(motion::ActionHoverEnter == AMOTION_EVENT_ACTION_HOVER_ENTER);
static_assert(motion::ActionHoverExit == AMOTION_EVENT_ACTION_HOVER_EXIT);

static_assert(static_cast<int>(LogPriority::Verbose) == ANDROID_LOG_VERBOSE);
static_assert(static_cast<int>(LogPriority::Fatal) == ANDROID_LOG_FATAL);
static_assert(static_cast<int>(AssetMode::Streaming) == AASSET_MODE_STREAMING);
static_assert(static_cast<int>(AssetMode::Buffer) == AASSET_MODE_BUFFER);

namespace {

/// AInputEvent view, valid for one onInputEvent call
class AndroidMotionEvent : public IMotionEvent {
public:
    explicit AndroidMotionEvent(const AInputEvent* event)
        : event_(event) {}

    int32_t action() const override {
        return AMotionEvent_getAction(event_);
    }

    float x(size_t pointer_index) const override {
        return AMotionEvent_getX(event_, pointer_index);
    }

    float y(size_t pointer_index) const override {
        return AMotionEvent_getY(event_, pointer_index);
    }

private:
    const AInputEvent* event_;
};

AAsset* toNative(NativeAsset* asset) {
    return reinterpret_cast<AAsset*>(asset);
}

} // anonymous namespace

AndroidHost::AndroidHost(android_app* app)
    : app_(app) {
    app_->userData = this;
    app_->onAppCmd = &AndroidHost::handleCommand;
    app_->onInputEvent = &AndroidHost::handleInput;
}

AndroidHost::~AndroidHost() {
    app_->onAppCmd = nullptr;
    app_->onInputEvent = nullptr;
    app_->userData = nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════
// User Data and Callbacks
// ═══════════════════════════════════════════════════════════════════════════

void AndroidHost::setUserData(void* data) {
    user_data_.store(data, std::memory_order_release);
}

void* AndroidHost::userData() const {
    return user_data_.load(std::memory_order_acquire);
}

void AndroidHost::setCallbacks(CommandCallback on_command, InputCallback on_input) {
    on_command_.store(on_command, std::memory_order_release);
    on_input_.store(on_input, std::memory_order_release);
}

void AndroidHost::handleCommand(android_app* app, int32_t command) {
    auto* host = static_cast<AndroidHost*>(app->userData);
    if (host == nullptr) {
        return;
    }
    if (CommandCallback callback = host->on_command_.load(std::memory_order_acquire)) {
        callback(*host, command);
    }
}

int32_t AndroidHost::handleInput(android_app* app, AInputEvent* event) {
    auto* host = static_cast<AndroidHost*>(app->userData);
    if (host == nullptr || AInputEvent_getType(event) != AINPUT_EVENT_TYPE_MOTION) {
        return 0;
    }
    if (InputCallback callback = host->on_input_.load(std::memory_order_acquire)) {
        return callback(*host, AndroidMotionEvent(event));
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Event Loop
// ═══════════════════════════════════════════════════════════════════════════

PollStatus AndroidHost::pollOnce(int timeout_ms) {
    int events = 0;
    android_poll_source* source = nullptr;
    const int ident = ALooper_pollOnce(timeout_ms, nullptr, &events,
                                       reinterpret_cast<void**>(&source));
    if (ident >= 0) {
        if (source != nullptr) {
            source->process(app_, source);
        }
        return PollStatus::Processed;
    }

    switch (ident) {
        case ALOOPER_POLL_WAKE:
        case ALOOPER_POLL_CALLBACK:
            return PollStatus::Wake;
        case ALOOPER_POLL_TIMEOUT:
            return PollStatus::Timeout;
        default:
            return PollStatus::Error;
    }
}

bool AndroidHost::isDestroyRequested() const {
    return app_->destroyRequested != 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Window
// ═══════════════════════════════════════════════════════════════════════════

NativeWindow* AndroidHost::nativeWindow() const {
    // The glue assigns app->window under app->mutex on the poll thread, in
    // android_app_pre_exec_cmd, before onAppCmd fires the WindowSignal for
    // InitWindow; TermWindow clears it the same way after the callback.
    pthread_mutex_lock(&app_->mutex);
    ANativeWindow* window = app_->window;
    pthread_mutex_unlock(&app_->mutex);
    return reinterpret_cast<NativeWindow*>(window);
}

// ═══════════════════════════════════════════════════════════════════════════
// Assets
// ═══════════════════════════════════════════════════════════════════════════

NativeAsset* AndroidHost::openAsset(const char* name, AssetMode mode) {
    AAssetManager* manager = app_->activity->assetManager;
    return reinterpret_cast<NativeAsset*>(
        AAssetManager_open(manager, name, static_cast<int>(mode)));
}

int64_t AndroidHost::assetLength(NativeAsset* asset) {
    return AAsset_getLength64(toNative(asset));
}

const void* AndroidHost::assetBuffer(NativeAsset* asset) {
    return AAsset_getBuffer(toNative(asset));
}

void AndroidHost::closeAsset(NativeAsset* asset) {
    AAsset_close(toNative(asset));
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

void AndroidHost::writeLog(LogPriority priority, const char* tag, const char* message) {
    __android_log_write(static_cast<int>(priority), tag, message);
}

} // namespace droidglue::host

// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 droidglue Contributors
//
// Host Layer - Common Types

#pragma once

#include <cstdint>

namespace droidglue::host {

/// Opaque native window (ANativeWindow on Android)
struct NativeWindow;

/// Opaque native asset stream (AAsset on Android)
struct NativeAsset;

/// Outcome of one IHost::pollOnce() call
enum class PollStatus {
    Processed = 0,   // A source was ready and its processing routine ran
    Wake,            // The looper was woken without a source
    Timeout,         // Timeout expired with nothing ready
    Error            // The native wait primitive reported an error
};

/// Platform log priorities (values match android_LogPriority)
enum class LogPriority : int {
    Verbose = 2,
    Debug   = 3,
    Info    = 4,
    Warn    = 5,
    Error   = 6,
    Fatal   = 7
};

/// Asset open modes (values match AASSET_MODE_*)
enum class AssetMode : int {
    Unknown   = 0,
    Random    = 1,
    Streaming = 2,
    Buffer    = 3
};

/// Lifecycle commands delivered by the host (values match APP_CMD_*)
enum class AppCommand : int32_t {
    InputChanged       = 0,
    InitWindow         = 1,
    TermWindow         = 2,
    WindowResized      = 3,
    WindowRedrawNeeded = 4,
    ContentRectChanged = 5,
    GainedFocus        = 6,
    LostFocus          = 7,
    ConfigChanged      = 8,
    LowMemory          = 9,
    Start              = 10,
    Resume             = 11,
    SaveState          = 12,
    Pause              = 13,
    Stop               = 14,
    Destroy            = 15
};

/// Motion action codes (values match AMOTION_EVENT_ACTION_*)
namespace motion {
    constexpr int32_t ActionMask        = 0xff;
    constexpr int32_t ActionPointerIndexMask  = 0xff00;
    constexpr int32_t ActionPointerIndexShift = 8;

    constexpr int32_t ActionDown        = 0;
    constexpr int32_t ActionUp          = 1;
    constexpr int32_t ActionMove        = 2;
    constexpr int32_t ActionCancel      = 3;
    constexpr int32_t ActionOutside     = 4;
    constexpr int32_t ActionPointerDown = 5;
    constexpr int32_t ActionPointerUp   = 6;
    constexpr int32_t ActionHoverMove   = 7;
    constexpr int32_t ActionScroll      = 8;
    constexpr int32_t ActionHoverEnter  = 9;
    constexpr int32_t ActionHoverExit   = 10;
} // namespace motion

/// Convert PollStatus to string for debugging
constexpr const char* toString(PollStatus status) noexcept {
    switch (status) {
        case PollStatus::Processed: return "Processed";
        case PollStatus::Wake:      return "Wake";
        case PollStatus::Timeout:   return "Timeout";
        case PollStatus::Error:     return "Error";
    }
    return "Unknown";
}

/// Convert AppCommand to string for debugging
constexpr const char* toString(AppCommand cmd) noexcept {
    switch (cmd) {
        case AppCommand::InputChanged:       return "InputChanged";
        case AppCommand::InitWindow:         return "InitWindow";
        case AppCommand::TermWindow:         return "TermWindow";
        case AppCommand::WindowResized:      return "WindowResized";
        case AppCommand::WindowRedrawNeeded: return "WindowRedrawNeeded";
        case AppCommand::ContentRectChanged: return "ContentRectChanged";
        case AppCommand::GainedFocus:        return "GainedFocus";
        case AppCommand::LostFocus:          return "LostFocus";
        case AppCommand::ConfigChanged:      return "ConfigChanged";
        case AppCommand::LowMemory:          return "LowMemory";
        case AppCommand::Start:              return "Start";
        case AppCommand::Resume:             return "Resume";
        case AppCommand::SaveState:          return "SaveState";
        case AppCommand::Pause:              return "Pause";
        case AppCommand::Stop:               return "Stop";
        case AppCommand::Destroy:            return "Destroy";
    }
    return "Unknown";
}

} // namespace droidglue::host

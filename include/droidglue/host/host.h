// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 droidglue Contributors
//
// Host Layer - Native Application Interface

#pragma once

#include "droidglue/host/types.h"
#include <cstddef>
#include <cstdint>

namespace droidglue::host {

class IHost;

/// One native pointer event, valid only for the duration of the input callback
class IMotionEvent {
public:
    virtual ~IMotionEvent() = default;

    /// Raw action word (action code in the low byte, pointer index above it)
    virtual int32_t action() const = 0;

    /// Pointer coordinates in device pixels
    virtual float x(size_t pointer_index) const = 0;
    virtual float y(size_t pointer_index) const = 0;
};

/// Lifecycle command callback, invoked on the poll thread
using CommandCallback = void (*)(IHost& host, int32_t command);

/// Input callback, invoked on the poll thread.
/// Returns 1 if the event was consumed, 0 to let the host continue default handling.
using InputCallback = int32_t (*)(IHost& host, const IMotionEvent& event);

/// Native application handle
///
/// Wraps the host-owned application object (android_app on Android).
/// The host owns its lifetime; exactly one exists per process.
///
/// Threading: pollOnce() and the callbacks it runs belong to the thread the
/// host handed control to. nativeWindow(), the asset primitives and
/// writeLog() may be called from any thread.
class IHost {
public:
    virtual ~IHost() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // User Data and Callbacks
    // ═══════════════════════════════════════════════════════════════════════

    /// Store one opaque pointer in the host's user-data slot
    virtual void setUserData(void* data) = 0;

    /// Get the user-data slot
    virtual void* userData() const = 0;

    /// Install the command and input callbacks (nullptr detaches)
    virtual void setCallbacks(CommandCallback on_command, InputCallback on_input) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Event Loop
    // ═══════════════════════════════════════════════════════════════════════

    /// Wait for the next event source and run its processing routine
    /// @param timeout_ms Milliseconds to wait, -1 blocks indefinitely
    /// @return Processed, Wake, Timeout, or Error
    virtual PollStatus pollOnce(int timeout_ms) = 0;

    /// Check whether the host has asked the application to finish
    virtual bool isDestroyRequested() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Window
    // ═══════════════════════════════════════════════════════════════════════

    /// Current native window, nullptr until the host creates a surface
    virtual NativeWindow* nativeWindow() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Assets
    // ═══════════════════════════════════════════════════════════════════════

    /// Open a bundled asset by name
    /// @return Asset handle, or nullptr if no such asset exists
    virtual NativeAsset* openAsset(const char* name, AssetMode mode) = 0;

    /// Declared length of an open asset in bytes
    virtual int64_t assetLength(NativeAsset* asset) = 0;

    /// Pointer to the asset's buffered contents, nullptr if unavailable
    virtual const void* assetBuffer(NativeAsset* asset) = 0;

    /// Release an asset handle (must be called exactly once per open)
    virtual void closeAsset(NativeAsset* asset) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Logging
    // ═══════════════════════════════════════════════════════════════════════

    /// Write one null-terminated line to the platform log
    virtual void writeLog(LogPriority priority, const char* tag, const char* message) = 0;
};

} // namespace droidglue::host

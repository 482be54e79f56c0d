// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 droidglue Contributors
//
// Host Layer - Headless Implementation

#pragma once

#include "droidglue/host/host.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace droidglue::host {

/// Recorded pointer event replayed by HeadlessHost
///
/// Counts coordinate reads so tests can check which actions sample the pointer.
class RecordedMotion : public IMotionEvent {
public:
    RecordedMotion(int32_t action, float x, float y)
        : action_(action), x_(x), y_(y) {}

    int32_t action() const override { return action_; }

    float x(size_t pointer_index) const override {
        coordinate_reads_.fetch_add(1, std::memory_order_relaxed);
        last_pointer_index_.store(pointer_index, std::memory_order_relaxed);
        return x_;
    }

    float y(size_t pointer_index) const override {
        coordinate_reads_.fetch_add(1, std::memory_order_relaxed);
        last_pointer_index_.store(pointer_index, std::memory_order_relaxed);
        return y_;
    }

    /// Number of x()/y() calls so far
    uint32_t coordinateReads() const { return coordinate_reads_.load(); }

    /// Pointer index passed to the most recent x()/y() call
    size_t lastPointerIndex() const { return last_pointer_index_.load(); }

private:
    int32_t action_;
    float x_;
    float y_;
    mutable std::atomic<uint32_t> coordinate_reads_{0};
    mutable std::atomic<size_t> last_pointer_index_{0};
};

/// One line captured by HeadlessHost::writeLog()
struct LogRecord {
    LogPriority priority;
    std::string tag;
    std::string message;
};

/// Headless host - scripted event sources for testing without a device
///
/// Tests post commands, pointer events and destroy requests from any thread;
/// pollOnce() replays them one at a time on the polling thread, in order.
class HeadlessHost : public IHost {
public:
    HeadlessHost() = default;
    ~HeadlessHost() override;

    HeadlessHost(const HeadlessHost&) = delete;
    HeadlessHost& operator=(const HeadlessHost&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // IHost
    // ═══════════════════════════════════════════════════════════════════════

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

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Event Sources
    // ═══════════════════════════════════════════════════════════════════════

    /// Queue a lifecycle command
    void postCommand(AppCommand command);

    /// Queue InitWindow; the window becomes visible just before the callback runs
    void postInitWindow(NativeWindow* window);

    /// Queue TermWindow; the window is cleared right after the callback runs
    void postTermWindow();

    /// Queue a recorded pointer event
    void postMotion(std::shared_ptr<RecordedMotion> motion);

    /// Queue a pointer event, returning the record for later inspection
    std::shared_ptr<RecordedMotion> postMotion(int32_t action, float x, float y);

    /// Queue the destroy request; isDestroyRequested() turns true when it is processed
    void requestDestroy();

    /// Make the next pollOnce() return Wake
    void wake();

    /// Make the next pollOnce() return Error
    void injectPollError();

    /// Set the window immediately, without a command
    void setWindow(NativeWindow* window);

    /// Number of queued sources not yet processed
    size_t pendingSources() const;

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Assets
    // ═══════════════════════════════════════════════════════════════════════

    /// Register an asset with the given contents
    void addAsset(const std::string& name, std::vector<uint8_t> bytes);

    /// Register an asset that opens but has no readable buffer
    void addUnbufferedAsset(const std::string& name);

    /// Register an asset whose length reads as negative
    void addBrokenLengthAsset(const std::string& name, std::vector<uint8_t> bytes);

    uint32_t openCount() const;
    uint32_t closeCount() const;
    size_t liveAssetCount() const;

    /// closeAsset() calls with a handle that is not open
    uint32_t invalidCloseCount() const;

    /// Mode passed to the most recent openAsset()
    AssetMode lastOpenMode() const;

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Log Capture
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<LogRecord> logs() const;
    void clearLogs();

    /// True if any captured line has this tag and contains text
    bool hasLog(const std::string& tag, const std::string& text) const;

private:
    enum class SourceKind {
        Command,
        InitWindow,
        TermWindow,
        Motion,
        Destroy,
        Wake,
        Error
    };

    struct Source {
        SourceKind kind = SourceKind::Wake;
        AppCommand command = AppCommand::InputChanged;
        NativeWindow* window = nullptr;
        std::shared_ptr<RecordedMotion> motion;
    };

    struct AssetData {
        std::vector<uint8_t> bytes;
        bool buffered = true;
        bool broken_length = false;
    };

    struct OpenAsset {
        const AssetData* data;
    };

    void post(Source source);
    void runCommand(AppCommand command);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Source> sources_;

    std::atomic<void*> user_data_{nullptr};
    std::atomic<CommandCallback> on_command_{nullptr};
    std::atomic<InputCallback> on_input_{nullptr};
    std::atomic<NativeWindow*> window_{nullptr};
    std::atomic<bool> destroy_requested_{false};

    mutable std::mutex asset_mutex_;
    std::map<std::string, AssetData> assets_;
    std::map<NativeAsset*, std::unique_ptr<OpenAsset>> open_assets_;
    uint32_t open_count_ = 0;
    uint32_t close_count_ = 0;
    uint32_t invalid_close_count_ = 0;
    AssetMode last_open_mode_ = AssetMode::Unknown;

    mutable std::mutex log_mutex_;
    std::vector<LogRecord> logs_;
};

} // namespace droidglue::host

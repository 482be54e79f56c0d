// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 droidglue Contributors
//
// Host Layer - Headless Implementation

#include "droidglue/host/headless_host.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace droidglue::host {

HeadlessHost::~HeadlessHost() {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    open_assets_.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// User Data and Callbacks
// ═══════════════════════════════════════════════════════════════════════════

void HeadlessHost::setUserData(void* data) {
    user_data_.store(data, std::memory_order_release);
}

void* HeadlessHost::userData() const {
    return user_data_.load(std::memory_order_acquire);
}

void HeadlessHost::setCallbacks(CommandCallback on_command, InputCallback on_input) {
    on_command_.store(on_command, std::memory_order_release);
    on_input_.store(on_input, std::memory_order_release);
}

// ═══════════════════════════════════════════════════════════════════════════
// Event Loop
// ═══════════════════════════════════════════════════════════════════════════

PollStatus HeadlessHost::pollOnce(int timeout_ms) {
    Source source;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this] { return !sources_.empty(); };

        if (timeout_ms < 0) {
            cv_.wait(lock, ready);
        } else if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready)) {
            return PollStatus::Timeout;
        }

        source = std::move(sources_.front());
        sources_.pop_front();
    }

    // Callbacks run without the queue lock so they may post further sources
    switch (source.kind) {
        case SourceKind::Command:
            runCommand(source.command);
            break;

        case SourceKind::InitWindow:
            window_.store(source.window, std::memory_order_release);
            runCommand(AppCommand::InitWindow);
            break;

        case SourceKind::TermWindow:
            runCommand(AppCommand::TermWindow);
            window_.store(nullptr, std::memory_order_release);
            break;

        case SourceKind::Motion:
            if (InputCallback callback = on_input_.load(std::memory_order_acquire)) {
                callback(*this, *source.motion);
            }
            break;

        case SourceKind::Destroy:
            runCommand(AppCommand::Destroy);
            destroy_requested_.store(true, std::memory_order_release);
            break;

        case SourceKind::Wake:
            return PollStatus::Wake;

        case SourceKind::Error:
            return PollStatus::Error;
    }
    return PollStatus::Processed;
}

bool HeadlessHost::isDestroyRequested() const {
    return destroy_requested_.load(std::memory_order_acquire);
}

void HeadlessHost::runCommand(AppCommand command) {
    if (CommandCallback callback = on_command_.load(std::memory_order_acquire)) {
        callback(*this, static_cast<int32_t>(command));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Window
// ═══════════════════════════════════════════════════════════════════════════

NativeWindow* HeadlessHost::nativeWindow() const {
    return window_.load(std::memory_order_acquire);
}

void HeadlessHost::setWindow(NativeWindow* window) {
    window_.store(window, std::memory_order_release);
}

// ═══════════════════════════════════════════════════════════════════════════
// Test API - Event Sources
// ═══════════════════════════════════════════════════════════════════════════

void HeadlessHost::post(Source source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sources_.push_back(std::move(source));
    }
    cv_.notify_one();
}

void HeadlessHost::postCommand(AppCommand command) {
    Source source;
    source.kind = SourceKind::Command;
    source.command = command;
    post(std::move(source));
}

void HeadlessHost::postInitWindow(NativeWindow* window) {
    Source source;
    source.kind = SourceKind::InitWindow;
    source.window = window;
    post(std::move(source));
}

void HeadlessHost::postTermWindow() {
    Source source;
    source.kind = SourceKind::TermWindow;
    post(std::move(source));
}

void HeadlessHost::postMotion(std::shared_ptr<RecordedMotion> motion) {
    Source source;
    source.kind = SourceKind::Motion;
    source.motion = std::move(motion);
    post(std::move(source));
}

std::shared_ptr<RecordedMotion> HeadlessHost::postMotion(int32_t action, float x, float y) {
    auto motion = std::make_shared<RecordedMotion>(action, x, y);
    postMotion(motion);
    return motion;
}

void HeadlessHost::requestDestroy() {
    Source source;
    source.kind = SourceKind::Destroy;
    post(std::move(source));
}

void HeadlessHost::wake() {
    Source source;
    source.kind = SourceKind::Wake;
    post(std::move(source));
}

void HeadlessHost::injectPollError() {
    Source source;
    source.kind = SourceKind::Error;
    post(std::move(source));
}

size_t HeadlessHost::pendingSources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_.size();
}

// ═══════════════════════════════════════════════════════════════════════════
// Assets
// ═══════════════════════════════════════════════════════════════════════════

NativeAsset* HeadlessHost::openAsset(const char* name, AssetMode mode) {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    last_open_mode_ = mode;

    if (name == nullptr) {
        return nullptr;
    }
    auto it = assets_.find(name);
    if (it == assets_.end()) {
        return nullptr;
    }

    auto open = std::make_unique<OpenAsset>(OpenAsset{&it->second});
    auto* handle = reinterpret_cast<NativeAsset*>(open.get());
    open_assets_.emplace(handle, std::move(open));
    ++open_count_;
    return handle;
}

int64_t HeadlessHost::assetLength(NativeAsset* asset) {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    auto it = open_assets_.find(asset);
    if (it == open_assets_.end()) {
        return -1;
    }
    const AssetData& data = *it->second->data;
    if (data.broken_length) {
        return -1;
    }
    return static_cast<int64_t>(data.bytes.size());
}

const void* HeadlessHost::assetBuffer(NativeAsset* asset) {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    auto it = open_assets_.find(asset);
    if (it == open_assets_.end()) {
        return nullptr;
    }
    const AssetData& data = *it->second->data;
    if (!data.buffered) {
        return nullptr;
    }
    // A zero-length asset still has a valid (empty) buffer
    static const uint8_t empty = 0;
    return data.bytes.empty() ? &empty : data.bytes.data();
}

void HeadlessHost::closeAsset(NativeAsset* asset) {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    if (open_assets_.erase(asset) == 0) {
        ++invalid_close_count_;
        return;
    }
    ++close_count_;
}

void HeadlessHost::addAsset(const std::string& name, std::vector<uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    assets_[name] = AssetData{std::move(bytes), true, false};
}

void HeadlessHost::addUnbufferedAsset(const std::string& name) {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    assets_[name] = AssetData{{}, false, false};
}

void HeadlessHost::addBrokenLengthAsset(const std::string& name, std::vector<uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    assets_[name] = AssetData{std::move(bytes), true, true};
}

uint32_t HeadlessHost::openCount() const {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    return open_count_;
}

uint32_t HeadlessHost::closeCount() const {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    return close_count_;
}

size_t HeadlessHost::liveAssetCount() const {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    return open_assets_.size();
}

uint32_t HeadlessHost::invalidCloseCount() const {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    return invalid_close_count_;
}

AssetMode HeadlessHost::lastOpenMode() const {
    std::lock_guard<std::mutex> lock(asset_mutex_);
    return last_open_mode_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

void HeadlessHost::writeLog(LogPriority priority, const char* tag, const char* message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    logs_.push_back(LogRecord{priority, tag ? tag : "", message ? message : ""});
}

std::vector<LogRecord> HeadlessHost::logs() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return logs_;
}

void HeadlessHost::clearLogs() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    logs_.clear();
}

bool HeadlessHost::hasLog(const std::string& tag, const std::string& text) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return std::any_of(logs_.begin(), logs_.end(), [&](const LogRecord& record) {
        return record.tag == tag && record.message.find(text) != std::string::npos;
    });
}

} // namespace droidglue::host

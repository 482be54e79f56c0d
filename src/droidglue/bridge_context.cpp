/**
 * @file bridge_context.cpp
 * @brief WindowSignal implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/bridge_context.h"

namespace droidglue {

void WindowSignal::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = true;
        ++generation_;
    }
    cv_.notify_all();
}

void WindowSignal::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = false;
        ++generation_;
    }
    cv_.notify_all();
}

void WindowSignal::shut_down() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        ready_ = false;
        ++generation_;
    }
    cv_.notify_all();
}

bool WindowSignal::is_ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_;
}

bool WindowSignal::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
}

uint64_t WindowSignal::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

bool WindowSignal::wait_for_change(uint64_t seen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return generation_ != seen; });
}

Result<host::NativeWindow*> WindowSignal::await_window(const host::IHost& host,
                                                       std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!shut_down_) {
        if (host::NativeWindow* window = host.nativeWindow()) {
            return Ok(window);
        }
        const uint64_t seen = generation_;
        cv_.wait_for(lock, timeout, [&] { return generation_ != seen || shut_down_; });
    }

    // The host may already be destroyed once shut_down() has run
    if (shut_down_) {
        return make_error(ErrorCode::ShutDown, "bridge shut down while waiting for the native window");
    }
    if (host::NativeWindow* window = host.nativeWindow()) {
        return Ok(window);
    }
    return make_error(ErrorCode::Timeout, "native window not available yet");
}

} // namespace droidglue

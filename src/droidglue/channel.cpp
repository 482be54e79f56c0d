/**
 * @file channel.cpp
 * @brief EventSender / EventReceiver implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/channel.h"

#include <condition_variable>
#include <deque>
#include <mutex>

namespace droidglue {

namespace detail {

struct ChannelState {
    explicit ChannelState(size_t cap) : capacity(cap) {}

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Event> queue;
    const size_t capacity;      // 0 = unbounded
    size_t sender_count = 0;
    bool receiver_alive = true;
};

} // namespace detail

std::pair<EventSender, EventReceiver> make_event_channel(size_t capacity) {
    auto state = std::make_shared<detail::ChannelState>(capacity);
    return {EventSender(state), EventReceiver(state)};
}

// ═══════════════════════════════════════════════════════════════════════════════
// EventSender
// ═══════════════════════════════════════════════════════════════════════════════

EventSender::EventSender(std::shared_ptr<detail::ChannelState> state)
    : state_(std::move(state))
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    ++state_->sender_count;
}

EventSender::~EventSender() {
    release();
}

EventSender::EventSender(const EventSender& other)
    : state_(other.state_)
{
    if (state_) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->sender_count;
    }
}

EventSender& EventSender::operator=(const EventSender& other) {
    if (this != &other) {
        release();
        state_ = other.state_;
        if (state_) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->sender_count;
        }
    }
    return *this;
}

EventSender::EventSender(EventSender&& other) noexcept
    : state_(std::move(other.state_))
{}

EventSender& EventSender::operator=(EventSender&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

void EventSender::release() noexcept {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        --state_->sender_count;
    }
    // A receiver blocked in recv() must see the last sender go away
    state_->cv.notify_all();
    state_.reset();
}

SendStatus EventSender::send(const Event& event) noexcept {
    if (!state_) {
        return SendStatus::Disconnected;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->receiver_alive) {
            return SendStatus::Disconnected;
        }
        if (state_->capacity != 0 && state_->queue.size() >= state_->capacity) {
            return SendStatus::Full;
        }
        state_->queue.push_back(event);
    }
    state_->cv.notify_one();
    return SendStatus::Sent;
}

bool EventSender::connected() const noexcept {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->receiver_alive;
}

// ═══════════════════════════════════════════════════════════════════════════════
// EventReceiver
// ═══════════════════════════════════════════════════════════════════════════════

EventReceiver::EventReceiver(std::shared_ptr<detail::ChannelState> state)
    : state_(std::move(state))
{}

EventReceiver::~EventReceiver() {
    disconnect();
}

EventReceiver::EventReceiver(EventReceiver&& other) noexcept
    : state_(std::move(other.state_))
{}

EventReceiver& EventReceiver::operator=(EventReceiver&& other) noexcept {
    if (this != &other) {
        disconnect();
        state_ = std::move(other.state_);
    }
    return *this;
}

void EventReceiver::disconnect() noexcept {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->receiver_alive = false;
        state_->queue.clear();
    }
    state_.reset();
}

std::optional<Event> EventReceiver::recv() {
    if (!state_) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] {
        return !state_->queue.empty() || state_->sender_count == 0;
    });
    if (state_->queue.empty()) {
        return std::nullopt;
    }
    Event event = state_->queue.front();
    state_->queue.pop_front();
    return event;
}

std::optional<Event> EventReceiver::try_recv() {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->queue.empty()) {
        return std::nullopt;
    }
    Event event = state_->queue.front();
    state_->queue.pop_front();
    return event;
}

std::optional<Event> EventReceiver::recv_for(std::chrono::milliseconds timeout) {
    if (!state_) {
        return std::nullopt;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    const bool ready = state_->cv.wait_for(lock, timeout, [this] {
        return !state_->queue.empty() || state_->sender_count == 0;
    });
    if (!ready || state_->queue.empty()) {
        return std::nullopt;
    }
    Event event = state_->queue.front();
    state_->queue.pop_front();
    return event;
}

size_t EventReceiver::pending() const {
    if (!state_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

} // namespace droidglue

/**
 * @file channel.cpp
 * @brief Event channel implementation for geministream
 */

#include "geministream/channel.hpp"

namespace geministream {

void EventChannel::push(StreamEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<StreamEvent> EventChannel::pop(const Deadline& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return interrupted_ || !events_.empty(); };

    if (deadline.has_value()) {
        if (!cv_.wait_until(lock, *deadline, ready)) {
            return std::nullopt;
        }
    } else {
        cv_.wait(lock, ready);
    }

    if (interrupted_) {
        return std::nullopt;
    }

    StreamEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventChannel::interrupt() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    cv_.notify_all();
}

} // namespace geministream

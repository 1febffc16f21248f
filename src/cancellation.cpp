/**
 * @file cancellation.cpp
 * @brief Cancellation token implementation for geministream
 */

#include "geministream/cancellation.hpp"

namespace geministream {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    // Callbacks run under the lock so unsubscribe() can wait them out.
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return;
    }
    state_->cancelled = true;
    state_->cv.notify_all();

    for (auto& [id, callback] : state_->callbacks) {
        if (callback) {
            callback();
        }
    }
    state_->callbacks.clear();
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::steady_clock::duration duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

std::size_t CancellationToken::subscribe(Callback callback) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::size_t id = state_->next_id++;
    if (state_->cancelled) {
        if (callback) {
            callback();
        }
        return id;
    }
    state_->callbacks.emplace(id, std::move(callback));
    return id;
}

void CancellationToken::unsubscribe(std::size_t id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

} // namespace geministream

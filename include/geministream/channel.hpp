/**
 * @file channel.hpp
 * @brief Thread-safe handoff of stream events between threads
 */

#ifndef GEMINISTREAM_CHANNEL_HPP
#define GEMINISTREAM_CHANNEL_HPP

#include "events.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace geministream {

/**
 * Ordered, unbounded event queue
 *
 * Any number of writers, one reader. Events are delivered in push order.
 */
class EventChannel {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    void push(StreamEvent event);

    /**
     * Take the next event, waiting until one arrives
     * @param deadline Give up at this point; wait forever when empty
     * @return The event, or nothing on timeout or after interrupt()
     */
    std::optional<StreamEvent> pop(const Deadline& deadline = std::nullopt);

    /**
     * Wake the reader. Every later pop() returns nothing immediately.
     */
    void interrupt();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamEvent> events_;
    bool interrupted_ = false;
};

} // namespace geministream

#endif // GEMINISTREAM_CHANNEL_HPP

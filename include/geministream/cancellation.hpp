/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation for streams
 */

#ifndef GEMINISTREAM_CANCELLATION_HPP
#define GEMINISTREAM_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace geministream {

/**
 * Shared cancellation flag
 *
 * Copies refer to the same flag. A default-constructed token is live and
 * can be cancelled from any thread.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken();

    /**
     * Cancel the token, wake all sleepers and run registered callbacks.
     * Callbacks run on the calling thread, once, and must not call back
     * into the token.
     */
    void cancel();

    bool is_cancelled() const;

    /**
     * Sleep for `duration` unless cancelled first
     * @return false if the token was cancelled before the duration elapsed
     */
    bool wait_for(std::chrono::steady_clock::duration duration) const;

    /**
     * Register a callback run on cancel(). Runs immediately if already cancelled.
     * @return Registration id for unsubscribe()
     */
    std::size_t subscribe(Callback callback) const;

    /**
     * Remove a callback. Once this returns the callback is not running and
     * will not run.
     */
    void unsubscribe(std::size_t id) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::size_t next_id = 1;
        std::map<std::size_t, Callback> callbacks;
    };

    std::shared_ptr<State> state_;
};

/**
 * Scoped subscription that unsubscribes on destruction
 */
class CancellationSubscription {
public:
    CancellationSubscription(const CancellationToken& token, CancellationToken::Callback callback)
        : token_(token), id_(token.subscribe(std::move(callback))) {}

    ~CancellationSubscription() { token_.unsubscribe(id_); }

    CancellationSubscription(const CancellationSubscription&) = delete;
    CancellationSubscription& operator=(const CancellationSubscription&) = delete;

private:
    CancellationToken token_;
    std::size_t id_;
};

} // namespace geministream

#endif // GEMINISTREAM_CANCELLATION_HPP

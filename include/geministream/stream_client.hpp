/**
 * @file stream_client.hpp
 * @brief Retrying, failing-over streaming client
 */

#ifndef GEMINISTREAM_STREAM_CLIENT_HPP
#define GEMINISTREAM_STREAM_CLIENT_HPP

#include "types.hpp"
#include "events.hpp"
#include "backend.hpp"
#include "transport.hpp"
#include "cancellation.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace geministream {

/**
 * Index of the endpoint used by attempt `attempt` (0-based): walks the
 * fallbacks in order and stays on the last one once they run out.
 */
std::size_t endpoint_index_for_attempt(int attempt, std::size_t endpoint_count);

/**
 * Endpoint used by attempt `attempt`
 * @throws ConfigurationError if `endpoints` is empty
 */
const std::string& endpoint_for_attempt(const std::vector<std::string>& endpoints, int attempt);

/**
 * Delay in seconds before the retry following attempt `attempt` (0-based):
 * min(base * 2^attempt, max)
 */
double backoff_delay(int attempt, double base, double max);

/**
 * One logical streaming call
 *
 * Pull events with next() or a range-for loop. Attempts run strictly one
 * after another; events keep their production order. Destroying the stream
 * early releases the active attempt.
 */
class EventStream {
public:
    enum class State {
        Attempting,
        BackingOff,
        Succeeded,
        ExhaustedFailure,
        Cancelled
    };

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = StreamEvent;
        using difference_type = std::ptrdiff_t;
        using pointer = const StreamEvent*;
        using reference = const StreamEvent&;

        iterator() = default;
        explicit iterator(EventStream* stream) : stream_(stream) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }

        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return stream_ != other.stream_; }

    private:
        void advance();

        EventStream* stream_ = nullptr;
        std::optional<StreamEvent> current_;
    };

    EventStream(
        std::shared_ptr<const StreamConfig> config,
        GenerateRequest request,
        TransportFactory factory,
        CancellationToken cancel_token,
        std::shared_ptr<spdlog::logger> logger
    );

    ~EventStream();

    EventStream(EventStream&& other);
    EventStream& operator=(EventStream&&) = delete;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /**
     * Next caller-visible event
     * @return The event, or nothing once the stream completed
     * @throws StreamError when the retry budget is exhausted
     * @throws CancellationError when the cancel token fires
     */
    std::optional<StreamEvent> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    State state() const { return state_; }

    /// Attempts started so far
    int attempts_made() const { return attempts_made_; }

    /// Endpoint of the current (or last) attempt
    const std::string& current_endpoint() const { return current_endpoint_; }

    const std::string& last_error() const { return last_error_; }

private:
    bool begin_attempt();
    void finish_attempt() noexcept;
    void fail_attempt(const std::string& error);
    std::optional<StreamEvent> wait_for_event();
    [[noreturn]] void cancel();

    std::shared_ptr<const StreamConfig> config_;
    GenerateRequest request_;
    TransportFactory factory_;
    CancellationToken cancel_token_;
    std::shared_ptr<spdlog::logger> logger_;

    State state_ = State::Attempting;
    std::optional<Transport> transport_;
    std::chrono::steady_clock::time_point next_heartbeat_;
    int attempt_ = 0;
    int attempts_made_ = 0;
    std::string current_endpoint_;
    std::string last_error_;
};

/**
 * Streaming client with retries, heartbeats and endpoint fail-over
 */
class StreamClient {
public:
    /**
     * Create a client
     * @param config Streaming configuration, validated here
     * @param logger Destination for client logs; discards them when null
     * @throws ConfigurationError
     */
    explicit StreamClient(StreamConfig config, std::shared_ptr<spdlog::logger> logger = nullptr);

    ~StreamClient();

    /**
     * Start a streaming call
     *
     * Nothing is sent until the first next() on the returned stream.
     *
     * @param request Generation request, copied into the stream
     * @param transport_factory Builds the transport of each attempt; the
     *        Gemini backend transport when empty
     * @param cancel_token Cancels waits inside the stream
     */
    EventStream stream(
        const GenerateRequest& request,
        TransportFactory transport_factory = nullptr,
        CancellationToken cancel_token = CancellationToken()
    ) const;

    const StreamConfig& config() const { return *config_; }
    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

    /// True once a stream has used the default transport, which owns the
    /// process-wide libcurl setup
    bool backend_started() const { return default_backend_->started; }

private:
    // Built on first use of the default factory and shared by its copies
    struct DefaultBackend {
        std::once_flag once;
        std::atomic<bool> started{false};
        std::shared_ptr<const Backend> backend;
        TransportFactory factory;
    };

    std::shared_ptr<const StreamConfig> config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<DefaultBackend> default_backend_;
    TransportFactory default_factory_;
};

} // namespace geministream

#endif // GEMINISTREAM_STREAM_CLIENT_HPP

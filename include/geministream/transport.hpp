/**
 * @file transport.hpp
 * @brief Per-attempt event sources for a stream
 */

#ifndef GEMINISTREAM_TRANSPORT_HPP
#define GEMINISTREAM_TRANSPORT_HPP

#include "types.hpp"
#include "events.hpp"
#include "channel.hpp"
#include "backend.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <spdlog/spdlog.h>

namespace geministream {

/**
 * A blocking streaming call: delivers decoded chunks to the callback until
 * the response ends, throws on failure, and returns early once
 * `stop_requested` is set (if it can observe it).
 */
using BlockingStreamCall = std::function<void(
    const StreamConfig& config,
    const GenerateRequest& request,
    const ChunkCallback& on_chunk,
    const std::atomic<bool>& stop_requested)>;

/**
 * Bind a BlockingStreamCall to a shared Backend
 */
BlockingStreamCall make_backend_call(std::shared_ptr<const Backend> backend);

using TransportDeadline = EventChannel::Deadline;

/**
 * Transport bridging a blocking backend call onto an event channel
 *
 * enter() starts one worker thread that runs the call. The worker turns
 * every chunk into a Chunk event, then pushes Complete or Error, and always
 * finishes with EndOfAttempt. exit() requests a stop and waits at most
 * `join_timeout` seconds for the worker; a worker still blocked after that
 * is detached and left to finish on its own.
 */
class BackendTransport {
public:
    BackendTransport(
        StreamConfig config,
        GenerateRequest request,
        BlockingStreamCall call,
        std::shared_ptr<spdlog::logger> logger = nullptr
    );

    ~BackendTransport();

    BackendTransport(BackendTransport&&) = default;
    BackendTransport& operator=(BackendTransport&&) = delete;
    BackendTransport(const BackendTransport&) = delete;
    BackendTransport& operator=(const BackendTransport&) = delete;

    /// @throws TransportError if already entered or no call is bound
    void enter();

    /**
     * Next event from the worker
     * @param deadline Stop waiting at this point
     * @return The event, or nothing on timeout or interrupt
     * @throws TransportError if not entered
     */
    std::optional<StreamEvent> produce(const TransportDeadline& deadline);

    void interrupt();

    void exit() noexcept;

    /// True once exit() gave up waiting on the worker
    bool worker_abandoned() const { return abandoned_; }

    const std::string& endpoint() const { return config_.endpoint; }

private:
    struct WorkerState {
        EventChannel channel;
        std::atomic<bool> stop_requested{false};
        std::mutex done_mutex;
        std::condition_variable done_cv;
        bool finished = false;
    };

    static void run_stream(
        std::shared_ptr<WorkerState> state,
        StreamConfig config,
        GenerateRequest request,
        BlockingStreamCall call,
        std::shared_ptr<spdlog::logger> logger
    );

    StreamConfig config_;
    GenerateRequest request_;
    BlockingStreamCall call_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<WorkerState> state_;
    std::thread worker_;
    bool abandoned_ = false;
};

/**
 * Transport that replays a fixed list of events, then EndOfAttempt
 */
class ReplayTransport {
public:
    explicit ReplayTransport(std::vector<StreamEvent> events);
    ReplayTransport(std::initializer_list<StreamEvent> events)
        : ReplayTransport(std::vector<StreamEvent>(events)) {}

    void enter();
    std::optional<StreamEvent> produce(const TransportDeadline& deadline);
    void interrupt() {}
    void exit() noexcept;

private:
    std::vector<StreamEvent> events_;
    std::size_t position_ = 0;
    bool entered_ = false;
};

/**
 * Transport whose enter() always throws
 */
class FailingTransport {
public:
    explicit FailingTransport(std::string message = "transport unavailable", std::string endpoint = "");

    [[noreturn]] void enter();
    std::optional<StreamEvent> produce(const TransportDeadline& deadline);
    void interrupt() {}
    void exit() noexcept {}

private:
    std::string message_;
    std::string endpoint_;
};

/**
 * One attempt's event source: a closed set of transport kinds behind
 * enter / produce / exit
 */
class Transport {
public:
    using Variant = std::variant<BackendTransport, ReplayTransport, FailingTransport>;

    Transport(BackendTransport transport) : impl_(std::move(transport)) {}
    Transport(ReplayTransport transport) : impl_(std::move(transport)) {}
    Transport(FailingTransport transport) : impl_(std::move(transport)) {}

    /// Acquire the attempt's resources. May throw.
    void enter();

    /// Next event of the attempt; EndOfAttempt closes the sequence
    std::optional<StreamEvent> produce(const TransportDeadline& deadline);

    /// Wake a blocked produce()
    void interrupt();

    /// Release resources. Safe after a failed or partial enter().
    void exit() noexcept;

    std::string kind() const;

private:
    Variant impl_;
};

using TransportFactory = std::function<Transport(const StreamConfig&, const GenerateRequest&)>;

/**
 * Factory building a BackendTransport for each attempt
 */
TransportFactory make_backend_transport_factory(
    std::shared_ptr<const Backend> backend,
    std::shared_ptr<spdlog::logger> logger = nullptr
);

} // namespace geministream

#endif // GEMINISTREAM_TRANSPORT_HPP

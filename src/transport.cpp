/**
 * @file transport.cpp
 * @brief Transport implementations for geministream
 */

#include "geministream/transport.hpp"
#include "geministream/errors.hpp"
#include "geministream/logging.hpp"

namespace geministream {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

BlockingStreamCall make_backend_call(std::shared_ptr<const Backend> backend) {
    return [backend](const StreamConfig& config,
                     const GenerateRequest& request,
                     const ChunkCallback& on_chunk,
                     const std::atomic<bool>& stop_requested) {
        backend->stream_generate(config, request, on_chunk, stop_requested);
    };
}

// =============================================================================
// BackendTransport
// =============================================================================

BackendTransport::BackendTransport(
    StreamConfig config,
    GenerateRequest request,
    BlockingStreamCall call,
    std::shared_ptr<spdlog::logger> logger
) : config_(std::move(config)),
    request_(std::move(request)),
    call_(std::move(call)),
    logger_(logger ? std::move(logger) : make_null_logger()) {
}

BackendTransport::~BackendTransport() {
    exit();
}

void BackendTransport::enter() {
    if (state_) {
        throw TransportError("Transport already entered", config_.endpoint);
    }
    if (!call_) {
        throw TransportError("No backend call bound to transport", config_.endpoint);
    }

    auto state = std::make_shared<WorkerState>();
    worker_ = std::thread(&BackendTransport::run_stream, state, config_, request_, call_, logger_);
    state_ = std::move(state);
}

std::optional<StreamEvent> BackendTransport::produce(const TransportDeadline& deadline) {
    if (!state_) {
        throw TransportError("Transport not entered", config_.endpoint);
    }
    return state_->channel.pop(deadline);
}

void BackendTransport::interrupt() {
    if (state_) {
        state_->channel.interrupt();
    }
}

void BackendTransport::exit() noexcept {
    if (!state_) {
        return;
    }

    state_->stop_requested = true;

    if (worker_.joinable()) {
        bool finished;
        {
            std::unique_lock<std::mutex> lock(state_->done_mutex);
            finished = state_->done_cv.wait_for(
                lock,
                seconds_to_duration(config_.join_timeout),
                [this] { return state_->finished; });
        }

        if (finished) {
            worker_.join();
        } else {
            // The blocking call ignores the stop request; its state outlives us
            logger_->warn("transport.worker_abandoned endpoint={} join_timeout={:.3f}",
                          config_.endpoint, config_.join_timeout);
            worker_.detach();
            abandoned_ = true;
        }
    }

    state_.reset();
}

void BackendTransport::run_stream(
    std::shared_ptr<WorkerState> state,
    StreamConfig config,
    GenerateRequest request,
    BlockingStreamCall call,
    std::shared_ptr<spdlog::logger> logger
) {
    struct EndOfAttemptGuard {
        WorkerState& state;
        ~EndOfAttemptGuard() {
            state.channel.push(StreamEvent::end_of_attempt());
            {
                std::lock_guard<std::mutex> lock(state.done_mutex);
                state.finished = true;
            }
            state.done_cv.notify_all();
        }
    } guard{*state};

    try {
        call(config, request, [&state](const json& chunk) {
            if (state->stop_requested) {
                return false;
            }
            state->channel.push(chunk_event_from_payload(chunk));
            return true;
        }, state->stop_requested);

        if (!state->stop_requested) {
            state->channel.push(StreamEvent::complete());
        }
    } catch (const std::exception& e) {
        logger->warn("transport.error endpoint={} error={}", config.endpoint, e.what());
        state->channel.push(StreamEvent::error(e.what()));
    } catch (...) {
        logger->warn("transport.error endpoint={} error=unknown", config.endpoint);
        state->channel.push(StreamEvent::error("Unknown backend error"));
    }
}

// =============================================================================
// ReplayTransport
// =============================================================================

ReplayTransport::ReplayTransport(std::vector<StreamEvent> events)
    : events_(std::move(events)) {
}

void ReplayTransport::enter() {
    entered_ = true;
    position_ = 0;
}

std::optional<StreamEvent> ReplayTransport::produce(const TransportDeadline&) {
    if (!entered_) {
        throw TransportError("Transport not entered");
    }
    if (position_ < events_.size()) {
        return events_[position_++];
    }
    return StreamEvent::end_of_attempt();
}

void ReplayTransport::exit() noexcept {
    entered_ = false;
}

// =============================================================================
// FailingTransport
// =============================================================================

FailingTransport::FailingTransport(std::string message, std::string endpoint)
    : message_(std::move(message)), endpoint_(std::move(endpoint)) {
}

void FailingTransport::enter() {
    throw TransportError(message_, endpoint_);
}

std::optional<StreamEvent> FailingTransport::produce(const TransportDeadline&) {
    throw TransportError("Transport not entered", endpoint_);
}

// =============================================================================
// Transport
// =============================================================================

void Transport::enter() {
    std::visit([](auto& transport) { transport.enter(); }, impl_);
}

std::optional<StreamEvent> Transport::produce(const TransportDeadline& deadline) {
    return std::visit([&deadline](auto& transport) { return transport.produce(deadline); }, impl_);
}

void Transport::interrupt() {
    std::visit([](auto& transport) { transport.interrupt(); }, impl_);
}

void Transport::exit() noexcept {
    std::visit([](auto& transport) { transport.exit(); }, impl_);
}

std::string Transport::kind() const {
    return std::visit(overloaded{
        [](const BackendTransport&) { return std::string("backend"); },
        [](const ReplayTransport&) { return std::string("replay"); },
        [](const FailingTransport&) { return std::string("failing"); }
    }, impl_);
}

TransportFactory make_backend_transport_factory(
    std::shared_ptr<const Backend> backend,
    std::shared_ptr<spdlog::logger> logger
) {
    BlockingStreamCall call = make_backend_call(std::move(backend));
    return [call, logger](const StreamConfig& config, const GenerateRequest& request) -> Transport {
        return BackendTransport(config, request, call, logger);
    };
}

} // namespace geministream

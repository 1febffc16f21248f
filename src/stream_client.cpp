/**
 * @file stream_client.cpp
 * @brief Stream orchestration for geministream
 */

#include "geministream/stream_client.hpp"
#include "geministream/errors.hpp"
#include "geministream/logging.hpp"
#include <algorithm>
#include <cmath>

namespace geministream {

std::size_t endpoint_index_for_attempt(int attempt, std::size_t endpoint_count) {
    if (endpoint_count == 0 || attempt <= 0) {
        return 0;
    }
    return std::min(static_cast<std::size_t>(attempt), endpoint_count - 1);
}

const std::string& endpoint_for_attempt(const std::vector<std::string>& endpoints, int attempt) {
    if (endpoints.empty()) {
        throw ConfigurationError("At least one endpoint is required", "endpoint");
    }
    return endpoints[endpoint_index_for_attempt(attempt, endpoints.size())];
}

double backoff_delay(int attempt, double base, double max) {
    return std::min(std::ldexp(base, std::max(attempt, 0)), max);
}

// =============================================================================
// EventStream
// =============================================================================

void EventStream::iterator::advance() {
    current_ = stream_->next();
    if (!current_) {
        stream_ = nullptr;
    }
}

EventStream::EventStream(
    std::shared_ptr<const StreamConfig> config,
    GenerateRequest request,
    TransportFactory factory,
    CancellationToken cancel_token,
    std::shared_ptr<spdlog::logger> logger
) : config_(std::move(config)),
    request_(std::move(request)),
    factory_(std::move(factory)),
    cancel_token_(std::move(cancel_token)),
    logger_(logger ? std::move(logger) : make_null_logger()) {
}

EventStream::EventStream(EventStream&& other)
    : config_(std::move(other.config_)),
      request_(std::move(other.request_)),
      factory_(std::move(other.factory_)),
      cancel_token_(other.cancel_token_),
      logger_(other.logger_),
      state_(other.state_),
      transport_(std::move(other.transport_)),
      next_heartbeat_(other.next_heartbeat_),
      attempt_(other.attempt_),
      attempts_made_(other.attempts_made_),
      current_endpoint_(std::move(other.current_endpoint_)),
      last_error_(std::move(other.last_error_)) {
    other.transport_.reset();
}

EventStream::~EventStream() {
    finish_attempt();
}

std::optional<StreamEvent> EventStream::next() {
    for (;;) {
        switch (state_) {
            case State::Succeeded:
                return std::nullopt;

            case State::ExhaustedFailure:
                throw StreamError("Exceeded maximum Gemini streaming retries: " + last_error_,
                                  last_error_, attempts_made_);

            case State::Cancelled:
                throw CancellationError();

            case State::BackingOff: {
                if (cancel_token_.is_cancelled()) {
                    cancel();
                }
                double delay = backoff_delay(attempt_, config_->backoff_base, config_->backoff_max);
                logger_->warn("stream.retrying attempt={} delay={:.3f} endpoint={} error={}",
                              attempt_ + 1, delay, current_endpoint_, last_error_);
                if (!cancel_token_.wait_for(seconds_to_duration(delay))) {
                    cancel();
                }
                ++attempt_;
                state_ = State::Attempting;
                continue;
            }

            case State::Attempting:
                break;
        }

        if (cancel_token_.is_cancelled()) {
            cancel();
        }

        if (!transport_ && !begin_attempt()) {
            continue;
        }

        std::optional<StreamEvent> event = wait_for_event();

        if (!event) {
            if (cancel_token_.is_cancelled()) {
                cancel();
            }
            auto now = std::chrono::steady_clock::now();
            if (config_->heartbeat_interval > 0 && now >= next_heartbeat_) {
                next_heartbeat_ = now + seconds_to_duration(config_->heartbeat_interval);
                return StreamEvent::heartbeat();
            }
            continue;
        }

        switch (event->type) {
            case StreamEventType::Chunk:
            case StreamEventType::Heartbeat:
                return event;

            case StreamEventType::Complete:
                finish_attempt();
                state_ = State::Succeeded;
                logger_->debug("stream.complete attempts={} endpoint={}", attempts_made_, current_endpoint_);
                return event;

            case StreamEventType::Error:
                finish_attempt();
                fail_attempt(event->text);
                continue;

            case StreamEventType::EndOfAttempt:
                // The source closed without reporting an error
                finish_attempt();
                state_ = State::Succeeded;
                logger_->debug("stream.ended attempts={} endpoint={}", attempts_made_, current_endpoint_);
                return std::nullopt;
        }
    }
}

bool EventStream::begin_attempt() {
    const std::vector<std::string> endpoints = config_->endpoints();
    const std::string endpoint = endpoint_for_attempt(endpoints, attempt_);

    if (attempt_ > 0 && endpoint != current_endpoint_) {
        logger_->info("stream.failover attempt={} from={} to={}", attempt_, current_endpoint_, endpoint);
    }
    current_endpoint_ = endpoint;
    ++attempts_made_;
    logger_->debug("stream.attempt attempt={} endpoint={}", attempt_, endpoint);

    // A factory or enter() failure counts as an immediate error event
    try {
        transport_.emplace(factory_(config_->with_endpoint(endpoint), request_));
        transport_->enter();
    } catch (const std::exception& e) {
        finish_attempt();
        fail_attempt(e.what());
        return false;
    }
    logger_->debug("stream.connected attempt={} transport={}", attempt_, transport_->kind());

    if (config_->heartbeat_interval > 0) {
        next_heartbeat_ = std::chrono::steady_clock::now() + seconds_to_duration(config_->heartbeat_interval);
    }
    return true;
}

void EventStream::finish_attempt() noexcept {
    if (transport_) {
        transport_->exit();
        transport_.reset();
    }
}

void EventStream::fail_attempt(const std::string& error) {
    last_error_ = error.empty() ? "Unknown Gemini error" : error;
    logger_->warn("stream.attempt_failed attempt={} endpoint={} error={}",
                  attempt_, current_endpoint_, last_error_);

    if (attempt_ >= config_->max_retries) {
        state_ = State::ExhaustedFailure;
        logger_->error("stream.exhausted attempts={} error={}", attempts_made_, last_error_);
    } else {
        state_ = State::BackingOff;
    }
}

std::optional<StreamEvent> EventStream::wait_for_event() {
    TransportDeadline deadline;
    if (config_->heartbeat_interval > 0) {
        deadline = next_heartbeat_;
    }

    Transport* transport = &*transport_;
    CancellationSubscription subscription(cancel_token_, [transport] { transport->interrupt(); });

    try {
        return transport->produce(deadline);
    } catch (const std::exception& e) {
        return StreamEvent::error(e.what());
    }
}

void EventStream::cancel() {
    finish_attempt();
    state_ = State::Cancelled;
    logger_->info("stream.cancelled attempt={} endpoint={}", attempt_, current_endpoint_);
    throw CancellationError();
}

// =============================================================================
// StreamClient
// =============================================================================

StreamClient::StreamClient(StreamConfig config, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : make_null_logger()) {
    config.validate();
    config_ = std::make_shared<StreamConfig>(std::move(config));
    default_backend_ = std::make_shared<DefaultBackend>();

    auto shared = default_backend_;
    auto logger_for_backend = logger_;
    default_factory_ = [shared, logger_for_backend](const StreamConfig& c, const GenerateRequest& r) -> Transport {
        std::call_once(shared->once, [&shared, &logger_for_backend] {
            shared->backend = std::make_shared<Backend>();
            shared->factory = make_backend_transport_factory(shared->backend, logger_for_backend);
            shared->started = true;
        });
        return shared->factory(c, r);
    };
}

StreamClient::~StreamClient() = default;

EventStream StreamClient::stream(
    const GenerateRequest& request,
    TransportFactory transport_factory,
    CancellationToken cancel_token
) const {
    return EventStream(
        config_,
        request,
        transport_factory ? std::move(transport_factory) : default_factory_,
        std::move(cancel_token),
        logger_
    );
}

} // namespace geministream

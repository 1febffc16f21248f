/**
 * @file errors.hpp
 * @brief Exception types for geministream
 */

#ifndef GEMINISTREAM_ERRORS_HPP
#define GEMINISTREAM_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>

namespace geministream {

/**
 * Base exception class for geministream errors
 */
class GeminiStreamError : public std::runtime_error {
public:
    explicit GeminiStreamError(const std::string& message, const std::string& code = "")
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

protected:
    std::string code_;
};

/**
 * Connection errors
 */
class ConnectionError : public GeminiStreamError {
public:
    explicit ConnectionError(const std::string& message, const std::string& endpoint = "")
        : GeminiStreamError(message, "CONNECTION_ERROR"), endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

/**
 * API errors
 */
class APIError : public GeminiStreamError {
public:
    APIError(
        const std::string& message,
        int status_code,
        const std::string& response_body = "",
        const std::string& endpoint = ""
    ) : GeminiStreamError(message, "API_ERROR"),
        status_code_(status_code),
        response_body_(response_body),
        endpoint_(endpoint) {}

    int status_code() const { return status_code_; }
    const std::string& response_body() const { return response_body_; }
    const std::string& endpoint() const { return endpoint_; }

protected:
    int status_code_;
    std::string response_body_;
    std::string endpoint_;
};

/**
 * Invalid or rejected API key
 */
class AuthenticationError : public APIError {
public:
    explicit AuthenticationError(const std::string& message, const std::string& endpoint = "")
        : APIError(message, 401, "", endpoint) {}
};

/**
 * Rate limit exceeded
 */
class RateLimitError : public APIError {
public:
    RateLimitError(
        const std::string& message,
        std::optional<int> retry_after = std::nullopt
    ) : APIError(message, 429), retry_after_(retry_after) {}

    std::optional<int> retry_after() const { return retry_after_; }

private:
    std::optional<int> retry_after_;
};

/**
 * Permission denied
 */
class PermissionDeniedError : public APIError {
public:
    explicit PermissionDeniedError(const std::string& message)
        : APIError(message, 403) {}
};

/**
 * Resource not found
 */
class NotFoundError : public APIError {
public:
    NotFoundError(const std::string& message, const std::string& resource = "")
        : APIError(message, 404), resource_(resource) {}

    const std::string& resource() const { return resource_; }

private:
    std::string resource_;
};

/**
 * Validation errors
 */
class ValidationError : public GeminiStreamError {
public:
    ValidationError(
        const std::string& message,
        const std::string& field = "",
        const std::string& value = ""
    ) : GeminiStreamError(message, "VALIDATION_ERROR"),
        field_(field),
        value_(value) {}

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

/**
 * Configuration errors
 */
class ConfigurationError : public GeminiStreamError {
public:
    ConfigurationError(const std::string& message, const std::string& config_key = "")
        : GeminiStreamError(message, "CONFIGURATION_ERROR"), config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

/**
 * Transport could not be entered or used
 */
class TransportError : public GeminiStreamError {
public:
    TransportError(const std::string& message, const std::string& endpoint = "")
        : GeminiStreamError(message, "TRANSPORT_ERROR"), endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

/**
 * Retry budget exhausted. The only failure a stream surfaces to its consumer.
 */
class StreamError : public GeminiStreamError {
public:
    StreamError(const std::string& message, const std::string& last_error = "", int attempts = 0)
        : GeminiStreamError(message, "STREAM_ERROR"),
          last_error_(last_error),
          attempts_(attempts) {}

    const std::string& last_error() const { return last_error_; }
    int attempts() const { return attempts_; }

private:
    std::string last_error_;
    int attempts_;
};

/**
 * Cancellation
 */
class CancellationError : public GeminiStreamError {
public:
    CancellationError() : GeminiStreamError("Operation cancelled", "CANCELLATION_ERROR") {}
};

/**
 * Timeout
 */
class TimeoutError : public GeminiStreamError {
public:
    TimeoutError(std::optional<double> timeout = std::nullopt)
        : GeminiStreamError("Operation timed out", "TIMEOUT_ERROR"), timeout_(timeout) {}

    std::optional<double> timeout() const { return timeout_; }

private:
    std::optional<double> timeout_;
};

} // namespace geministream

#endif // GEMINISTREAM_ERRORS_HPP

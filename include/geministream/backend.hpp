/**
 * @file backend.hpp
 * @brief Blocking streaming call against the Gemini REST API
 */

#ifndef GEMINISTREAM_BACKEND_HPP
#define GEMINISTREAM_BACKEND_HPP

#include "types.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace geministream {

/**
 * Receives one decoded response chunk. Returning false stops the transfer.
 */
using ChunkCallback = std::function<bool(const json& chunk)>;

/**
 * Backend options
 */
struct BackendOptions {
    std::string api_version = GEMINI_API_VERSION;
    std::optional<std::string> user_agent;
};

/**
 * Incremental decoder for a server-sent events body
 */
class SseDecoder {
public:
    /**
     * Feed raw bytes
     * @param data Received bytes
     * @param size Number of bytes
     * @param on_data Called with the payload of each complete "data:" line
     * @return false if on_data asked to stop
     */
    bool feed(const char* data, std::size_t size,
              const std::function<bool(const std::string&)>& on_data);

private:
    std::string buffer_;
};

/**
 * Client for Gemini streamGenerateContent
 *
 * stream_generate() blocks the calling thread until the response is fully
 * received, fails, or a stop is requested. A Backend holds no per-call
 * state and can be shared by concurrent workers.
 */
class Backend {
public:
    /**
     * Create a backend
     * @param options Configuration options
     */
    explicit Backend(const BackendOptions& options = {});

    ~Backend();

    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;

    /**
     * Perform a streaming completion
     * @param config Credentials, model, endpoint and timeout
     * @param request Generation request
     * @param on_chunk Callback for each decoded chunk
     * @param stop_requested Polled during the transfer; setting it aborts
     *        the call, which then returns normally
     * @throws ConnectionError, TimeoutError, APIError and subclasses
     */
    void stream_generate(
        const StreamConfig& config,
        const GenerateRequest& request,
        const ChunkCallback& on_chunk,
        const std::atomic<bool>& stop_requested
    ) const;

    /**
     * Build the JSON body sent for a request
     */
    json build_request_payload(const GenerateRequest& request) const;

    /**
     * Full URL of the streaming method for a config
     */
    std::string stream_url(const StreamConfig& config) const;

    /**
     * Throw the exception matching an HTTP error status
     */
    [[noreturn]] static void handle_http_error(int status_code, const std::string& body,
                                               const std::string& endpoint);

private:
    static json prepare_contents(const std::vector<Message>& contents);
    static json prepare_tools(const std::vector<Tool>& tools);
    static json prepare_generation_config(const GenerationConfig& config);

    BackendOptions options_;
};

} // namespace geministream

#endif // GEMINISTREAM_BACKEND_HPP

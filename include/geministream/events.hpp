/**
 * @file events.hpp
 * @brief Streaming event vocabulary and text accumulation
 */

#ifndef GEMINISTREAM_EVENTS_HPP
#define GEMINISTREAM_EVENTS_HPP

#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace geministream {

enum class StreamEventType {
    Chunk,
    Heartbeat,
    Complete,
    Error,
    EndOfAttempt    // closes one attempt, never surfaced to the caller
};

std::string event_type_to_string(StreamEventType type);

/**
 * Event emitted during streaming
 *
 * `text` holds the fragment for Chunk events and the message for Error
 * events; it is empty otherwise. `raw` carries the decoded backend payload
 * a chunk was built from, when there is one.
 */
struct StreamEvent {
    StreamEventType type = StreamEventType::Heartbeat;
    std::string text;
    std::optional<json> raw;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    static StreamEvent chunk(const std::string& text, std::optional<json> raw = std::nullopt);
    static StreamEvent heartbeat();
    static StreamEvent complete();
    static StreamEvent error(const std::string& message);
    static StreamEvent end_of_attempt();
};

/**
 * Extract the generated text from one decoded backend chunk.
 *
 * Prefers a top-level "text" field, otherwise joins the text parts of every
 * candidate. Payloads wrapped in a "response" object are unwrapped first.
 */
std::string extract_chunk_text(const json& payload);

/**
 * Build a Chunk event from one decoded backend chunk
 */
StreamEvent chunk_event_from_payload(const json& payload);

/**
 * Stitches chunk events into the final response text
 */
class TextAccumulator {
public:
    /**
     * Append the event's text if it is a non-empty chunk; ignore anything else
     * @param event Event delivered by a stream
     */
    void push(const StreamEvent& event);

    /**
     * Concatenation of all pushed chunk texts, in push order
     */
    std::string text() const;

    std::size_t chunk_count() const { return parts_.size(); }

private:
    std::vector<std::string> parts_;
};

} // namespace geministream

#endif // GEMINISTREAM_EVENTS_HPP

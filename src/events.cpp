/**
 * @file events.cpp
 * @brief Event model implementation for geministream
 */

#include "geministream/events.hpp"

namespace geministream {

std::string event_type_to_string(StreamEventType type) {
    switch (type) {
        case StreamEventType::Chunk: return "chunk";
        case StreamEventType::Heartbeat: return "heartbeat";
        case StreamEventType::Complete: return "complete";
        case StreamEventType::Error: return "error";
        case StreamEventType::EndOfAttempt: return "end_of_attempt";
        default: return "unknown";
    }
}

StreamEvent StreamEvent::chunk(const std::string& text, std::optional<json> raw) {
    StreamEvent event;
    event.type = StreamEventType::Chunk;
    event.text = text;
    event.raw = std::move(raw);
    return event;
}

StreamEvent StreamEvent::heartbeat() {
    StreamEvent event;
    event.type = StreamEventType::Heartbeat;
    return event;
}

StreamEvent StreamEvent::complete() {
    StreamEvent event;
    event.type = StreamEventType::Complete;
    return event;
}

StreamEvent StreamEvent::error(const std::string& message) {
    StreamEvent event;
    event.type = StreamEventType::Error;
    event.text = message;
    return event;
}

StreamEvent StreamEvent::end_of_attempt() {
    StreamEvent event;
    event.type = StreamEventType::EndOfAttempt;
    return event;
}

std::string extract_chunk_text(const json& payload) {
    if (!payload.is_object()) {
        return "";
    }

    const json& response_data = payload.contains("response") ? payload["response"] : payload;

    if (response_data.contains("text") && response_data["text"].is_string()) {
        std::string text = response_data["text"].get<std::string>();
        if (!text.empty()) {
            return text;
        }
    }

    if (!response_data.contains("candidates") || !response_data["candidates"].is_array()) {
        return "";
    }

    std::string text;
    for (const auto& candidate : response_data["candidates"]) {
        if (!candidate.is_object() || !candidate.contains("content")) continue;
        const json& content = candidate["content"];
        if (!content.is_object() || !content.contains("parts")) continue;
        const json& parts = content["parts"];
        if (!parts.is_array()) continue;

        for (const auto& part : parts) {
            if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
    }
    return text;
}

StreamEvent chunk_event_from_payload(const json& payload) {
    return StreamEvent::chunk(extract_chunk_text(payload), payload);
}

void TextAccumulator::push(const StreamEvent& event) {
    if (event.type == StreamEventType::Chunk && !event.text.empty()) {
        parts_.push_back(event.text);
    }
}

std::string TextAccumulator::text() const {
    std::string result;
    for (const auto& part : parts_) {
        result += part;
    }
    return result;
}

} // namespace geministream

/**
 * @file streaming.cpp
 * @brief Streaming example for geministream
 *
 * Usage: geministream_stream [--settings path] <prompt...>
 * Requires GEMINI_API_KEY; other GEMINI_* variables override the manifest.
 */

#include <geministream/geministream.hpp>
#include <iostream>
#include <string>

using namespace geministream;

int main(int argc, char** argv) {
    std::optional<std::string> settings_path;
    std::string prompt;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--settings" && i + 1 < argc) {
            settings_path = argv[++i];
            continue;
        }
        if (!prompt.empty()) prompt += " ";
        prompt += arg;
    }
    if (prompt.empty()) {
        prompt = "Write a haiku about C++ programming";
    }

    try {
        GeminiEnvironment env = GeminiEnvironment::from_env();
        ProjectSettings settings = ProjectSettings::load(settings_path);
        auto logger = make_logger("geministream",
                                  string_to_log_level(env.log_level.value_or("warning")));

        StreamClient client(env.build_stream_config(settings), logger);

        GenerateRequest request;
        request.contents.push_back({Role::User, prompt});

        TextAccumulator accumulator;
        int heartbeats = 0;

        for (const StreamEvent& event : client.stream(request)) {
            accumulator.push(event);
            switch (event.type) {
                case StreamEventType::Chunk:
                    std::cout << event.text << std::flush;
                    break;
                case StreamEventType::Heartbeat:
                    ++heartbeats;
                    break;
                case StreamEventType::Complete:
                    std::cout << "\n--- Complete ---\n";
                    break;
                default:
                    break;
            }
        }

        std::cerr << "chunks=" << accumulator.chunk_count()
                  << " chars=" << accumulator.text().size() << " heartbeats=" << heartbeats << "\n";

    } catch (const StreamError& e) {
        std::cerr << "\nStream failed after " << e.attempts() << " attempts: " << e.last_error() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

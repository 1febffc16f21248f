/**
 * @file basic_usage.cpp
 * @brief Fail-over walkthrough for geministream, no network needed
 */

#include <geministream/geministream.hpp>
#include <iostream>

using namespace geministream;

int main() {
    std::cout << "geministream - Fail-over Example\n\n";

    try {
        StreamConfig config;
        config.api_key = "demo-key";
        config.model = "models/demo";
        config.endpoint = "primary";
        config.fallback_endpoints = {"secondary"};
        config.heartbeat_interval = 0.0;
        config.max_retries = 2;
        config.backoff_base = 0.05;

        StreamClient client(config, make_logger("basic_usage", LogLevel::Info));
        std::cout << "Endpoints:";
        for (const auto& endpoint : client.config().endpoints()) {
            std::cout << " " << endpoint;
        }
        std::cout << "\n";

        // The primary endpoint refuses connections; the secondary answers.
        TransportFactory factory = [](const StreamConfig& c, const GenerateRequest&) -> Transport {
            if (c.endpoint == "primary") {
                return FailingTransport("connection refused", c.endpoint);
            }
            return ReplayTransport({
                StreamEvent::chunk("Hello from "),
                StreamEvent::chunk(c.endpoint),
                StreamEvent::complete()
            });
        };

        GenerateRequest request;
        request.contents.push_back({Role::User, "Say hello"});

        TextAccumulator accumulator;
        EventStream stream = client.stream(request, factory);
        while (auto event = stream.next()) {
            accumulator.push(*event);
            std::cout << "[" << event_type_to_string(event->type) << "] " << event->text << "\n";
        }

        std::cout << "\nText: " << accumulator.text() << "\n";
        std::cout << "Attempts: " << stream.attempts_made()
                  << ", final endpoint: " << stream.current_endpoint() << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

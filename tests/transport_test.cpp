#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "geministream/errors.hpp"
#include "geministream/transport.hpp"

using namespace geministream;
using namespace std::chrono_literals;

namespace {

json text_payload(const std::string& text) {
    json part;
    part["text"] = text;
    json content;
    content["parts"] = json::array({part});
    json candidate;
    candidate["content"] = content;
    json payload;
    payload["candidates"] = json::array({candidate});
    return payload;
}

StreamConfig test_config() {
    StreamConfig config;
    config.api_key = "test-key";
    config.endpoint = "primary";
    config.join_timeout = 0.05;
    return config;
}

std::vector<StreamEvent> drain(BackendTransport& transport) {
    std::vector<StreamEvent> events;
    for (;;) {
        auto event = transport.produce(std::chrono::steady_clock::now() + 5s);
        if (!event) break;
        events.push_back(*event);
        if (event->type == StreamEventType::EndOfAttempt) break;
    }
    return events;
}

} // namespace

TEST(BackendTransportTest, ForwardsChunksThenCompletes) {
    BlockingStreamCall call = [](const StreamConfig&, const GenerateRequest&,
                                 const ChunkCallback& on_chunk, const std::atomic<bool>&) {
        on_chunk(text_payload("Hello"));
        on_chunk(text_payload(", world"));
    };
    BackendTransport transport(test_config(), GenerateRequest{}, call);

    transport.enter();
    std::vector<StreamEvent> events = drain(transport);
    transport.exit();

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, StreamEventType::Chunk);
    EXPECT_EQ(events[0].text, "Hello");
    EXPECT_EQ(events[1].text, ", world");
    EXPECT_EQ(events[2].type, StreamEventType::Complete);
    EXPECT_EQ(events[3].type, StreamEventType::EndOfAttempt);
    EXPECT_FALSE(transport.worker_abandoned());
}

TEST(BackendTransportTest, CallReceivesSelectedEndpoint) {
    std::string seen;
    BlockingStreamCall call = [&seen](const StreamConfig& config, const GenerateRequest&,
                                      const ChunkCallback&, const std::atomic<bool>&) {
        seen = config.endpoint;
    };
    BackendTransport transport(test_config().with_endpoint("secondary"), GenerateRequest{}, call);

    transport.enter();
    drain(transport);
    transport.exit();

    EXPECT_EQ(seen, "secondary");
    EXPECT_EQ(transport.endpoint(), "secondary");
}

TEST(BackendTransportTest, ThrowingCallBecomesErrorEvent) {
    BlockingStreamCall call = [](const StreamConfig&, const GenerateRequest&,
                                 const ChunkCallback& on_chunk, const std::atomic<bool>&) {
        on_chunk(text_payload("partial"));
        throw APIError("upstream unavailable", 503);
    };
    BackendTransport transport(test_config(), GenerateRequest{}, call);

    transport.enter();
    std::vector<StreamEvent> events = drain(transport);
    transport.exit();

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].text, "partial");
    EXPECT_EQ(events[1].type, StreamEventType::Error);
    EXPECT_EQ(events[1].text, "upstream unavailable");
    EXPECT_EQ(events[2].type, StreamEventType::EndOfAttempt);
}

TEST(BackendTransportTest, ExitStopsCooperativeCall) {
    std::atomic<bool> observed_stop{false};
    BlockingStreamCall call = [&observed_stop](const StreamConfig&, const GenerateRequest&,
                                               const ChunkCallback&, const std::atomic<bool>& stop) {
        while (!stop) {
            std::this_thread::sleep_for(1ms);
        }
        observed_stop = true;
    };
    StreamConfig config = test_config();
    config.join_timeout = 5.0;
    BackendTransport transport(config, GenerateRequest{}, call);

    transport.enter();
    EXPECT_FALSE(transport.produce(std::chrono::steady_clock::now() + 10ms).has_value());
    transport.exit();

    EXPECT_TRUE(observed_stop);
    EXPECT_FALSE(transport.worker_abandoned());
}

TEST(BackendTransportTest, ExitAbandonsStuckWorkerAfterJoinTimeout) {
    BlockingStreamCall call = [](const StreamConfig&, const GenerateRequest&,
                                 const ChunkCallback&, const std::atomic<bool>&) {
        std::this_thread::sleep_for(500ms);
    };
    BackendTransport transport(test_config(), GenerateRequest{}, call);

    transport.enter();
    auto start = std::chrono::steady_clock::now();
    transport.exit();
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(transport.worker_abandoned());
    EXPECT_LT(waited, 400ms);
}

TEST(BackendTransportTest, InterruptWakesProduce) {
    BlockingStreamCall call = [](const StreamConfig&, const GenerateRequest&,
                                 const ChunkCallback&, const std::atomic<bool>& stop) {
        while (!stop) {
            std::this_thread::sleep_for(1ms);
        }
    };
    BackendTransport transport(test_config(), GenerateRequest{}, call);
    transport.enter();

    std::thread interrupter([&transport] {
        std::this_thread::sleep_for(20ms);
        transport.interrupt();
    });
    auto event = transport.produce(std::nullopt);
    interrupter.join();
    transport.exit();

    EXPECT_FALSE(event.has_value());
}

TEST(BackendTransportTest, ProduceBeforeEnterThrows) {
    BackendTransport transport(test_config(), GenerateRequest{}, make_backend_call(nullptr));
    EXPECT_THROW(transport.produce(std::nullopt), TransportError);
}

TEST(BackendTransportTest, EnterTwiceThrows) {
    BlockingStreamCall call = [](const StreamConfig&, const GenerateRequest&,
                                 const ChunkCallback&, const std::atomic<bool>&) {};
    BackendTransport transport(test_config(), GenerateRequest{}, call);

    transport.enter();
    EXPECT_THROW(transport.enter(), TransportError);
    transport.exit();
}

TEST(BackendTransportTest, EnterWithoutCallThrows) {
    BackendTransport transport(test_config(), GenerateRequest{}, BlockingStreamCall());
    EXPECT_THROW(transport.enter(), TransportError);
    transport.exit();
}

TEST(ReplayTransportTest, ReplaysThenEndsAttempt) {
    ReplayTransport transport({StreamEvent::chunk("a"), StreamEvent::complete()});
    transport.enter();

    EXPECT_EQ(transport.produce(std::nullopt)->text, "a");
    EXPECT_EQ(transport.produce(std::nullopt)->type, StreamEventType::Complete);
    EXPECT_EQ(transport.produce(std::nullopt)->type, StreamEventType::EndOfAttempt);
    EXPECT_EQ(transport.produce(std::nullopt)->type, StreamEventType::EndOfAttempt);
}

TEST(ReplayTransportTest, ProduceBeforeEnterThrows) {
    ReplayTransport transport(std::vector<StreamEvent>{});
    EXPECT_THROW(transport.produce(std::nullopt), TransportError);
}

TEST(FailingTransportTest, EnterThrowsWithEndpoint) {
    FailingTransport transport("primary down", "primary");
    try {
        transport.enter();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(std::string(e.what()), "primary down");
        EXPECT_EQ(e.endpoint(), "primary");
    }
}

TEST(TransportTest, KindNamesVariant) {
    Transport replay = ReplayTransport(std::vector<StreamEvent>{});
    Transport failing = FailingTransport();
    Transport backend = BackendTransport(test_config(), GenerateRequest{}, BlockingStreamCall());

    EXPECT_EQ(replay.kind(), "replay");
    EXPECT_EQ(failing.kind(), "failing");
    EXPECT_EQ(backend.kind(), "backend");
}

TEST(TransportTest, DispatchesToReplay) {
    Transport transport = ReplayTransport({StreamEvent::chunk("x")});
    transport.enter();

    EXPECT_EQ(transport.produce(std::nullopt)->text, "x");
    EXPECT_EQ(transport.produce(std::nullopt)->type, StreamEventType::EndOfAttempt);
    transport.exit();
}

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "geministream/channel.hpp"

using namespace geministream;
using namespace std::chrono_literals;

TEST(EventChannelTest, DeliversInPushOrder) {
    EventChannel channel;
    channel.push(StreamEvent::chunk("a"));
    channel.push(StreamEvent::heartbeat());
    channel.push(StreamEvent::chunk("b"));

    EXPECT_EQ(channel.pop()->text, "a");
    EXPECT_EQ(channel.pop()->type, StreamEventType::Heartbeat);
    EXPECT_EQ(channel.pop()->text, "b");
    EXPECT_FALSE(channel.pop(std::chrono::steady_clock::now()).has_value());
}

TEST(EventChannelTest, PopTimesOutAtDeadline) {
    EventChannel channel;
    auto start = std::chrono::steady_clock::now();

    auto event = channel.pop(start + 20ms);

    EXPECT_FALSE(event.has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(EventChannelTest, PopReturnsQueuedEventEvenPastDeadline) {
    EventChannel channel;
    channel.push(StreamEvent::complete());

    auto event = channel.pop(std::chrono::steady_clock::now() - 1s);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, StreamEventType::Complete);
}

TEST(EventChannelTest, BlockingPopWakesOnPushFromOtherThread) {
    EventChannel channel;

    std::thread producer([&channel] {
        for (int i = 0; i < 100; ++i) {
            channel.push(StreamEvent::chunk(std::to_string(i)));
        }
        channel.push(StreamEvent::end_of_attempt());
    });

    int expected = 0;
    for (;;) {
        auto event = channel.pop();
        ASSERT_TRUE(event.has_value());
        if (event->type == StreamEventType::EndOfAttempt) break;
        EXPECT_EQ(event->text, std::to_string(expected++));
    }
    producer.join();

    EXPECT_EQ(expected, 100);
}

TEST(EventChannelTest, InterruptWakesBlockedReader) {
    EventChannel channel;

    std::thread interrupter([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.interrupt();
    });

    auto event = channel.pop();
    interrupter.join();

    EXPECT_FALSE(event.has_value());
    EXPECT_FALSE(channel.pop(std::chrono::steady_clock::now()).has_value());
}

TEST(EventChannelTest, InterruptIsSticky) {
    EventChannel channel;
    channel.interrupt();
    channel.push(StreamEvent::chunk("late"));

    EXPECT_FALSE(channel.pop().has_value());
    EXPECT_FALSE(channel.pop(std::chrono::steady_clock::now() + 1s).has_value());
}

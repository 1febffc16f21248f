#include <gtest/gtest.h>

#include <memory>
#include <sstream>

#include <spdlog/sinks/ostream_sink.h>

#include "geministream/logging.hpp"
#include "geministream/stream_client.hpp"

using namespace geministream;

TEST(LoggingTest, LevelsMapOntoSpdlog) {
    EXPECT_EQ(to_spdlog_level(LogLevel::None), spdlog::level::off);
    EXPECT_EQ(to_spdlog_level(LogLevel::Warning), spdlog::level::warn);
    EXPECT_EQ(to_spdlog_level(LogLevel::All), spdlog::level::trace);
}

TEST(LoggingTest, MakeLoggerAppliesLevel) {
    auto logger = make_logger("test", LogLevel::Debug);
    EXPECT_EQ(logger->name(), "test");
    EXPECT_TRUE(logger->should_log(spdlog::level::debug));
    EXPECT_FALSE(logger->should_log(spdlog::level::trace));
}

TEST(LoggingTest, NoneDisablesOutput) {
    auto logger = make_logger("quiet", LogLevel::None);
    EXPECT_FALSE(logger->should_log(spdlog::level::critical));
    EXPECT_FALSE(make_null_logger()->should_log(spdlog::level::err));
}

TEST(LoggingTest, StreamLogsAttemptsAndFailover) {
    std::ostringstream output;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_level(spdlog::level::debug);
    logger->set_pattern("%l %v");

    StreamConfig config;
    config.api_key = "test-key";
    config.endpoint = "primary";
    config.fallback_endpoints = {"secondary"};
    config.heartbeat_interval = 0;
    config.backoff_base = 0.001;

    StreamClient client(config, logger);
    TransportFactory factory = [](const StreamConfig& config, const GenerateRequest&) -> Transport {
        if (config.endpoint == "primary") {
            return FailingTransport("primary down", config.endpoint);
        }
        return ReplayTransport({StreamEvent::complete()});
    };

    EventStream stream = client.stream(GenerateRequest{}, factory);
    for (const auto& event : stream) {
        (void)event;
    }
    logger->flush();

    std::string text = output.str();
    EXPECT_NE(text.find("warning stream.attempt_failed attempt=0 endpoint=primary error=primary down"),
              std::string::npos);
    EXPECT_NE(text.find("stream.retrying attempt=1"), std::string::npos);
    EXPECT_NE(text.find("info stream.failover attempt=1 from=primary to=secondary"), std::string::npos);
    EXPECT_NE(text.find("debug stream.connected attempt=1 transport=replay"), std::string::npos);
    EXPECT_NE(text.find("debug stream.complete attempts=2 endpoint=secondary"), std::string::npos);
}

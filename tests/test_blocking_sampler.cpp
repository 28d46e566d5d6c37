#include "loopguard/runtime/blocking_sampler.h"
#include "loopguard/runtime/manual_event_loop.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace loopguard;
using namespace std::chrono_literals;

class BlockingSamplerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    ManualEventLoop loop{fakes::silent_logger()};
    BlockingSampler sampler{SamplerConfig{}, fakes::capture_logger("loopguard.sampler", sink)};
    std::vector<BlockingEvent> events;

    void enable() {
        sampler.enable([this](const BlockingEvent& e) { events.push_back(e); }, loop);
    }
};

TEST_F(BlockingSamplerTest, ResponsiveLoopReportsNothing) {
    enable();
    for (int i = 0; i < 100; ++i) {
        loop.advance_by(10ms);
        sampler.record_activity();
    }
    EXPECT_TRUE(events.empty());
}

TEST_F(BlockingSamplerTest, SustainedStallIsReportedAfterFiveTicks) {
    enable();

    // Ticks at 110..140ms see a gap over 100ms but only four in a row
    loop.advance_by(140ms);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(sampler.state().consecutive_block_count, 4);

    loop.advance_by(10ms);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].duration, 150ms);
    EXPECT_EQ(events[0].consecutive_blocks, 5);
    EXPECT_EQ(events[0].sampling_interval, 10ms);
    EXPECT_EQ(sampler.state().consecutive_block_count, 0);
}

TEST_F(BlockingSamplerTest, GapEqualToThresholdIsNotABlock) {
    enable();
    loop.advance_by(100ms);
    EXPECT_EQ(sampler.state().consecutive_block_count, 0);
}

TEST_F(BlockingSamplerTest, ActivityResetsTheCount) {
    enable();
    loop.advance_by(130ms);
    EXPECT_EQ(sampler.state().consecutive_block_count, 3);

    sampler.record_activity();
    EXPECT_EQ(sampler.state().consecutive_block_count, 0);

    loop.advance_by(100ms);
    EXPECT_TRUE(events.empty());
}

TEST_F(BlockingSamplerTest, StallCountsAsOneLateTick) {
    enable();
    sampler.set_max_consecutive_blocks(1);

    loop.stall(500ms);
    loop.run_due();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].duration, 500ms);
}

TEST_F(BlockingSamplerTest, EventCarriesLastActivityFrame) {
    enable();
    sampler.set_max_consecutive_blocks(1);

    sampler.record_activity();
    const auto expected_line = static_cast<size_t>(__LINE__ - 1);
    loop.stall(200ms);
    loop.run_due();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].call_frame.line, expected_line);
    EXPECT_NE(events[0].call_frame.file.find("test_blocking_sampler"), std::string::npos);

    auto j = events[0].to_json();
    EXPECT_DOUBLE_EQ(j["duration"].get<double>(), 0.2);
    EXPECT_EQ(j["line"], expected_line);
}

TEST_F(BlockingSamplerTest, MaxConsecutiveBlocksIsClamped) {
    sampler.set_max_consecutive_blocks(0);
    EXPECT_EQ(sampler.state().max_consecutive_blocks, 1);
    sampler.set_max_consecutive_blocks(-7);
    EXPECT_EQ(sampler.state().max_consecutive_blocks, 1);

    SamplerConfig config;
    config.max_consecutive_blocks = 0;
    BlockingSampler clamped(config, fakes::silent_logger());
    EXPECT_EQ(clamped.state().max_consecutive_blocks, 1);
}

TEST_F(BlockingSamplerTest, InvalidConfigurationThrows) {
    SamplerConfig config;
    config.threshold = 0ms;
    EXPECT_THROW({ BlockingSampler rejected(config, fakes::silent_logger()); }, ConfigurationException);
}

TEST_F(BlockingSamplerTest, DisableStopsProbingAndIsIdempotent) {
    enable();
    EXPECT_EQ(loop.active_timers(), 1u);

    sampler.disable();
    sampler.disable();
    EXPECT_FALSE(sampler.is_enabled());
    EXPECT_EQ(loop.active_timers(), 0u);

    loop.advance_by(1s);
    EXPECT_TRUE(events.empty());
}

TEST_F(BlockingSamplerTest, ActivityIsIgnoredWhileDisabled) {
    const auto before = sampler.state().last_activity;
    loop.advance_by(50ms);
    sampler.record_activity();
    EXPECT_EQ(sampler.state().last_activity, before);
}

TEST_F(BlockingSamplerTest, ReEnableReplacesCallbackAndTimer) {
    enable();
    int second = 0;
    sampler.enable([&](const BlockingEvent&) { ++second; }, loop);
    sampler.set_max_consecutive_blocks(1);

    EXPECT_EQ(loop.active_timers(), 1u);
    loop.advance_by(110ms);

    EXPECT_TRUE(events.empty());
    EXPECT_EQ(second, 1);
}

TEST_F(BlockingSamplerTest, WrapRecordsActivityAroundTheCall) {
    enable();
    loop.advance_by(90ms);

    auto handler = sampler.wrap([this](int x) {
        loop.stall(50ms);
        return x * 2;
    });
    EXPECT_EQ(handler(21), 42);

    // Activity was recorded after the call returned
    EXPECT_EQ(sampler.state().last_activity, loop.now());

    int calls = 0;
    auto void_handler = sampler.wrap([&calls]() { ++calls; });
    void_handler();
    EXPECT_EQ(calls, 1);
}

TEST_F(BlockingSamplerTest, ThrowingCallbackIsLogged) {
    sampler.enable([](const BlockingEvent&) { throw std::runtime_error("handler failed"); }, loop);
    sampler.set_max_consecutive_blocks(1);

    loop.advance_by(110ms);

    EXPECT_TRUE(sink->contains("Blocking callback failed"));
    EXPECT_TRUE(sink->contains("handler failed"));
    EXPECT_TRUE(sampler.is_enabled());
}

TEST_F(BlockingSamplerTest, StateSerializesToJson) {
    enable();
    auto j = sampler.state().to_json();

    EXPECT_DOUBLE_EQ(j["threshold"].get<double>(), 0.1);
    EXPECT_DOUBLE_EQ(j["sampling_interval"].get<double>(), 0.01);
    EXPECT_EQ(j["enabled"], true);
    EXPECT_EQ(j["consecutive_blocking_count"], 0);
    EXPECT_EQ(j["max_consecutive_blocks"], 5);
}

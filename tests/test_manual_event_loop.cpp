#include "loopguard/runtime/manual_event_loop.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace loopguard;
using namespace std::chrono_literals;

class ManualEventLoopTest : public ::testing::Test {
protected:
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    ManualEventLoop loop{fakes::capture_logger("loopguard.event_loop", sink)};
};

TEST_F(ManualEventLoopTest, OneShotTimerFiresOnce) {
    int fired = 0;
    loop.create_timer(100ms, [&]() { ++fired; });

    EXPECT_EQ(loop.advance_by(99ms), 0u);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(loop.advance_by(1ms), 1u);
    EXPECT_EQ(loop.advance_by(1s), 0u);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(loop.active_timers(), 0u);
}

TEST_F(ManualEventLoopTest, RepeatingTimerFiresEveryInterval) {
    std::vector<TimePoint> ticks;
    const TimePoint start = loop.now();
    loop.create_repeating_timer(10ms, [&]() { ticks.push_back(loop.now()); });

    loop.advance_by(35ms);

    ASSERT_EQ(ticks.size(), 3u);
    EXPECT_EQ(ticks[0] - start, 10ms);
    EXPECT_EQ(ticks[2] - start, 30ms);
    EXPECT_EQ(loop.now() - start, 35ms);
}

TEST_F(ManualEventLoopTest, CancelledTimerNeverFires) {
    int fired = 0;
    auto handle = loop.create_repeating_timer(10ms, [&]() { ++fired; });

    EXPECT_TRUE(loop.cancel_timer(handle));
    EXPECT_FALSE(loop.cancel_timer(handle));
    loop.advance_by(100ms);

    EXPECT_EQ(fired, 0);
    EXPECT_FALSE(loop.cancel_timer(TimerHandle{}));
}

TEST_F(ManualEventLoopTest, TimerCanCancelItself) {
    int fired = 0;
    TimerHandle handle;
    handle = loop.create_repeating_timer(10ms, [&]() {
        if (++fired == 2) {
            loop.cancel_timer(handle);
        }
    });

    loop.advance_by(100ms);
    EXPECT_EQ(fired, 2);
}

TEST_F(ManualEventLoopTest, StallProducesSingleLateTick) {
    int fired = 0;
    const TimePoint start = loop.now();
    TimePoint seen;
    loop.create_repeating_timer(10ms, [&]() { ++fired; seen = loop.now(); });

    loop.stall(500ms);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(loop.run_due(), 1u);
    EXPECT_EQ(seen - start, 500ms);

    // Next tick is one interval after the late one
    loop.advance_by(9ms);
    EXPECT_EQ(fired, 1);
    loop.advance_by(1ms);
    EXPECT_EQ(fired, 2);
}

TEST_F(ManualEventLoopTest, InvalidTimersAreRejected) {
    EXPECT_THROW(loop.create_timer(10ms, TimerCallback{}), TimerException);
    EXPECT_THROW(loop.create_repeating_timer(0ms, []() {}), TimerException);
}

TEST_F(ManualEventLoopTest, ThrowingCallbackIsLogged) {
    loop.create_timer(1ms, []() { throw std::runtime_error("boom"); });
    int later = 0;
    loop.create_timer(2ms, [&]() { ++later; });

    loop.advance_by(5ms);

    EXPECT_EQ(later, 1);
    EXPECT_TRUE(sink->contains("Timer callback error"));
    EXPECT_TRUE(sink->contains("boom"));
}

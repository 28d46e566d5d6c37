#include "loopguard/memory/array_cache.h"
#include "loopguard/runtime/manual_event_loop.h"
#include "loopguard/runtime/safety_runtime.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace loopguard;
using namespace std::chrono_literals;

class SafetyRuntimeTest : public ::testing::Test {
protected:
    std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
    ManualEventLoop loop{fakes::silent_logger()};
    fakes::FakeMemoryMeter meter;
    SharedState state;

    static GuardConfig quiet_config() {
        GuardConfig config;
        config.logging.level = "off";
        return config;
    }

    std::unique_ptr<SafetyRuntime> make_runtime(GuardConfig config = quiet_config()) {
        return std::make_unique<SafetyRuntime>(std::move(config), loop, meter, state,
                                               fakes::capture_logger("loopguard.runtime", sink));
    }
};

TEST_F(SafetyRuntimeTest, StartSchedulesEveryComponent) {
    auto runtime = make_runtime();

    runtime->start();
    runtime->start();

    EXPECT_TRUE(runtime->is_running());
    EXPECT_TRUE(runtime->memory_guard().is_monitoring());
    EXPECT_TRUE(runtime->sampler().is_enabled());
    // memory check, cache check, sampler tick, context sweep
    EXPECT_EQ(loop.active_timers(), 4u);
    EXPECT_EQ(sink->count(LogLevel::INFO), 1u);
}

TEST_F(SafetyRuntimeTest, StopIsIdempotentAndCancelsTimers) {
    auto runtime = make_runtime();
    runtime->start();

    runtime->stop();
    runtime->stop();

    EXPECT_FALSE(runtime->is_running());
    EXPECT_FALSE(runtime->memory_guard().is_monitoring());
    EXPECT_FALSE(runtime->sampler().is_enabled());
    EXPECT_EQ(loop.active_timers(), 0u);
    EXPECT_TRUE(sink->contains("Safety runtime stopped"));
}

TEST_F(SafetyRuntimeTest, DisabledComponentsAreNotScheduled) {
    auto config = quiet_config();
    config.sampler.enabled = false;
    config.isolation.enabled = false;
    auto runtime = make_runtime(config);

    runtime->start();

    EXPECT_FALSE(runtime->sampler().is_enabled());
    EXPECT_EQ(loop.active_timers(), 2u);
}

TEST_F(SafetyRuntimeTest, BlockingEventsAreCountedAndLogged) {
    auto runtime = make_runtime();
    runtime->start();
    runtime->sampler().set_max_consecutive_blocks(1);

    loop.stall(300ms);
    loop.run_due();

    EXPECT_EQ(runtime->health()["counters"]["blocking_events"], 1);
    EXPECT_TRUE(sink->contains("Event loop blocked"));
    EXPECT_TRUE(sink->contains("duration_ms=300"));
}

TEST_F(SafetyRuntimeTest, CriticalMemoryIsCountedThenRestartRequested) {
    auto runtime = make_runtime();
    meter.current = 350 * MiB;

    runtime->memory_guard().perform_check();
    EXPECT_EQ(runtime->health()["counters"]["memory_alerts"], 1);
    EXPECT_EQ(runtime->health()["counters"]["restart_requests"], 0);

    loop.advance_by(1s);
    EXPECT_EQ(runtime->health()["counters"]["restart_requests"], 1);
    EXPECT_TRUE(sink->contains("Restart requested, waiting for supervisor"));
}

TEST_F(SafetyRuntimeTest, SweepReportsLeakedContexts) {
    auto config = quiet_config();
    config.sampler.enabled = false;
    auto runtime = make_runtime(config);
    runtime->start();

    auto leaked = runtime->isolation().create_context({"GET", "/never-finished"});
    auto finished = runtime->isolation().create_context({"GET", "/ok"});
    runtime->isolation().destroy_context(finished);

    loop.advance_by(30s);
    EXPECT_EQ(runtime->health()["counters"]["leaked_contexts"], 0);

    loop.advance_by(10s);
    EXPECT_EQ(runtime->health()["counters"]["leaked_contexts"], 1);
    EXPECT_TRUE(sink->contains("Request context leaked"));
    EXPECT_TRUE(sink->contains(leaked));
    EXPECT_TRUE(runtime->isolation().has_context(leaked));

    loop.advance_by(10s);
    loop.advance_by(10s);
    EXPECT_EQ(runtime->health()["counters"]["leaked_contexts"], 1);
    auto records = sink->records();
    EXPECT_EQ(std::count_if(records.begin(), records.end(), [](const MemorySink::Record& r) {
        return r.text.find("Request context leaked") != std::string::npos;
    }), 1);
}

TEST_F(SafetyRuntimeTest, LeakIsCountedAgainAfterANewContextLeaks) {
    auto config = quiet_config();
    config.sampler.enabled = false;
    auto runtime = make_runtime(config);
    runtime->start();

    auto first = runtime->isolation().create_context({"GET", "/first"});
    loop.advance_by(40s);
    EXPECT_EQ(runtime->health()["counters"]["leaked_contexts"], 1);

    runtime->isolation().destroy_context(first);
    auto second = runtime->isolation().create_context({"GET", "/second"});
    loop.advance_by(40s);
    EXPECT_EQ(runtime->health()["counters"]["leaked_contexts"], 2);
    EXPECT_TRUE(sink->contains(second));
}

TEST_F(SafetyRuntimeTest, HealthReportsEverySection) {
    auto runtime = make_runtime();
    runtime->memory_guard().register_cache("routes", std::make_shared<ArrayCache>());
    runtime->memory_guard().register_cache("views", std::make_shared<ArrayCache>(), 1 * MiB);
    runtime->isolation().create_context({"POST", "/jobs"});
    runtime->start();

    auto health = runtime->health();

    EXPECT_EQ(health["running"], true);
    EXPECT_EQ(health["memory"]["tracked_caches"], 2);
    EXPECT_EQ(health["memory"]["monitoring"], true);
    EXPECT_DOUBLE_EQ(health["sampler"]["threshold"].get<double>(), 0.1);
    EXPECT_EQ(health["sampler"]["enabled"], true);
    EXPECT_EQ(health["sampler"]["max_consecutive_blocks"], 5);
    EXPECT_EQ(health["isolation"]["enabled"], true);
    EXPECT_EQ(health["isolation"]["active_contexts"], 1);
    EXPECT_EQ(health["isolation"]["static_violations"], 0);
    EXPECT_EQ(health["counters"]["blocking_events"], 0);
}

TEST_F(SafetyRuntimeTest, InvalidConfigurationThrows) {
    auto config = quiet_config();
    config.memory.gc_threshold = config.memory.critical_threshold + 1;
    EXPECT_THROW(make_runtime(config), ConfigurationException);

    config = quiet_config();
    config.sampler.sampling_interval = 0ms;
    EXPECT_THROW(make_runtime(config), ConfigurationException);
}

TEST_F(SafetyRuntimeTest, DestructorStopsTheRuntime) {
    {
        auto runtime = make_runtime();
        runtime->start();
        ASSERT_EQ(loop.active_timers(), 4u);
    }
    EXPECT_EQ(loop.active_timers(), 0u);
}

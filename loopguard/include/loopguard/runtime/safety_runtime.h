#pragma once

#include "loopguard/config/guard_config.h"
#include "loopguard/isolation/request_isolation.h"
#include "loopguard/isolation/shared_state.h"
#include "loopguard/memory/memory_guard.h"
#include "loopguard/memory/memory_meter.h"
#include "loopguard/runtime/blocking_sampler.h"
#include "loopguard/runtime/event_loop.h"
#include "loopguard/utils/logger.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <unordered_set>

namespace loopguard {

/**
 * @brief Wires every safety component onto one event loop
 *
 * Owns the MemoryGuard, BlockingSampler and RequestIsolation built from one
 * GuardConfig, and a periodic sweep that logs request contexts which were
 * never destroyed.
 *
 * @code
 * UvEventLoop loop;
 * ProcessMemoryMeter meter;
 * SharedState state;
 * SafetyRuntime runtime(config, loop, meter, state);
 * runtime.start();
 * loop.run();
 * @endcode
 */
class SafetyRuntime {
public:
    /**
     * @throws ConfigurationException if any section of `config` is invalid
     */
    SafetyRuntime(GuardConfig config, IEventLoop& loop, IMemoryMeter& meter, SharedState& state,
                  std::shared_ptr<Logger> logger = nullptr);
    ~SafetyRuntime();

    SafetyRuntime(const SafetyRuntime&) = delete;
    SafetyRuntime& operator=(const SafetyRuntime&) = delete;

    void start();

    /**
     * @brief Stop every component; safe to call repeatedly
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    /**
     * @brief Health document with memory, sampler and isolation sections
     */
    [[nodiscard]] nlohmann::json health() const;

    [[nodiscard]] MemoryGuard& memory_guard() noexcept { return memory_guard_; }
    [[nodiscard]] BlockingSampler& sampler() noexcept { return sampler_; }
    [[nodiscard]] RequestIsolation& isolation() noexcept { return isolation_; }
    [[nodiscard]] const GuardConfig& config() const noexcept { return config_; }

private:
    GuardConfig config_;
    IEventLoop& loop_;
    std::shared_ptr<Logger> logger_;

    MemoryGuard memory_guard_;
    BlockingSampler sampler_;
    RequestIsolation isolation_;

    TimerHandle sweep_timer_;
    bool running_ = false;

    size_t blocking_events_ = 0;
    size_t memory_alerts_ = 0;
    size_t leaked_contexts_ = 0;
    size_t restart_requests_ = 0;
    std::unordered_set<std::string> reported_leaks_; ///< Still-open contexts already counted as leaked

    void sweep_contexts();
};

} // namespace loopguard

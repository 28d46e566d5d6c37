#pragma once

#include "loopguard/config/guard_config.h"
#include "loopguard/core/clock.h"
#include "loopguard/core/exceptions.h"
#include "loopguard/memory/cache_monitor.h"
#include "loopguard/memory/memory_meter.h"
#include "loopguard/runtime/event_loop.h"
#include "loopguard/utils/logger.h"

#include <nlohmann/json.hpp>

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace loopguard {

// ============================================================================
// Memory guard types
// ============================================================================

struct MemorySnapshot {
    TimePoint timestamp;
    size_t current_bytes = 0;
    size_t peak_bytes = 0;
};

enum class MemoryAlertType : int {
    CriticalMemory,   ///< Resident memory above the critical threshold
    MemoryLeak        ///< Sustained growth across the snapshot window
};

[[nodiscard]] std::string to_string(MemoryAlertType type);

/**
 * @brief Payload delivered to leak callbacks
 *
 * CriticalMemory fills `current_bytes` and `threshold`; MemoryLeak fills
 * `growth_rate` (bytes per second) and `snapshots`.
 */
struct MemoryAlert {
    MemoryAlertType type = MemoryAlertType::CriticalMemory;
    size_t current_bytes = 0;
    size_t threshold = 0;
    double growth_rate = 0.0;
    std::vector<MemorySnapshot> snapshots;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct MemoryStats {
    size_t current_bytes = 0;
    size_t peak_bytes = 0;
    size_t gc_runs = 0;              ///< Collections run by the threshold ladder
    Duration uptime{};
    size_t tracked_caches = 0;
    size_t snapshots = 0;
    bool monitoring = false;

    [[nodiscard]] nlohmann::json to_json() const;
};

using MemoryAlertCallback = std::function<void(const MemoryAlert&)>;
using RestartCallback = std::function<void()>;

/**
 * @brief "2d 3h 15m", "3h 15m" or "15m"
 */
[[nodiscard]] std::string format_uptime(Duration uptime);

// ============================================================================
// MemoryGuard
// ============================================================================

/**
 * @brief Periodic memory watchdog with graduated responses
 *
 * Every `check_interval` the guard samples resident memory into a bounded
 * window and walks the threshold ladder:
 *
 * | Level    | Action                                                      |
 * |----------|-------------------------------------------------------------|
 * | gc       | collect                                                     |
 * | warning  | collect, shrink every cache to half its limit               |
 * | critical | notify, clear every cache, collect, signal restart once     |
 *
 * With leak detection on, a window whose growth rate exceeds
 * `leak_growth_per_minute` is reported to the leak callbacks. Caches are
 * also checked against their own limits every `cache_check_interval`.
 *
 * The guard never terminates the process. A restart request is only a
 * signal for an external supervisor.
 */
class MemoryGuard {
public:
    /**
     * @throws ConfigurationException if the thresholds are not strictly
     *         increasing or an interval is not positive
     */
    MemoryGuard(MemoryGuardConfig config, IEventLoop& loop, IMemoryMeter& meter,
                std::shared_ptr<Logger> logger = nullptr);
    ~MemoryGuard();

    MemoryGuard(const MemoryGuard&) = delete;
    MemoryGuard& operator=(const MemoryGuard&) = delete;

    /**
     * @brief Schedule the memory and cache checks; no-op when already running
     */
    void start_monitoring();

    /**
     * @brief Cancel the periodic checks and any pending restart signal
     */
    void stop_monitoring();

    [[nodiscard]] bool is_monitoring() const noexcept { return monitoring_; }

    /**
     * @brief Track a cache under `name`, replacing any earlier registration
     * @param max_size Limit in bytes, `default_cache_limit` when omitted
     * @throws CacheRegistrationException if `Cache` does not implement
     *         ICacheMonitor or the handle is null
     */
    template<typename Cache>
    void register_cache(const std::string& name, std::shared_ptr<Cache> cache,
                        std::optional<size_t> max_size = std::nullopt) {
        if constexpr (std::is_base_of_v<ICacheMonitor, Cache>) {
            if (!cache) {
                throw CacheRegistrationException(name, "cache handle is null");
            }
            track_cache(name, std::static_pointer_cast<ICacheMonitor>(std::move(cache)), max_size);
        } else {
            throw CacheRegistrationException(
                name, "type does not implement ICacheMonitor; wrap containers in ContainerCache");
        }
    }

    bool unregister_cache(const std::string& name);

    void on_memory_leak(MemoryAlertCallback callback);
    void on_restart_requested(RestartCallback callback);

    /**
     * @brief Take one sample and run the ladder and leak detection
     *
     * Called by the periodic timer; public so hosts can force a check.
     */
    void perform_check();

    /**
     * @brief Clean every cache that is over its own limit down to that limit
     */
    void check_cache_sizes();

    [[nodiscard]] MemoryStats get_stats() const;
    [[nodiscard]] const std::deque<MemorySnapshot>& snapshots() const noexcept { return snapshots_; }
    [[nodiscard]] bool restart_pending() const noexcept { return restart_pending_; }
    [[nodiscard]] const MemoryGuardConfig& config() const noexcept { return config_; }

private:
    struct TrackedCache {
        std::shared_ptr<ICacheMonitor> cache;
        size_t max_size = 0;
    };

    MemoryGuardConfig config_;
    IEventLoop& loop_;
    IMemoryMeter& meter_;
    std::shared_ptr<Logger> logger_;

    std::map<std::string, TrackedCache> caches_;
    std::deque<MemorySnapshot> snapshots_;
    std::vector<MemoryAlertCallback> leak_callbacks_;
    std::vector<RestartCallback> restart_callbacks_;

    TimerHandle check_timer_;
    TimerHandle cache_timer_;
    TimerHandle restart_timer_;

    TimePoint started_at_;
    size_t gc_runs_ = 0;
    bool monitoring_ = false;
    bool restart_pending_ = false;

    void track_cache(const std::string& name, std::shared_ptr<ICacheMonitor> cache,
                     std::optional<size_t> max_size);

    void handle_critical_memory(size_t current);
    void handle_high_memory(size_t current);
    void trigger_collection();
    void detect_leaks();
    void schedule_restart();
    void notify(const MemoryAlert& alert);
    void clean_cache(const std::string& name, const TrackedCache& tracked, size_t target);
    void clear_cache(const std::string& name, const TrackedCache& tracked);
};

} // namespace loopguard

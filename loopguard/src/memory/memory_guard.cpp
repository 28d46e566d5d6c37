#include "loopguard/memory/memory_guard.h"

#include <cmath>

namespace loopguard {

std::string to_string(MemoryAlertType type) {
    switch (type) {
        case MemoryAlertType::CriticalMemory: return "critical_memory";
        case MemoryAlertType::MemoryLeak:     return "memory_leak";
    }
    return "unknown";
}

nlohmann::json MemoryAlert::to_json() const {
    nlohmann::json j{{"type", to_string(type)}};
    if (type == MemoryAlertType::CriticalMemory) {
        j["current"] = current_bytes;
        j["threshold"] = threshold;
    } else {
        j["growth_rate"] = growth_rate;
        nlohmann::json window = nlohmann::json::array();
        for (const auto& s : snapshots) {
            window.push_back({
                {"time", to_seconds(s.timestamp.time_since_epoch())},
                {"current", s.current_bytes},
                {"peak", s.peak_bytes}
            });
        }
        j["snapshots"] = std::move(window);
    }
    return j;
}

nlohmann::json MemoryStats::to_json() const {
    return nlohmann::json{
        {"current_memory", current_bytes},
        {"peak_memory", peak_bytes},
        {"gc_runs", gc_runs},
        {"uptime", format_uptime(uptime)},
        {"uptime_seconds", to_seconds(uptime)},
        {"tracked_caches", tracked_caches},
        {"snapshots", snapshots},
        {"monitoring", monitoring}
    };
}

std::string format_uptime(Duration uptime) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(uptime).count();
    const auto days = total / 86400;
    const auto hours = (total % 86400) / 3600;
    const auto minutes = (total % 3600) / 60;

    if (days > 0) {
        return std::to_string(days) + "d " + std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    return std::to_string(minutes) + "m";
}

// ============================================================================
// MemoryGuard
// ============================================================================

MemoryGuard::MemoryGuard(MemoryGuardConfig config, IEventLoop& loop, IMemoryMeter& meter,
                         std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , loop_(loop)
    , meter_(meter)
    , logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.memory"))
    , started_at_(loop.now()) {
    config_.validate().throw_if_invalid("memory guard");
}

MemoryGuard::~MemoryGuard() {
    stop_monitoring();
}

void MemoryGuard::start_monitoring() {
    if (monitoring_) {
        return;
    }
    monitoring_ = true;

    check_timer_ = loop_.create_repeating_timer(config_.check_interval, [this]() { perform_check(); });
    cache_timer_ = loop_.create_repeating_timer(config_.cache_check_interval, [this]() { check_cache_sizes(); });

    logger_->info("Memory guard started", {
        {"max_memory", format_bytes(config_.memory_limit)},
        {"critical_threshold", format_bytes(config_.critical_threshold)},
        {"check_interval", format_duration(config_.check_interval)}
    });
}

void MemoryGuard::stop_monitoring() {
    loop_.cancel_timer(check_timer_);
    loop_.cancel_timer(cache_timer_);
    loop_.cancel_timer(restart_timer_);
    check_timer_.reset();
    cache_timer_.reset();
    restart_timer_.reset();
    restart_pending_ = false;

    if (monitoring_) {
        monitoring_ = false;
        logger_->info("Memory guard stopped");
    }
}

void MemoryGuard::track_cache(const std::string& name, std::shared_ptr<ICacheMonitor> cache,
                              std::optional<size_t> max_size) {
    const size_t limit = max_size.value_or(config_.default_cache_limit);
    const bool replaced = caches_.count(name) != 0;
    caches_[name] = TrackedCache{std::move(cache), limit};

    logger_->debug(replaced ? "Cache re-registered" : "Cache registered", {
        {"cache", name},
        {"max_size", format_bytes(limit)}
    });
}

bool MemoryGuard::unregister_cache(const std::string& name) {
    return caches_.erase(name) > 0;
}

void MemoryGuard::on_memory_leak(MemoryAlertCallback callback) {
    if (callback) {
        leak_callbacks_.push_back(std::move(callback));
    }
}

void MemoryGuard::on_restart_requested(RestartCallback callback) {
    if (callback) {
        restart_callbacks_.push_back(std::move(callback));
    }
}

// ============================================================================
// Periodic checks
// ============================================================================

void MemoryGuard::perform_check() {
    MemorySnapshot snapshot;
    snapshot.timestamp = loop_.now();
    snapshot.current_bytes = meter_.current_bytes();
    snapshot.peak_bytes = meter_.peak_bytes();

    // Sampling always collects; only ladder collections count as gc runs
    meter_.collect();

    snapshots_.push_back(snapshot);
    while (snapshots_.size() > config_.snapshot_capacity) {
        snapshots_.pop_front();
    }

    const size_t current = snapshot.current_bytes;
    if (current > config_.critical_threshold) {
        handle_critical_memory(current);
    } else if (current > config_.warning_threshold) {
        handle_high_memory(current);
    } else if (current > config_.gc_threshold) {
        trigger_collection();
    }

    if (config_.leak_detection_enabled) {
        detect_leaks();
    }
}

void MemoryGuard::check_cache_sizes() {
    // Copy, so caches may unregister themselves
    const auto caches = caches_;
    for (const auto& [name, tracked] : caches) {
        size_t size = 0;
        try {
            size = tracked.cache->size_bytes();
        } catch (const std::exception& e) {
            logger_->error("Cache size query failed", {{"cache", name}, {"error", e.what()}});
            continue;
        }

        if (size > tracked.max_size) {
            logger_->warn("Cache size exceeded", {
                {"cache", name},
                {"current_size", format_bytes(size)},
                {"max_size", format_bytes(tracked.max_size)}
            });
            clean_cache(name, tracked, tracked.max_size);
        }
    }
}

// ============================================================================
// Threshold ladder
// ============================================================================

void MemoryGuard::handle_critical_memory(size_t current) {
    logger_->error("Critical memory usage - restart required", {
        {"current", format_bytes(current)},
        {"threshold", format_bytes(config_.critical_threshold)},
        {"uptime", format_uptime(loop_.now() - started_at_)}
    });

    MemoryAlert alert;
    alert.type = MemoryAlertType::CriticalMemory;
    alert.current_bytes = current;
    alert.threshold = config_.critical_threshold;
    notify(alert);

    // Copy, so caches may unregister themselves
    const auto caches = caches_;
    for (const auto& [name, tracked] : caches) {
        clear_cache(name, tracked);
    }

    meter_.collect();
    ++gc_runs_;

    schedule_restart();
}

void MemoryGuard::handle_high_memory(size_t current) {
    logger_->warn("High memory usage detected", {
        {"current", format_bytes(current)},
        {"threshold", format_bytes(config_.warning_threshold)},
        {"uptime", format_uptime(loop_.now() - started_at_)}
    });

    trigger_collection();

    // Copy, so caches may unregister themselves
    const auto caches = caches_;
    for (const auto& [name, tracked] : caches) {
        clean_cache(name, tracked, tracked.max_size / 2);
    }
}

void MemoryGuard::trigger_collection() {
    const size_t freed = meter_.collect();
    ++gc_runs_;

    if (freed > 1 * MiB) {
        logger_->info("Garbage collection completed", {
            {"freed", format_bytes(freed)},
            {"total_runs", std::to_string(gc_runs_)}
        });
    }
}

void MemoryGuard::detect_leaks() {
    if (snapshots_.size() < config_.leak_min_samples) {
        return;
    }

    const MemorySnapshot& first = snapshots_.front();
    const MemorySnapshot& last = snapshots_.back();

    const double elapsed = to_seconds(last.timestamp - first.timestamp);
    if (elapsed <= 0.0) {
        return;
    }

    const double growth = static_cast<double>(last.current_bytes) - static_cast<double>(first.current_bytes);
    const double growth_rate = growth / elapsed;

    if (growth_rate * 60.0 <= static_cast<double>(config_.leak_growth_per_minute)) {
        return;
    }

    logger_->warn("Potential memory leak detected", {
        {"growth_rate", format_bytes(static_cast<size_t>(growth_rate * 60.0)) + "/min"},
        {"total_growth", format_bytes(static_cast<size_t>(growth))},
        {"time_elapsed", std::to_string(static_cast<long long>(std::llround(elapsed))) + "s"}
    });

    MemoryAlert alert;
    alert.type = MemoryAlertType::MemoryLeak;
    alert.growth_rate = growth_rate;
    alert.snapshots.assign(snapshots_.begin(), snapshots_.end());
    notify(alert);
}

void MemoryGuard::schedule_restart() {
    if (restart_pending_) {
        return;
    }
    restart_pending_ = true;

    restart_timer_ = loop_.create_timer(config_.restart_delay, [this]() {
        restart_pending_ = false;
        restart_timer_.reset();

        logger_->fatal("Initiating graceful restart due to memory limit");
        const auto callbacks = restart_callbacks_;
        for (const auto& callback : callbacks) {
            try {
                callback();
            } catch (const std::exception& e) {
                logger_->error("Restart callback failed", {{"error", e.what()}});
            }
        }
    });
}

void MemoryGuard::notify(const MemoryAlert& alert) {
    // Callbacks may register further callbacks
    const auto callbacks = leak_callbacks_;
    for (const auto& callback : callbacks) {
        try {
            callback(alert);
        } catch (const std::exception& e) {
            logger_->error("Memory alert callback failed", {
                {"alert", to_string(alert.type)},
                {"error", e.what()}
            });
        }
    }
}

void MemoryGuard::clean_cache(const std::string& name, const TrackedCache& tracked, size_t target) {
    try {
        tracked.cache->clean(target);
    } catch (const std::exception& e) {
        logger_->error("Cache clean failed", {{"cache", name}, {"error", e.what()}});
    }
}

void MemoryGuard::clear_cache(const std::string& name, const TrackedCache& tracked) {
    try {
        tracked.cache->clear();
    } catch (const std::exception& e) {
        logger_->error("Cache clear failed", {{"cache", name}, {"error", e.what()}});
    }
}

// ============================================================================
// Stats
// ============================================================================

MemoryStats MemoryGuard::get_stats() const {
    MemoryStats stats;
    stats.current_bytes = meter_.current_bytes();
    stats.peak_bytes = meter_.peak_bytes();
    stats.gc_runs = gc_runs_;
    stats.uptime = loop_.now() - started_at_;
    stats.tracked_caches = caches_.size();
    stats.snapshots = snapshots_.size();
    stats.monitoring = monitoring_;
    return stats;
}

} // namespace loopguard

#include "loopguard/runtime/safety_runtime.h"

#include <iterator>

namespace loopguard {

namespace {

GuardConfig validated(GuardConfig config) {
    config.validate().throw_if_invalid("loopguard");
    return config;
}

} // namespace

SafetyRuntime::SafetyRuntime(GuardConfig config, IEventLoop& loop, IMemoryMeter& meter, SharedState& state,
                             std::shared_ptr<Logger> logger)
    : config_(validated(std::move(config)))
    , loop_(loop)
    , logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.runtime"))
    , memory_guard_(config_.memory, loop, meter)
    , sampler_(config_.sampler)
    , isolation_(config_.isolation, state, loop, meter) {
    memory_guard_.on_memory_leak([this](const MemoryAlert& alert) {
        ++memory_alerts_;
        logger_->warn("Memory alert", {{"type", to_string(alert.type)}});
    });
    memory_guard_.on_restart_requested([this]() {
        ++restart_requests_;
        logger_->error("Restart requested, waiting for supervisor");
    });
}

SafetyRuntime::~SafetyRuntime() {
    stop();
}

void SafetyRuntime::start() {
    if (running_) {
        return;
    }
    running_ = true;

    memory_guard_.start_monitoring();

    if (config_.sampler.enabled) {
        sampler_.enable([this](const BlockingEvent& event) {
            ++blocking_events_;
            logger_->warn("Event loop blocked", {
                {"duration_ms", std::to_string(
                    std::chrono::duration_cast<std::chrono::milliseconds>(event.duration).count())},
                {"file", event.call_frame.file},
                {"line", std::to_string(event.call_frame.line)},
                {"function", event.call_frame.function},
                {"consecutive_blocks", std::to_string(event.consecutive_blocks)}
            });
        }, loop_);
    }

    if (config_.isolation.enabled) {
        sweep_timer_ = loop_.create_repeating_timer(config_.isolation.leak_sweep_interval,
                                                    [this]() { sweep_contexts(); });
    }

    logger_->info("Safety runtime started", {
        {"sampler", config_.sampler.enabled ? "on" : "off"},
        {"isolation", config_.isolation.enabled ? "on" : "off"}
    });
}

void SafetyRuntime::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    sampler_.disable();
    memory_guard_.stop_monitoring();
    loop_.cancel_timer(sweep_timer_);
    sweep_timer_.reset();

    logger_->info("Safety runtime stopped");
}

void SafetyRuntime::sweep_contexts() {
    for (auto it = reported_leaks_.begin(); it != reported_leaks_.end();) {
        it = isolation_.has_context(*it) ? std::next(it) : reported_leaks_.erase(it);
    }

    for (const auto& leak : isolation_.check_context_leaks()) {
        if (!reported_leaks_.insert(leak.context_id).second) {
            continue;
        }
        ++leaked_contexts_;
        logger_->warn("Request context leaked", {
            {"context_id", leak.context_id},
            {"duration", std::to_string(static_cast<long long>(to_seconds(leak.duration))) + "s"},
            {"memory_growth", std::to_string(leak.memory_growth)}
        });
    }
}

nlohmann::json SafetyRuntime::health() const {
    return nlohmann::json{
        {"running", running_},
        {"memory", memory_guard_.get_stats().to_json()},
        {"sampler", sampler_.state().to_json()},
        {"isolation", {
            {"enabled", config_.isolation.enabled},
            {"active_contexts", isolation_.active_contexts()},
            {"static_violations", isolation_.violation_count()}
        }},
        {"counters", {
            {"blocking_events", blocking_events_},
            {"memory_alerts", memory_alerts_},
            {"leaked_contexts", leaked_contexts_},
            {"restart_requests", restart_requests_}
        }}
    };
}

} // namespace loopguard

#include "loopguard/runtime/manual_event_loop.h"

#include <algorithm>

namespace loopguard {

ManualEventLoop::ManualEventLoop(std::shared_ptr<Logger> logger)
    : logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.event_loop")) {
}

TimePoint ManualEventLoop::now() const {
    return clock_.now();
}

// ============================================================================
// Timer management
// ============================================================================

TimerHandle ManualEventLoop::create_timer(std::chrono::milliseconds delay, TimerCallback callback) {
    if (!callback) {
        throw TimerException("Timer callback cannot be null");
    }
    return add_timer(std::max(delay, std::chrono::milliseconds::zero()),
                     std::chrono::milliseconds::zero(), std::move(callback));
}

TimerHandle ManualEventLoop::create_repeating_timer(std::chrono::milliseconds interval, TimerCallback callback) {
    if (!callback) {
        throw TimerException("Timer callback cannot be null");
    }
    if (interval <= std::chrono::milliseconds::zero()) {
        throw TimerException("Timer interval must be positive");
    }
    return add_timer(interval, interval, std::move(callback));
}

bool ManualEventLoop::cancel_timer(const TimerHandle& handle) {
    if (!handle.is_valid()) {
        return false;
    }
    // Stale deadlines are skipped when they reach the top of the queue
    return timers_.erase(handle.id()) > 0;
}

size_t ManualEventLoop::active_timers() const {
    return timers_.size();
}

TimerHandle ManualEventLoop::add_timer(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                                       TimerCallback callback) {
    const size_t timer_id = next_timer_id_++;
    timers_.emplace(timer_id, Timer{interval, std::move(callback)});
    schedule(timer_id, clock_.now() + delay);

    logger_->trace("Timer created", {{"id", std::to_string(timer_id)},
                                     {"delay_ms", std::to_string(delay.count())},
                                     {"repeating", interval.count() > 0 ? "true" : "false"}});
    return TimerHandle(timer_id);
}

void ManualEventLoop::schedule(size_t id, TimePoint fire_time) {
    deadlines_.push(Deadline{fire_time, next_sequence_++, id});
}

// ============================================================================
// Time control
// ============================================================================

size_t ManualEventLoop::advance_by(Duration delta) {
    const TimePoint target = clock_.now() + delta;
    size_t processed = 0;

    while (!deadlines_.empty() && deadlines_.top().fire_time <= target) {
        const Deadline next = deadlines_.top();
        deadlines_.pop();

        if (timers_.find(next.id) == timers_.end()) {
            continue;
        }

        if (next.fire_time > clock_.now()) {
            clock_.set(next.fire_time);
        }
        if (fire(next.id)) {
            ++processed;
        }
    }

    clock_.set(std::max(clock_.now(), target));
    return processed;
}

void ManualEventLoop::stall(Duration delta) {
    clock_.advance(delta);
}

size_t ManualEventLoop::run_due() {
    const TimePoint current = clock_.now();
    std::vector<size_t> expired;

    while (!deadlines_.empty() && deadlines_.top().fire_time <= current) {
        const size_t id = deadlines_.top().id;
        deadlines_.pop();
        if (timers_.find(id) != timers_.end()) {
            expired.push_back(id);
        }
    }

    size_t processed = 0;
    for (size_t id : expired) {
        // An earlier callback in this batch may have cancelled it
        if (timers_.find(id) != timers_.end() && fire(id)) {
            ++processed;
        }
    }
    return processed;
}

bool ManualEventLoop::fire(size_t id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }

    // Copy out: the callback may cancel its own timer or create new ones
    TimerCallback callback = it->second.callback;
    const auto interval = it->second.interval;
    if (interval == std::chrono::milliseconds::zero()) {
        timers_.erase(it);
    }

    try {
        callback();
    } catch (const std::exception& e) {
        logger_->error("Timer callback error", {{"id", std::to_string(id)}, {"error", e.what()}});
    }

    if (interval > std::chrono::milliseconds::zero() && timers_.find(id) != timers_.end()) {
        schedule(id, clock_.now() + interval);
    }
    return true;
}

} // namespace loopguard

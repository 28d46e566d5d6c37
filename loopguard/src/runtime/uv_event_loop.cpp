#include "loopguard/runtime/uv_event_loop.h"

#include <algorithm>

namespace loopguard {

UvEventLoop::UvEventLoop(std::shared_ptr<Logger> logger)
    : owned_loop_(std::make_unique<uv_loop_t>())
    , logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.event_loop")) {

    int rc = uv_loop_init(owned_loop_.get());
    if (rc != 0) {
        throw BackendInitializationException("libuv", uv_strerror(rc));
    }
    loop_ = owned_loop_.get();
}

UvEventLoop::UvEventLoop(uv_loop_t* loop, std::shared_ptr<Logger> logger)
    : loop_(loop)
    , logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.event_loop")) {

    if (loop_ == nullptr) {
        throw BackendInitializationException("libuv", "loop handle is null");
    }
}

UvEventLoop::~UvEventLoop() {
    auto pending = std::move(timers_);
    timers_.clear();
    for (auto& [id, timer] : pending) {
        close_timer(std::move(timer));
    }

    if (owned_loop_) {
        // Let the close callbacks run so every UvTimer is released
        uv_run(loop_, UV_RUN_DEFAULT);
        int rc = uv_loop_close(loop_);
        if (rc != 0) {
            logger_->warn("libuv loop closed with live handles", {{"error", uv_strerror(rc)}});
        }
    }
}

TimePoint UvEventLoop::now() const {
    return Clock::now();
}

// ============================================================================
// Timer management
// ============================================================================

TimerHandle UvEventLoop::create_timer(std::chrono::milliseconds delay, TimerCallback callback) {
    if (!callback) {
        throw TimerException("Timer callback cannot be null");
    }
    return start_timer(std::max(delay, std::chrono::milliseconds::zero()),
                       std::chrono::milliseconds::zero(), std::move(callback));
}

TimerHandle UvEventLoop::create_repeating_timer(std::chrono::milliseconds interval, TimerCallback callback) {
    if (!callback) {
        throw TimerException("Timer callback cannot be null");
    }
    if (interval <= std::chrono::milliseconds::zero()) {
        throw TimerException("Timer interval must be positive");
    }
    return start_timer(interval, interval, std::move(callback));
}

bool UvEventLoop::cancel_timer(const TimerHandle& handle) {
    if (!handle.is_valid()) {
        return false;
    }

    auto it = timers_.find(handle.id());
    if (it == timers_.end()) {
        return false;
    }

    auto timer = std::move(it->second);
    timers_.erase(it);
    close_timer(std::move(timer));
    return true;
}

size_t UvEventLoop::active_timers() const {
    return timers_.size();
}

TimerHandle UvEventLoop::start_timer(std::chrono::milliseconds delay, std::chrono::milliseconds repeat,
                                     TimerCallback callback) {
    auto timer = std::make_unique<UvTimer>();
    timer->owner = this;
    timer->id = next_timer_id_++;
    timer->repeating = repeat.count() > 0;
    timer->callback = std::move(callback);

    int rc = uv_timer_init(loop_, &timer->handle);
    if (rc != 0) {
        throw TimerException(std::string("uv_timer_init: ") + uv_strerror(rc));
    }
    timer->handle.data = timer.get();

    rc = uv_timer_start(&timer->handle, &UvEventLoop::on_timer,
                        static_cast<uint64_t>(delay.count()),
                        static_cast<uint64_t>(repeat.count()));
    if (rc != 0) {
        // The handle is initialized, so it must go through uv_close
        close_timer(std::move(timer));
        throw TimerException(std::string("uv_timer_start: ") + uv_strerror(rc));
    }

    const size_t id = timer->id;
    timers_.emplace(id, std::move(timer));
    return TimerHandle(id);
}

void UvEventLoop::close_timer(std::unique_ptr<UvTimer> timer) {
    uv_timer_stop(&timer->handle);
    // Ownership passes to libuv until on_close runs
    UvTimer* raw = timer.release();
    uv_close(reinterpret_cast<uv_handle_t*>(&raw->handle), &UvEventLoop::on_close);
}

void UvEventLoop::on_timer(uv_timer_t* handle) {
    auto* timer = static_cast<UvTimer*>(handle->data);
    UvEventLoop* self = timer->owner;
    const size_t id = timer->id;

    // Copy out: the callback may cancel this timer, which frees `timer`
    TimerCallback callback = timer->callback;
    try {
        callback();
    } catch (const std::exception& e) {
        self->logger_->error("Timer callback error", {{"id", std::to_string(id)}, {"error", e.what()}});
    }

    if (!timer->repeating || uv_is_closing(reinterpret_cast<uv_handle_t*>(handle))) {
        auto it = self->timers_.find(id);
        if (it != self->timers_.end()) {
            auto finished = std::move(it->second);
            self->timers_.erase(it);
            self->close_timer(std::move(finished));
        }
    }
}

void UvEventLoop::on_close(uv_handle_t* handle) {
    delete static_cast<UvTimer*>(handle->data);
}

// ============================================================================
// Loop control
// ============================================================================

void UvEventLoop::run() {
    uv_run(loop_, UV_RUN_DEFAULT);
}

bool UvEventLoop::run_once() {
    return uv_run(loop_, UV_RUN_ONCE) != 0;
}

void UvEventLoop::stop() {
    uv_stop(loop_);
}

} // namespace loopguard

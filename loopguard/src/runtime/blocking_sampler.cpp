#include "loopguard/runtime/blocking_sampler.h"

#include <algorithm>

namespace loopguard {

nlohmann::json BlockingEvent::to_json() const {
    return nlohmann::json{
        {"duration", to_seconds(duration)},
        {"file", call_frame.file},
        {"line", call_frame.line},
        {"function", call_frame.function},
        {"sampling_interval", to_seconds(sampling_interval)},
        {"consecutive_blocks", consecutive_blocks}
    };
}

nlohmann::json SamplerState::to_json() const {
    return nlohmann::json{
        {"threshold", to_seconds(threshold)},
        {"sampling_interval", to_seconds(sampling_interval)},
        {"enabled", enabled},
        {"consecutive_blocking_count", consecutive_block_count},
        {"max_consecutive_blocks", max_consecutive_blocks}
    };
}

BlockingSampler::BlockingSampler(SamplerConfig config, std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.sampler"))
    , last_frame_{"unknown", 0, "unknown"}
    , max_consecutive_blocks_(std::max(1, config_.max_consecutive_blocks)) {
    config_.validate().throw_if_invalid("blocking sampler");
}

BlockingSampler::~BlockingSampler() {
    disable();
}

void BlockingSampler::enable(BlockingCallback on_violation, IEventLoop& loop) {
    if (enabled_) {
        disable();
    }

    callback_ = std::move(on_violation);
    loop_ = &loop;
    enabled_ = true;
    last_activity_ = loop.now();
    consecutive_blocks_ = 0;

    timer_ = loop.create_repeating_timer(config_.sampling_interval, [this]() { sample(); });

    logger_->debug("Blocking sampler enabled", {
        {"threshold", format_duration(config_.threshold)},
        {"sampling_interval", format_duration(config_.sampling_interval)}
    });
}

void BlockingSampler::disable() {
    if (loop_ != nullptr) {
        loop_->cancel_timer(timer_);
    }
    timer_.reset();
    loop_ = nullptr;
    consecutive_blocks_ = 0;

    if (enabled_) {
        enabled_ = false;
        logger_->debug("Blocking sampler disabled");
    }
}

void BlockingSampler::record_activity(std::source_location location) {
    if (!enabled_ || loop_ == nullptr) {
        return;
    }
    last_activity_ = loop_->now();
    last_frame_ = SourceLocation{location.file_name(), location.line(), location.function_name()};
    consecutive_blocks_ = 0;
}

void BlockingSampler::sample() {
    if (!enabled_ || loop_ == nullptr) {
        return;
    }

    const Duration elapsed = loop_->now() - last_activity_;
    if (elapsed > config_.threshold) {
        ++consecutive_blocks_;
        // A single late tick is noise; report only sustained stalls
        if (consecutive_blocks_ >= max_consecutive_blocks_) {
            report(elapsed);
            consecutive_blocks_ = 0;
        }
    } else {
        consecutive_blocks_ = 0;
    }
}

void BlockingSampler::report(Duration elapsed) {
    BlockingEvent event;
    event.duration = elapsed;
    event.call_frame = last_frame_;
    event.sampling_interval = config_.sampling_interval;
    event.consecutive_blocks = consecutive_blocks_;

    logger_->debug("Event loop blocked", {
        {"duration_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count())},
        {"frame", last_frame_.to_string()}
    });

    if (!callback_) {
        return;
    }
    try {
        callback_(event);
    } catch (const std::exception& e) {
        logger_->error("Blocking callback failed", {{"error", e.what()}});
    }
}

void BlockingSampler::set_max_consecutive_blocks(int count) {
    max_consecutive_blocks_ = std::max(1, count);
}

SamplerState BlockingSampler::state() const {
    SamplerState s;
    s.threshold = config_.threshold;
    s.sampling_interval = config_.sampling_interval;
    s.last_activity = last_activity_;
    s.consecutive_block_count = consecutive_blocks_;
    s.max_consecutive_blocks = max_consecutive_blocks_;
    s.enabled = enabled_;
    return s;
}

} // namespace loopguard

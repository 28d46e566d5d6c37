#pragma once

#include "loopguard/analysis/violation.h"
#include "loopguard/config/guard_config.h"
#include "loopguard/core/clock.h"
#include "loopguard/runtime/event_loop.h"
#include "loopguard/utils/logger.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>

namespace loopguard {

/**
 * @brief Report of a stall seen by the sampler
 */
struct BlockingEvent {
    Duration duration{};                          ///< Time since the last recorded activity
    SourceLocation call_frame;                    ///< Where activity was last recorded
    std::chrono::milliseconds sampling_interval{0};
    int consecutive_blocks = 0;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct SamplerState {
    std::chrono::milliseconds threshold{0};
    std::chrono::milliseconds sampling_interval{0};
    TimePoint last_activity;
    int consecutive_block_count = 0;
    int max_consecutive_blocks = 0;
    bool enabled = false;

    [[nodiscard]] nlohmann::json to_json() const;
};

using BlockingCallback = std::function<void(const BlockingEvent&)>;

/**
 * @brief Detects event loop stalls with a periodic sampling timer
 *
 * Application code calls record_activity() (or runs through wrap()) when
 * it yields back to the loop. On every sampling tick the time since the last
 * activity is compared with the threshold. A tick over the threshold counts
 * as one block; after `max_consecutive_blocks` of them in a row the callback
 * receives a BlockingEvent and the count starts again. Any tick under the
 * threshold resets the count.
 *
 * The sampling timer itself runs on the loop, so a fully blocked loop is reported
 * once it resumes.
 */
class BlockingSampler {
public:
    /**
     * @throws ConfigurationException if threshold or interval is not positive
     */
    explicit BlockingSampler(SamplerConfig config = {}, std::shared_ptr<Logger> logger = nullptr);
    ~BlockingSampler();

    BlockingSampler(const BlockingSampler&) = delete;
    BlockingSampler& operator=(const BlockingSampler&) = delete;

    /**
     * @brief Start sampling `loop`; re-enabling replaces the previous callback and loop
     */
    void enable(BlockingCallback on_violation, IEventLoop& loop);

    /**
     * @brief Stop sampling and reset the counter; safe to call repeatedly
     */
    void disable();

    /**
     * @brief Mark the loop as responsive; ignored while disabled
     */
    void record_activity(std::source_location location = std::source_location::current());

    /**
     * @brief One sampling tick; called by the timer
     */
    void sample();

    /**
     * @brief Change the report trigger; values below 1 become 1
     */
    void set_max_consecutive_blocks(int count);

    [[nodiscard]] SamplerState state() const;
    [[nodiscard]] bool is_enabled() const noexcept { return enabled_; }

    /**
     * @brief Wrap a callable so activity is recorded before and after it runs
     */
    template<typename F>
    [[nodiscard]] auto wrap(F fn, std::source_location location = std::source_location::current()) {
        return [this, fn = std::move(fn), location](auto&&... args) mutable {
            record_activity(location);
            if constexpr (std::is_void_v<std::invoke_result_t<F&, decltype(args)...>>) {
                std::invoke(fn, std::forward<decltype(args)>(args)...);
                record_activity(location);
            } else {
                auto result = std::invoke(fn, std::forward<decltype(args)>(args)...);
                record_activity(location);
                return result;
            }
        };
    }

private:
    SamplerConfig config_;
    std::shared_ptr<Logger> logger_;

    IEventLoop* loop_ = nullptr;
    TimerHandle timer_;
    BlockingCallback callback_;

    TimePoint last_activity_;
    SourceLocation last_frame_;
    int consecutive_blocks_ = 0;
    int max_consecutive_blocks_ = 5;
    bool enabled_ = false;

    void report(Duration elapsed);
};

} // namespace loopguard

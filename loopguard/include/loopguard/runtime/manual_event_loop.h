#pragma once

#include "loopguard/runtime/event_loop.h"
#include "loopguard/utils/logger.h"

#include <memory>
#include <queue>
#include <unordered_map>
#include <vector>

namespace loopguard {

/**
 * @brief Deterministic event loop driven by virtual time
 *
 * Time only moves through advance_by() and stall(). advance_by() walks the
 * timer queue in fire-time order, moving the clock to each timer's deadline
 * before running it. stall() moves the clock without running anything,
 * which is what a blocking call looks like from the loop's point of view.
 *
 * @code
 * ManualEventLoop loop;
 * sampler.enable(on_block, loop);
 * loop.stall(500ms);        // user code blocked the loop
 * loop.run_due();           // delayed tick observes the gap
 * @endcode
 */
class ManualEventLoop : public IEventLoop {
public:
    explicit ManualEventLoop(std::shared_ptr<Logger> logger = nullptr);

    // IEventLoop
    [[nodiscard]] TimePoint now() const override;
    TimerHandle create_timer(std::chrono::milliseconds delay, TimerCallback callback) override;
    TimerHandle create_repeating_timer(std::chrono::milliseconds interval, TimerCallback callback) override;
    bool cancel_timer(const TimerHandle& handle) override;
    [[nodiscard]] size_t active_timers() const override;

    /**
     * @brief Advance virtual time, firing every timer that falls due on the way
     * @param delta Amount of virtual time to elapse
     * @return Number of callbacks executed
     */
    size_t advance_by(Duration delta);

    /**
     * @brief Move the clock forward without servicing timers
     * @param delta Duration of the simulated stall
     */
    void stall(Duration delta);

    /**
     * @brief Fire every timer already due at the current time, once
     *
     * Repeating timers are rescheduled relative to the current time, so a
     * long stall yields a single late tick rather than a burst of catch-up
     * ticks.
     *
     * @return Number of callbacks executed
     */
    size_t run_due();

    [[nodiscard]] ManualClock& clock() noexcept { return clock_; }

private:
    struct Timer {
        std::chrono::milliseconds interval;  // 0 for one-shot timers
        TimerCallback callback;
    };

    struct Deadline {
        TimePoint fire_time;
        size_t sequence;
        size_t id;

        bool operator>(const Deadline& other) const {
            if (fire_time != other.fire_time) {
                return fire_time > other.fire_time;
            }
            return sequence > other.sequence;
        }
    };

    ManualClock clock_;
    std::shared_ptr<Logger> logger_;

    std::unordered_map<size_t, Timer> timers_;
    std::priority_queue<Deadline, std::vector<Deadline>, std::greater<Deadline>> deadlines_;
    size_t next_timer_id_ = 1;
    size_t next_sequence_ = 0;

    TimerHandle add_timer(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                          TimerCallback callback);
    void schedule(size_t id, TimePoint fire_time);
    bool fire(size_t id);
};

} // namespace loopguard

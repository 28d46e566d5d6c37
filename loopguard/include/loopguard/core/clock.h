#pragma once

#include <chrono>

namespace loopguard {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

/**
 * @brief Monotonic time source
 */
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SteadyClock : public IClock {
public:
    [[nodiscard]] TimePoint now() const override { return Clock::now(); }
};

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(TimePoint start = TimePoint{}) : now_(start) {}

    [[nodiscard]] TimePoint now() const override { return now_; }

    void advance(Duration delta) { now_ += delta; }
    void set(TimePoint when) { now_ = when; }

private:
    TimePoint now_;
};

/**
 * @brief Seconds as a double, for reports and JSON
 */
template<typename Rep, typename Period>
[[nodiscard]] double to_seconds(std::chrono::duration<Rep, Period> d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace loopguard

#pragma once

#include "loopguard/runtime/event_loop.h"
#include "loopguard/utils/logger.h"

#include <uv.h>

#include <memory>
#include <unordered_map>

namespace loopguard {

/**
 * @brief IEventLoop backed by a libuv loop
 *
 * Either owns a fresh `uv_loop_t` or borrows the host server's loop, so the
 * safety timers share the loop that serves requests.
 */
class UvEventLoop : public IEventLoop {
public:
    /**
     * @brief Create and own a new libuv loop
     * @throws BackendInitializationException if uv_loop_init fails
     */
    explicit UvEventLoop(std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Attach to an existing loop owned by the caller
     * @param loop Borrowed loop; must outlive this object
     */
    explicit UvEventLoop(uv_loop_t* loop, std::shared_ptr<Logger> logger = nullptr);

    ~UvEventLoop() override;

    UvEventLoop(const UvEventLoop&) = delete;
    UvEventLoop& operator=(const UvEventLoop&) = delete;

    // IEventLoop
    [[nodiscard]] TimePoint now() const override;
    TimerHandle create_timer(std::chrono::milliseconds delay, TimerCallback callback) override;
    TimerHandle create_repeating_timer(std::chrono::milliseconds interval, TimerCallback callback) override;
    bool cancel_timer(const TimerHandle& handle) override;
    [[nodiscard]] size_t active_timers() const override;

    /**
     * @brief Run until stop() is called or no active handles remain
     */
    void run();

    /**
     * @brief Run a single loop iteration
     * @return true if more callbacks are pending
     */
    bool run_once();

    void stop();

    [[nodiscard]] uv_loop_t* native_handle() noexcept { return loop_; }

private:
    struct UvTimer {
        uv_timer_t handle;
        UvEventLoop* owner = nullptr;
        size_t id = 0;
        bool repeating = false;
        TimerCallback callback;
    };

    uv_loop_t* loop_ = nullptr;
    std::unique_ptr<uv_loop_t> owned_loop_;
    std::shared_ptr<Logger> logger_;

    std::unordered_map<size_t, std::unique_ptr<UvTimer>> timers_;
    size_t next_timer_id_ = 1;

    TimerHandle start_timer(std::chrono::milliseconds delay, std::chrono::milliseconds repeat,
                            TimerCallback callback);
    void close_timer(std::unique_ptr<UvTimer> timer);

    static void on_timer(uv_timer_t* handle);
    static void on_close(uv_handle_t* handle);
};

} // namespace loopguard

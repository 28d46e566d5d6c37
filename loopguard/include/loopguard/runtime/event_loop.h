#pragma once

#include "loopguard/core/clock.h"
#include "loopguard/core/exceptions.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace loopguard {

// ============================================================================
// Event loop core types
// ============================================================================

/**
 * @brief Timer callback function signature
 */
using TimerCallback = std::function<void()>;

/**
 * @brief Timer handle for managing scheduled timers
 */
class TimerHandle {
public:
    TimerHandle() = default;
    explicit TimerHandle(size_t id) : id_(id), valid_(true) {}

    /**
     * @brief Forget the timer without cancelling it on the loop
     */
    void reset() noexcept { id_ = 0; valid_ = false; }

    /**
     * @brief Check if the handle refers to a timer
     * @return true if the handle was issued by a loop and not reset
     */
    [[nodiscard]] bool is_valid() const noexcept { return valid_; }

    /**
     * @brief Get timer ID
     * @return Timer identifier
     */
    [[nodiscard]] size_t id() const noexcept { return id_; }

private:
    size_t id_ = 0;
    bool valid_ = false;
};

// ============================================================================
// Scheduler interface
// ============================================================================

/**
 * @brief The slice of an event loop that the safety components need
 *
 * Everything in loopguard runs as timer callbacks on the loop it watches.
 * Implementations are single-threaded: all methods must be called from the
 * loop thread.
 *
 * **Available Implementations**:
 * - UvEventLoop: libuv
 * - ManualEventLoop: virtual time, advanced explicitly
 */
class IEventLoop : public IClock {
public:
    ~IEventLoop() override = default;

    /**
     * @brief Create a one-shot timer
     * @param delay Delay before firing
     * @param callback Function to call when timer fires
     * @return Timer handle
     * @throws TimerException if the callback is empty
     */
    virtual TimerHandle create_timer(std::chrono::milliseconds delay, TimerCallback callback) = 0;

    /**
     * @brief Create a repeating timer
     * @param interval Repeat interval, must be positive
     * @param callback Function to call on each interval
     * @return Timer handle
     * @throws TimerException if the callback is empty or the interval is not positive
     */
    virtual TimerHandle create_repeating_timer(std::chrono::milliseconds interval, TimerCallback callback) = 0;

    /**
     * @brief Cancel a timer
     * @param handle Timer handle to cancel
     * @return true if the timer was pending and is now cancelled
     */
    virtual bool cancel_timer(const TimerHandle& handle) = 0;

    /**
     * @brief Number of timers still scheduled
     */
    [[nodiscard]] virtual size_t active_timers() const = 0;
};

// ============================================================================
// Event loop exceptions
// ============================================================================

/**
 * @brief Base exception for event loop related errors
 */
class EventLoopException : public LoopguardException {
public:
    explicit EventLoopException(const std::string& message) : LoopguardException(message) {}
};

/**
 * @brief Exception thrown when the loop backend cannot be initialized
 */
class BackendInitializationException : public EventLoopException {
public:
    BackendInitializationException(const std::string& backend, const std::string& reason)
        : EventLoopException("Failed to initialize " + backend + " backend: " + reason) {}
};

/**
 * @brief Exception thrown when timer operations fail
 */
class TimerException : public EventLoopException {
public:
    explicit TimerException(const std::string& message)
        : EventLoopException("Timer operation failed: " + message) {}
};

} // namespace loopguard

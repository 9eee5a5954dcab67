#pragma once

/// @file timer_queue.hpp
/// @brief Host-pumped timer queue backing every suspension point of the
/// action pipeline (delays, WAIT, detached async actions).

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace nrt::foundation {

using TimerId = uint64_t;

/// Single-threaded cooperative timer queue.
///
/// Time only moves when the host calls advance(). Due callbacks run in
/// due-time order and FIFO among equal due times. A callback may schedule
/// or cancel other timers; timers it schedules with zero delay run in the
/// same advance() call.
///
/// Usage:
/// @code
///   TimerQueue timers;
///   timers.schedule(std::chrono::milliseconds(500), [] { ... });
///   timers.advance(std::chrono::milliseconds(16));  // once per frame
/// @endcode
class TimerQueue {
public:
    using Callback = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    TimerQueue() = default;

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// Run @p fn once @p delay has elapsed. Negative delays count as zero.
    TimerId schedule(Duration delay, Callback fn);

    /// Drop a pending timer. Returns false when it already ran or never existed.
    bool cancel(TimerId id);

    /// Move the clock forward and run everything that became due.
    /// @return Number of callbacks run.
    std::size_t advance(Duration elapsed);

    /// Run callbacks due at the current time without moving the clock.
    std::size_t runDue() { return advance(Duration::zero()); }

    /// Advance straight to each pending due time until the queue is empty
    /// or @p limit callbacks ran.
    std::size_t drain(std::size_t limit = 10000);

    void clear() { pending_.clear(); }

    [[nodiscard]] std::size_t pendingCount() const noexcept { return pending_.size(); }

    [[nodiscard]] Duration now() const noexcept { return now_; }

private:
    /// (due time, sequence) keeps FIFO order among equal due times.
    using Key = std::pair<Duration, uint64_t>;

    struct Entry {
        TimerId id = 0;
        Callback fn;
    };

    std::map<Key, Entry> pending_;
    Duration now_{0};
    uint64_t nextSequence_ = 0;
    TimerId nextId_ = 1;
};

} // namespace nrt::foundation

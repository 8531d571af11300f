// =================================================================
// include/Sieve/EventLoop.hpp
// =================================================================
// Header for the single-threaded task and timer queue.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <utility>

namespace Sieve {

/**
 * @brief Single-threaded queue of immediate tasks and delayed timers
 *
 * All asynchronous work of the loader and the job poller runs here, one task
 * at a time. Tasks due at the same instant run in the order they were
 * scheduled. In manual-clock mode time only moves through advance() or
 * runUntilIdle(), which makes retry and backoff behaviour reproducible.
 */
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    /**
     * @brief Construct an event loop
     * @param manual_clock Use a virtual clock starting at zero instead of steady_clock
     */
    explicit EventLoop(bool manual_clock = false);

    /**
     * @brief Queue a task to run as soon as the loop is driven
     * @return Identifier usable with cancel()
     */
    TimerId post(Task task);

    /**
     * @brief Queue a task to run after a delay
     * @param delay Delay relative to now()
     * @param task Task to run
     * @return Identifier usable with cancel()
     */
    TimerId schedule(std::chrono::milliseconds delay, Task task);

    /**
     * @brief Remove a task that has not run yet
     * @return true if the task was pending and is now removed
     */
    bool cancel(TimerId id);

    /**
     * @brief Run every task that is due at the current time
     *
     * Tasks posted by running tasks are drained in the same call.
     *
     * @return Number of tasks executed
     */
    size_t runPending();

    /**
     * @brief Run until no task or timer remains
     *
     * Sleeps until the next timer in real-clock mode and jumps the virtual
     * clock in manual-clock mode.
     *
     * @return Number of tasks executed
     */
    size_t runUntilIdle();

    /**
     * @brief Move time forward and run everything that became due
     * @param delay Amount of time to move
     * @return Number of tasks executed
     */
    size_t advance(std::chrono::milliseconds delay);

    Clock::time_point now() const;

    bool hasPending() const { return !m_queue.empty(); }
    size_t pendingCount() const { return m_queue.size(); }
    bool isManualClock() const { return m_manual_clock; }

    /**
     * @brief Delay until the earliest pending task, zero if one is already due
     */
    std::chrono::milliseconds timeUntilNext() const;

private:
    using QueueKey = std::pair<Clock::time_point, TimerId>;

    bool m_manual_clock;
    Clock::time_point m_manual_now;
    TimerId m_next_id = 1;

    std::set<QueueKey> m_queue;               ///< Ordered by due time, then by id
    std::map<TimerId, Task> m_tasks;
    std::map<TimerId, Clock::time_point> m_due_times;

    /**
     * @brief Pop and run the earliest task if it is due at or before the limit
     * @return true if a task ran
     */
    bool runNextDue(Clock::time_point limit);
};

} // namespace Sieve

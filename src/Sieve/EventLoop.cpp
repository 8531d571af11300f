// =================================================================
// src/Sieve/EventLoop.cpp
// =================================================================
// Implementation for the single-threaded task and timer queue.

#include "Sieve/EventLoop.hpp"
#include <thread>

namespace Sieve {

EventLoop::EventLoop(bool manual_clock)
    : m_manual_clock(manual_clock),
      m_manual_now(Clock::time_point{}) {}

EventLoop::TimerId EventLoop::post(Task task) {
    return schedule(std::chrono::milliseconds(0), std::move(task));
}

EventLoop::TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }

    TimerId id = m_next_id++;
    Clock::time_point due = now() + delay;

    m_queue.insert({due, id});
    m_tasks[id] = std::move(task);
    m_due_times[id] = due;
    return id;
}

bool EventLoop::cancel(TimerId id) {
    auto due_it = m_due_times.find(id);
    if (due_it == m_due_times.end()) {
        return false;
    }

    m_queue.erase({due_it->second, id});
    m_tasks.erase(id);
    m_due_times.erase(due_it);
    return true;
}

size_t EventLoop::runPending() {
    size_t executed = 0;
    while (runNextDue(now())) {
        executed++;
    }
    return executed;
}

size_t EventLoop::runUntilIdle() {
    size_t executed = 0;

    while (!m_queue.empty()) {
        Clock::time_point next_due = m_queue.begin()->first;

        if (m_manual_clock) {
            if (next_due > m_manual_now) {
                m_manual_now = next_due;
            }
        } else if (next_due > Clock::now()) {
            std::this_thread::sleep_until(next_due);
        }

        executed += runPending();
    }

    return executed;
}

size_t EventLoop::advance(std::chrono::milliseconds delay) {
    if (!m_manual_clock) {
        std::this_thread::sleep_for(delay);
        return runPending();
    }

    Clock::time_point target = m_manual_now + delay;
    size_t executed = 0;

    while (!m_queue.empty() && m_queue.begin()->first <= target) {
        if (m_queue.begin()->first > m_manual_now) {
            m_manual_now = m_queue.begin()->first;
        }
        if (runNextDue(m_manual_now)) {
            executed++;
        }
    }

    m_manual_now = target;
    return executed;
}

EventLoop::Clock::time_point EventLoop::now() const {
    return m_manual_clock ? m_manual_now : Clock::now();
}

std::chrono::milliseconds EventLoop::timeUntilNext() const {
    if (m_queue.empty()) {
        return std::chrono::milliseconds(0);
    }

    auto remaining = m_queue.begin()->first - now();
    if (remaining.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(remaining);
}

bool EventLoop::runNextDue(Clock::time_point limit) {
    if (m_queue.empty()) {
        return false;
    }

    QueueKey key = *m_queue.begin();
    if (key.first > limit) {
        return false;
    }

    // Remove before running so the task may schedule or cancel freely
    m_queue.erase(m_queue.begin());
    Task task = std::move(m_tasks[key.second]);
    m_tasks.erase(key.second);
    m_due_times.erase(key.second);

    if (task) {
        task();
    }
    return true;
}

} // namespace Sieve

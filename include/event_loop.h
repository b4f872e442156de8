#pragma once

#include "common.h"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace job_diary {

/**
 * @brief Single-threaded scheduler that owns all session state mutation
 *
 * Tasks run one at a time, in post order, on the thread that calls run()
 * or run_until_idle(). post() and post_delayed() are safe from any thread;
 * network and audio threads only ever reach components through post().
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using NowFn = std::function<TimePoint()>;

    /**
     * @param now Clock source; defaults to steady_clock. Tests inject a manual clock.
     */
    explicit EventLoop(NowFn now = nullptr);

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task to run after everything already queued
    void post(Task task);

    /// Queue a task to run once delay_ms has elapsed on the loop clock
    TimerId post_delayed(int delay_ms, Task task);

    /// Cancel a pending timer. Unknown or fired ids are ignored.
    void cancel(TimerId id);

    /// Block running tasks until stop() is called
    void run();

    /// Ask run() to return after the current task
    void stop();

    /**
     * @brief Run ready tasks and due timers until none remain
     * @return Number of tasks executed
     */
    size_t run_until_idle();

    size_t pending_timers() const;
    TimePoint now() const;

private:
    using TimerKey = std::pair<TimePoint, TimerId>;

    void promote_due_timers_locked(TimePoint now);
    void execute(Task& task);

    NowFn now_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> ready_;
    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, TimePoint> timer_deadlines_;
    TimerId next_timer_id_ = 1;
    bool stopped_ = false;
};

} // namespace job_diary

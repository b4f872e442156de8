#include "event_loop.h"
#include "logger.h"
#include <exception>

namespace job_diary {

EventLoop::EventLoop(NowFn now) : now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

TimePoint EventLoop::now() const {
    return now_();
}

void EventLoop::post(Task task) {
    if (!task) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::post_delayed(int delay_ms, Task task) {
    TimePoint deadline = now_() + Duration(delay_ms < 0 ? 0 : delay_ms);
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_.emplace(TimerKey(deadline, id), std::move(task));
        timer_deadlines_[id] = deadline;
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) return;
    timers_.erase(TimerKey(it->second, id));
    timer_deadlines_.erase(it);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::pending_timers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventLoop::promote_due_timers_locked(TimePoint now) {
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto it = timers_.begin();
        timer_deadlines_.erase(it->first.second);
        ready_.push_back(std::move(it->second));
        timers_.erase(it);
    }
}

void EventLoop::execute(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        Logger::error(std::string("Event loop task threw: ") + e.what());
    }
}

size_t EventLoop::run_until_idle() {
    size_t executed = 0;
    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            promote_due_timers_locked(now_());
            if (ready_.empty()) break;
            task = std::move(ready_.front());
            ready_.pop_front();
        }
        execute(task);
        executed++;
    }
    return executed;
}

void EventLoop::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                if (stopped_) return;
                promote_due_timers_locked(now_());
                if (!ready_.empty()) break;
                if (timers_.empty()) {
                    cv_.wait(lock);
                } else {
                    auto wait = timers_.begin()->first.first - now_();
                    cv_.wait_for(lock, wait);
                }
            }
            task = std::move(ready_.front());
            ready_.pop_front();
        }
        execute(task);
    }
}

} // namespace job_diary

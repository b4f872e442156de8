#include "task_runner.h"
#include "logger.h"
#include <chrono>
#include <exception>

namespace job_diary {

TaskRunner::TaskRunner(size_t workers) : running_(true) {
    if (workers == 0) workers = 1;
    for (size_t i = 0; i < workers; ++i) {
        worker_threads_.emplace_back(&TaskRunner::worker_thread, this);
    }
}

TaskRunner::~TaskRunner() {
    shutdown();
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool TaskRunner::submit(Job job) {
    if (!running_) {
        Logger::warn("TaskRunner is shut down, dropping job");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

bool TaskRunner::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.empty() && active_jobs_ == 0;
}

size_t TaskRunner::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size() + active_jobs_;
}

bool TaskRunner::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto idle = [this] { return job_queue_.empty() && active_jobs_ == 0; };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void TaskRunner::shutdown() {
    running_ = false;
    queue_cv_.notify_all();
}

void TaskRunner::worker_thread() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !job_queue_.empty() || !running_;
            });

            // Drain what was queued before shutdown
            if (job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            active_jobs_++;
        }

        try {
            job();
        } catch (const std::exception& e) {
            Logger::error(std::string("Background job threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_jobs_--;
        }
        idle_cv_.notify_all();
    }
}

} // namespace job_diary

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace job_diary {

/**
 * @brief Worker pool for blocking calls (libcurl requests)
 *
 * Jobs run off the event loop and hand their results back with
 * EventLoop::post(); they never touch session state directly.
 */
class TaskRunner {
public:
    using Job = std::function<void()>;

    /**
     * @param workers Number of worker threads
     */
    explicit TaskRunner(size_t workers = 2);

    /**
     * @brief Destructor - finishes queued jobs, then joins the workers
     */
    ~TaskRunner();

    // Non-copyable
    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    /**
     * @brief Queue a job
     * @return false if the runner is shut down
     */
    bool submit(Job job);

    bool is_idle() const;
    size_t pending_count() const;

    /**
     * @brief Wait for all queued jobs to complete
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if all completed, false if timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /**
     * @brief Stop accepting new jobs
     */
    void shutdown();

private:
    void worker_thread();

    std::atomic<bool> running_;
    size_t active_jobs_ = 0;

    std::queue<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace job_diary

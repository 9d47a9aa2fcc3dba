#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lyricflow::util {

// Fixed-size thread pool with a bounded job queue.
// submit() blocks while the queue is full so a large library never
// materializes all of its jobs at once.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t num_threads, size_t max_queue_size = 64);

    // Destructor drains queued jobs and joins all workers
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Job job);

    // Blocks until the queue is empty and no job is running
    void wait_idle();

    [[nodiscard]] size_t thread_count() const { return workers_.size(); }

private:
    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<Job> job_queue_;
    std::mutex queue_mutex_;
    std::condition_variable job_cv_;    // Signals workers: job available or stop
    std::condition_variable space_cv_;  // Signals submitters: queue has room
    std::condition_variable idle_cv_;   // Signals wait_idle: everything finished

    size_t max_queue_size_;
    size_t active_jobs_ = 0;
    std::atomic<bool> stop_{false};
};

}  // namespace lyricflow::util

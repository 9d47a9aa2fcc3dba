#include "util/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace lyricflow::util {

WorkerPool::WorkerPool(size_t num_threads, size_t max_queue_size)
    : max_queue_size_(max_queue_size == 0 ? 1 : max_queue_size) {
    if (num_threads == 0) num_threads = 1;

    Logger::debug("WorkerPool: Starting " + std::to_string(num_threads) + " worker threads");

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    job_cv_.notify_all();
    space_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::debug("WorkerPool: Shutdown complete");
}

void WorkerPool::submit(Job job) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        space_cv_.wait(lock, [this]() {
            return stop_ || job_queue_.size() < max_queue_size_;
        });
        if (stop_) {
            return;
        }
        job_queue_.push(std::move(job));
    }
    job_cv_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() {
        return job_queue_.empty() && active_jobs_ == 0;
    });
}

void WorkerPool::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            job_cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            // Queued work is still drained after stop so no submitted track is lost
            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++active_jobs_;
        }
        space_cv_.notify_one();

        // Execute outside the lock
        try {
            job();
        } catch (const std::exception& e) {
            Logger::error(std::string("WorkerPool: Job threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_jobs_;
            if (job_queue_.empty() && active_jobs_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

}  // namespace lyricflow::util

#pragma once

#include <utils/logger.hpp>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace Instasave {

/**
 * @brief Fixed set of worker threads draining a bounded task queue.
 *
 * submit() blocks while the queue is full (backpressure). Tasks must not
 * submit further tasks into the same pool.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_workers = 4, size_t max_queue = 64)
        : max_queue_(max_queue == 0 ? 1 : max_queue) {
        if (num_workers == 0) num_workers = 1;
        workers_.reserve(num_workers);
        for (size_t i = 0; i < num_workers; ++i)
            workers_.emplace_back(&WorkerPool::worker, this);
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_)
            if (t.joinable()) t.join();
    }

    /**
     * @brief Enqueue a task. Blocks if the queue is full.
     * @throws std::runtime_error if the pool is shutting down
     */
    void submit(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return queue_.size() < max_queue_ || stop_; });
            if (stop_) throw std::runtime_error("WorkerPool is stopping");
            queue_.push(std::move(task));
        }
        cv_.notify_all();
    }

    /**
     * @brief Block until every submitted task has finished.
     */
    void wait_all() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
    }

    size_t size() const { return workers_.size(); }

private:
    void worker() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
                if (stop_ && queue_.empty()) break;
                task = std::move(queue_.front());
                queue_.pop();
                busy_++;
            }
            cv_.notify_all();

            try {
                task();
            } catch (const std::exception& e) {
                Logger::error("Worker task failed: " + std::string(e.what()));
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                busy_--;
            }
            cv_.notify_all();
        }
    }

    std::queue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    size_t max_queue_;
    size_t busy_ = 0;
    bool stop_ = false;
};

} // namespace Instasave

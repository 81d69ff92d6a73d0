#include <stdexcept>

#include "rl_worker_pool.h"

WorkerPool::WorkerPool(std::size_t threadCount) {
    if (threadCount == 0) threadCount = 1;

    workers_.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

std::size_t WorkerPool::cancelPending() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(tasks_);
    }
    // Destroying the tasks outside the lock breaks their promises
    return dropped.size();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) break;

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        // packaged_task stores any exception in the future
        task();
    }
}

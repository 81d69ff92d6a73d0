#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed-size thread pool with a FIFO task queue. Results and exceptions of a
// task come back through the future returned by submit().
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template<typename F>
    std::future<std::invoke_result_t<F>> submit(F&& task) {
        using Result = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        std::future<Result> future = packaged->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("Worker pool is shut down");
            }
            tasks_.emplace_back([packaged] { (*packaged)(); });
        }
        cv_.notify_one();
        return future;
    }

    // Drop queued tasks that have not started; their futures report broken_promise
    std::size_t cancelPending();

    std::size_t size() const { return workers_.size(); }

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

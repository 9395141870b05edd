#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>

namespace sixftp {
namespace core {

/**
 * @brief A simple ThreadPool for executing tasks asynchronously.
 *
 * Used to run blocking lifecycle work (stop with its grace period) off the
 * interactive thread.
 */
class ThreadPool {
public:
    /**
     * @brief Construct a ThreadPool with the specified number of workers.
     * @param num_threads Number of worker threads (default: 1)
     */
    explicit ThreadPool(size_t num_threads = 1) : stop_(false) {
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this]() {
                worker_loop();
            });
        }
    }

    /**
     * @brief Destructor. Runs the remaining queue, then joins the workers.
     */
    ~ThreadPool() {
        shutdown();
    }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Submit a task to be executed by a worker thread.
     * @param task The callable to execute
     * @return std::future<void> to wait for completion (optional)
     */
    std::future<void> submit(std::function<void()> task) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                promise->set_exception(std::make_exception_ptr(
                    std::runtime_error("ThreadPool is stopped")));
                return future;
            }

            tasks_.emplace([task = std::move(task), promise]() mutable {
                try {
                    task();
                    promise->set_value();
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            });
        }

        condition_.notify_one();
        return future;
    }

    /**
     * @brief Gracefully shutdown the pool, waiting for all tasks to complete.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) return;
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this]() {
                    return stop_ || !tasks_.empty();
                });

                if (stop_ && tasks_.empty()) {
                    return; // Exit worker
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            // Execute task outside the lock
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_;
};

} // namespace core
} // namespace sixftp

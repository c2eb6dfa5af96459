/**
 * @file dispatch_pool.hpp
 * @brief Fixed-size worker pool with a bounded task queue
 *
 * Runs fire-and-forget callbacks (alert subscribers) on a small set of
 * worker threads so one slow callback cannot stall the others or the
 * submitting thread.
 *
 * @date 2025
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cellguard {
namespace utils {

/**
 * @class DispatchPool
 * @brief Bounded fan-out executor
 *
 * Submit() never blocks: when the queue is full the task is rejected.
 * Exceptions thrown by a task are logged and do not terminate the worker.
 */
class DispatchPool {
public:
    using Task = std::function<void()>;

    /**
     * @param name        Pool name used in log lines
     * @param workers     Number of worker threads (at least one)
     * @param max_queued  Maximum pending tasks (at least one)
     */
    DispatchPool(std::string name, std::size_t workers, std::size_t max_queued);
    ~DispatchPool();

    DispatchPool(const DispatchPool&) = delete;
    DispatchPool& operator=(const DispatchPool&) = delete;

    /**
     * @brief Queue a task for execution
     * @return false if the queue is full or the pool is shut down
     */
    bool Submit(Task task);

    /**
     * @brief Run the queued tasks to completion and join the workers
     *
     * Safe to call more than once.
     */
    void Shutdown();

    std::size_t Pending() const;
    std::size_t WorkerCount() const { return workers_.size(); }

private:
    void WorkerLoop();

    std::string name_;
    std::size_t max_queued_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_{false};
};

} // namespace utils
} // namespace cellguard

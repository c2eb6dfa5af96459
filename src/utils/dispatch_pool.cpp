/**
 * @file dispatch_pool.cpp
 * @brief Implementation of the bounded callback dispatch pool
 *
 * Workers pull tasks FIFO from a shared deque guarded by one mutex. Shutdown
 * flips the stopping flag, lets workers drain what is already queued and
 * joins them.
 *
 * @date 2025
 */

#include "cellguard/utils/dispatch_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace cellguard {
namespace utils {

DispatchPool::DispatchPool(std::string name, std::size_t workers, std::size_t max_queued)
    : name_(std::move(name))
    , max_queued_(std::max<std::size_t>(max_queued, 1)) {

    const std::size_t count = std::max<std::size_t>(workers, 1);
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&DispatchPool::WorkerLoop, this);
    }

    spdlog::debug("Dispatch pool '{}' started with {} workers (queue {})",
                  name_, count, max_queued_);
}

DispatchPool::~DispatchPool() {
    Shutdown();
}

bool DispatchPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (tasks_.size() >= max_queued_) {
            spdlog::warn("Dispatch pool '{}' queue full ({}), task rejected", name_, max_queued_);
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void DispatchPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    spdlog::debug("Dispatch pool '{}' stopped", name_);
}

std::size_t DispatchPool::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void DispatchPool::WorkerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;  // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        }
        catch (const std::exception& e) {
            spdlog::error("Dispatch pool '{}' task failed: {}", name_, e.what());
        }
    }
}

} // namespace utils
} // namespace cellguard

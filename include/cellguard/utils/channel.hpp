/**
 * @file channel.hpp
 * @brief Bounded, closable multi-producer/multi-consumer channel
 *
 * Fixed-capacity FIFO used to hand alerts and network samples from background
 * producers to consumers. Producers may send without blocking (the value is
 * rejected when the channel is full); consumers block until a value arrives
 * or the channel is closed and drained.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace cellguard {
namespace utils {

/**
 * @class Channel
 * @brief Bounded FIFO with close semantics
 *
 * Once closed, sends fail and receivers drain the remaining values before
 * observing the end of stream (std::nullopt).
 *
 * @tparam T Element type (must be move-constructible)
 */
template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("channel capacity must be positive");
        }
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue without blocking
     * @return false when the channel is full or closed
     */
    bool TrySend(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Enqueue, waiting for free space
     * @return false if the channel was closed before space became available
     */
    bool Send(T value) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue, waiting for a value
     * @return Next value, or std::nullopt once closed and drained
     */
    std::optional<T> Receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return PopLocked();
    }

    /**
     * @brief Dequeue, waiting at most @p timeout
     * @return Next value, or std::nullopt on timeout or end of stream
     */
    template <typename Rep, typename Period>
    std::optional<T> ReceiveFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return PopLocked();
    }

    std::optional<T> TryReceive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return PopLocked();
    }

    /**
     * @brief Close the channel and wake every waiter
     * @return true only for the call that actually closed it
     */
    bool Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        return true;
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t Capacity() const { return capacity_; }

private:
    // Caller holds mutex_
    std::optional<T> PopLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace utils
} // namespace cellguard

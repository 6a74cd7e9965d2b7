/**
 * @file event_queue.hpp
 * @brief Blocking multi-producer / multi-consumer queue
 *
 * Feeds background workers (the cleanup worker) from request threads.
 *
 * EXAMPLE:
 * ThreadSafeQueue<Task> queue;
 * queue.push(task);                 // producer
 * auto next = queue.pop_for(1s);    // consumer
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace chunkup::events {

/**
 * @brief Thread-safe FIFO queue with close semantics
 *
 * After close() producers are ignored and consumers drain whatever is
 * left, then receive nullopt.
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /// @return false when the queue is closed and the item was dropped
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_front();
    }

    /// Blocks until an item is available or the queue is closed and empty
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        return take_front();
    }

    /// As pop(), but gives up after @p timeout
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
        return take_front();
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    /// Wake every waiting consumer and refuse further pushes
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace chunkup::events

/**
 * @file event_queue.hpp
 * @brief Thread-safe FIFO for handing events to a worker thread
 *
 * The upload thread pushes progress snapshots; the ProgressMonitor worker
 * pops and renders them in order. After shutdown() the queue refuses new
 * items and consumers drain what is left before pop() returns nullopt.
 *
 * EXAMPLE:
 * ThreadSafeQueue<ProgressEvent> queue;
 * queue.push(event);          // Producer
 * auto next = queue.pop();    // Consumer (blocks until available or shut down)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace dsync::events {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Enqueue an item
     *
     * RETURNS: false when the queue was already shut down (item dropped)
     */
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front_locked();
    }

    /**
     * @brief Blocking pop
     *
     * RETURNS: next item, or nullopt once shut down and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });
        return take_front_locked();
    }

    /// Like pop() but gives up after `timeout`
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; });
        return take_front_locked();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

    /// Wake every waiting consumer and refuse further pushes
    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool is_shut_down() const {
        std::lock_guard lock(mutex_);
        return shutdown_;
    }

private:
    std::optional<T> take_front_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_ = false;
};

} // namespace dsync::events

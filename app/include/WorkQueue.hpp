/*
 * Closable blocking queue shared by producer and worker threads
 * Part of Fleetmux - a multi-host inference dispatcher with online performance metrics
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef WORK_QUEUE_HPP
#define WORK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

/**
 * Unbounded FIFO queue. After close(), pushes are rejected and pop()
 * drains the remaining items before reporting the queue as finished.
 */
template <typename T>
class WorkQueue {
public:
    /**
     * @return false if the queue has been closed
     */
    bool push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * Block until an item is available or the queue is closed and empty
     * @return false once the queue is closed and drained
     */
    bool pop(T& out)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop();
        return true;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> items_;
    bool closed_{false};
};

#endif // WORK_QUEUE_HPP

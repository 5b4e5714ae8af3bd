#ifndef WORK_QUEUE_HPP
#define WORK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

// Multi-producer / multi-consumer queue. Every pushed item counts as
// outstanding until a consumer calls markDone() for it, so waitIdle()
// returns only once the work itself has finished, not just been popped.
template<typename T>
class WorkQueue {
private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable itemReady_;
    std::condition_variable idle_;
    std::size_t outstanding_ = 0;
    bool closed_ = false;

public:
    WorkQueue() = default;

    // Non-copyable, non-movable
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Returns false if the queue is closed and the item was dropped
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
            ++outstanding_;
        }
        itemReady_.notify_one();
        return true;
    }

    // Blocks until an item is available. std::nullopt once closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        itemReady_.wait(lock, [this] { return !queue_.empty() || closed_; });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    // Consumer has finished with one popped item
    void markDone() {
        bool nowIdle = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outstanding_ > 0) {
                --outstanding_;
            }
            nowIdle = (outstanding_ == 0);
        }
        if (nowIdle) {
            idle_.notify_all();
        }
    }

    // Blocks until every pushed item has been marked done
    void waitIdle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return outstanding_ == 0; });
    }

    // Stop accepting items and wake every blocked consumer. Items already
    // queued can still be popped.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        itemReady_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }
};

#endif // WORK_QUEUE_HPP

#pragma once
/**
 * @file bounded_queue.h
 * @brief Fixed-capacity FIFO with drop-oldest overflow
 *
 * push() never blocks: when the queue is full the oldest element is evicted
 * to admit the new one. pop() waits on a condition variable for up to a
 * timeout. Producers never wait on the condition variable.
 */

#include "cotlink/core/types.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace cotlink::network {

/// Default number of pending events per broadcaster
constexpr SizeT DEFAULT_QUEUE_CAPACITY = 256;

/**
 * @brief Outcome of BoundedQueue::push
 */
enum class PushResult : UInt8 {
    Accepted = 0,
    AcceptedDroppedOldest,  ///< Admitted after evicting the oldest element
    Closed                  ///< Queue no longer accepts items
};

template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(SizeT capacity = DEFAULT_QUEUE_CAPACITY)
        : capacity_(capacity > 0 ? capacity : 1) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Append an item, evicting the oldest one when full
     *
     * A closed queue refuses the item and leaves it untouched.
     */
    PushResult push(T&& item) {
        PushResult result = PushResult::Accepted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (items_.size() >= capacity_) {
                items_.pop_front();
                result = PushResult::AcceptedDroppedOldest;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return result;
    }

    PushResult push(const T& item) {
        T copy(item);
        return push(std::move(copy));
    }

    /**
     * @brief Take the oldest element, waiting up to timeout
     * @return nullopt on timeout, or when closed and empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /// Stop accepting items and wake any waiting consumer
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Remove and return everything still queued, oldest first
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out(std::make_move_iterator(items_.begin()),
                           std::make_move_iterator(items_.end()));
        items_.clear();
        return out;
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    SizeT size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    SizeT capacity() const noexcept { return capacity_; }

private:
    const SizeT capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_{false};
};

} // namespace cotlink::network

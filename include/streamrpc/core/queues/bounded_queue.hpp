#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace StreamRpc {

/**
 * @class BoundedQueue
 * @brief Blocking FIFO with a fixed capacity and a close signal.
 *
 * Producers suspend when the queue is full, consumers suspend when it is
 * empty. close() wakes everybody: further pushes fail, pops keep returning
 * queued items until the queue is empty.
 */
template<typename T>
class BoundedQueue {
public:
    enum class PushResult : uint8_t {
        OK,
        FULL,     // timed out waiting for space
        CLOSED
    };

    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Non-copyable, non-movable
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    /**
     * @brief Push without waiting
     * @return OK, FULL if at capacity, CLOSED if the queue was closed
     */
    PushResult tryPush(const T& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return PushResult::CLOSED;
            if (items_.size() >= capacity_) return PushResult::FULL;
            items_.push_back(item);
        }
        not_empty_.notify_one();
        return PushResult::OK;
    }

    /**
     * @brief Push, waiting up to timeout for space
     */
    template<typename Rep, typename Period>
    PushResult pushFor(const T& item, std::chrono::duration<Rep, Period> timeout) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            bool ready = not_full_.wait_for(lock, timeout, [this] {
                return closed_ || items_.size() < capacity_;
            });
            if (closed_) return PushResult::CLOSED;
            if (!ready) return PushResult::FULL;
            items_.push_back(item);
        }
        not_empty_.notify_one();
        return PushResult::OK;
    }

    /**
     * @brief Push, waiting as long as needed for space
     * @return false if the queue was closed
     */
    bool push(const T& item) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) return false;
            items_.push_back(item);
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop, waiting up to timeout for an item
     * @return Item, or std::nullopt on timeout or when closed and drained
     */
    template<typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
                return std::nullopt;
            }
            if (items_.empty()) return std::nullopt;
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop, waiting until an item arrives or the queue is closed and drained
     */
    std::optional<T> pop() {
        std::optional<T> item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
            if (items_.empty()) return std::nullopt;
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    std::optional<T> tryPop() {
        std::optional<T> item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.empty()) return std::nullopt;
            item.emplace(std::move(items_.front()));
            items_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Reject further pushes and wake all waiters
     * @return true on the first call only
     */
    bool close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        return true;
    }

    /**
     * @brief Drop queued items, returns how many were discarded
     */
    size_t clear() {
        size_t dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = items_.size();
            items_.clear();
        }
        not_full_.notify_all();
        return dropped;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace StreamRpc

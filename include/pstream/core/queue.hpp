#pragma once

/**
 * @file queue.hpp
 * @brief Bounded, thread-safe queue with backpressure and join support
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "pstream/core/errors.hpp"

namespace pstream {

/**
 * @brief Queue statistics for monitoring
 */
struct QueueStats {
    std::uint64_t push_count{0};
    std::uint64_t pop_count{0};
    std::uint64_t push_timeout_count{0};
    std::uint64_t pop_timeout_count{0};
    std::size_t current_size{0};
    std::size_t capacity{0};
    std::size_t high_watermark{0};
};

/**
 * @brief Bounded MPMC (Multi-Producer Multi-Consumer) queue
 *
 * Ring buffer guarded by a mutex, with condition variables for the
 * timed operations. Besides the usual push/pop it keeps a count of
 * unfinished items: every successful push adds one, every task_done()
 * removes one, and join_for() waits for the count to reach zero.
 *
 * @tparam T Element type (must be movable)
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity) {
        if (capacity_ == 0) {
            throw ConfigError("queue capacity must be at least 1");
        }
        buffer_.resize(capacity_);
    }

    // Non-copyable, non-movable (due to synchronization primitives)
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    /**
     * @brief Try to push without blocking
     * @return true if pushed, false if full
     */
    bool try_push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (size_ == capacity_) {
                return false;
            }
            enqueue_locked(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push with timeout
     * @param item Item to push, left untouched on timeout
     * @param timeout Maximum wait duration
     * @return true if pushed, false on timeout
     */
    template<typename Rep, typename Period>
    bool push_for(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!not_full_.wait_for(lock, timeout, [this] { return size_ < capacity_; })) {
            stats_.push_timeout_count++;
            return false;
        }

        enqueue_locked(std::move(item));

        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Try to pop without blocking
     * @return Item if available, nullopt if empty
     */
    std::optional<T> try_pop() {
        std::optional<T> item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (size_ == 0) {
                return std::nullopt;
            }
            item = dequeue_locked();
        }
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Pop with timeout
     * @param timeout Maximum wait duration
     * @return Item if available, nullopt on timeout
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!not_empty_.wait_for(lock, timeout, [this] { return size_ > 0; })) {
            stats_.pop_timeout_count++;
            return std::nullopt;
        }

        std::optional<T> item = dequeue_locked();

        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Mark one previously popped item as fully handled
     */
    void task_done() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unfinished_ == 0) {
            throw Error("task_done() called more times than items were pushed");
        }
        if (--unfinished_ == 0) {
            all_done_.notify_all();
        }
    }

    /**
     * @brief Wait until every pushed item has been marked done
     * @return true if the queue is joined, false on timeout
     */
    template<typename Rep, typename Period>
    bool join_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return all_done_.wait_for(lock, timeout, [this] { return unfinished_ == 0; });
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == 0;
    }

    [[nodiscard]] bool full() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_ == capacity_;
    }

    /**
     * @brief Number of pushed items not yet marked done
     */
    [[nodiscard]] std::size_t unfinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unfinished_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]] QueueStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto s = stats_;
        s.current_size = size_;
        s.capacity = capacity_;
        return s;
    }

private:
    void enqueue_locked(T&& item) {
        buffer_[tail_] = std::move(item);
        tail_ = (tail_ + 1) % capacity_;
        size_++;
        unfinished_++;

        stats_.push_count++;
        if (size_ > stats_.high_watermark) {
            stats_.high_watermark = size_;
        }
    }

    std::optional<T> dequeue_locked() {
        std::optional<T> item = std::move(buffer_[head_]);
        buffer_[head_].reset();
        head_ = (head_ + 1) % capacity_;
        size_--;

        stats_.pop_count++;
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::condition_variable all_done_;

    std::size_t capacity_;
    std::vector<std::optional<T>> buffer_;
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t size_{0};
    std::size_t unfinished_{0};

    QueueStats stats_;
};

} // namespace pstream

/*
 * bounded_queue.hpp - Thread-safe bounded FIFO (header-only)
 *
 * Connects the control-pipe pumps to the capture routine. A full queue
 * makes producers wait (backpressure) instead of dropping items; close()
 * wakes every waiter, makes further pushes fail, and lets consumers drain
 * what is left before pop() reports end of stream with nullopt.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocking push. Returns false if the queue is (or becomes) closed.
    bool push(const T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        return push_unlocked(item, lock);
    }

    // Non-blocking push. Returns false if the queue is full or closed.
    bool try_push(const T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (items_.size() >= capacity_) {
            return false;
        }
        return push_unlocked(item, lock);
    }

    // Push, waiting at most timeout for space
    template<typename Rep, typename Period>
    bool push_for(const T& item, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, timeout,
                                [this] { return closed_ || items_.size() < capacity_; })) {
            return false;
        }
        return push_unlocked(item, lock);
    }

    // Blocking pop. Returns nullopt once the queue is closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return pop_unlocked(lock);
    }

    // Non-blocking pop
    std::optional<T> try_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return pop_unlocked(lock);
    }

    // Pop, waiting at most timeout for an item
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return pop_unlocked(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Closed and nothing left to pop
    bool is_finished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && items_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const noexcept { return capacity_; }

private:
    bool push_unlocked(const T& item, std::unique_lock<std::mutex>& lock) {
        if (closed_) {
            return false;
        }
        items_.push_back(item);
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop_unlocked(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

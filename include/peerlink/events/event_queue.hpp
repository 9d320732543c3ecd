/**
 * @file event_queue.hpp
 * @brief FIFO hand-off between transport threads and the session thread
 *
 * WHY THIS FILE EXISTS:
 * WebRTC libraries raise their callbacks on internal worker threads. The
 * peer core is single-threaded, so a backend only pushes what happened into
 * this queue, and the owning thread drains it in raise order.
 *
 * EXAMPLE:
 * ThreadSafeQueue<TransportEvent> inbox;
 * inbox.push(event);                 // transport callback thread
 * for (auto& e : inbox.drain()) {}     // session thread
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <deque>
#include <iterator>
#include <optional>
#include <vector>

namespace peerlink::events {

template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard guard(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    /// RETURNS: front item, or nullopt when nothing is queued
    std::optional<T> try_pop() {
        std::lock_guard guard(mutex_);
        return take_front();
    }

    /**
     * @brief Block until an item arrives, shutdown() is called or `timeout` passes
     *
     * RETURNS: nullopt on timeout or after shutdown() with nothing left
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return !items_.empty() || stopped_; });
        return take_front();
    }

    /// Move out everything queued right now, oldest first.
    std::vector<T> drain() {
        std::lock_guard guard(mutex_);
        std::vector<T> batch(std::make_move_iterator(items_.begin()),
                             std::make_move_iterator(items_.end()));
        items_.clear();
        return batch;
    }

    size_t size() const {
        std::lock_guard guard(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard guard(mutex_);
        return items_.empty();
    }

    /// Wake every waiter; later pushes are still accepted.
    void shutdown() {
        {
            std::lock_guard guard(mutex_);
            stopped_ = true;
        }
        ready_.notify_all();
    }

    void clear() {
        std::lock_guard guard(mutex_);
        items_.clear();
    }

private:
    // Caller holds mutex_.
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool stopped_ = false;
};

} // namespace peerlink::events

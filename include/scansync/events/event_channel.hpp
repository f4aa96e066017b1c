/**
 * @file event_channel.hpp
 * @brief Closable blocking FIFO between a producer thread and the dispatcher
 *
 * WHY THIS FILE EXISTS:
 * Filesystem event sources read the kernel on a background thread and
 * hand events to the dispatcher through this channel. Closing the channel
 * is how a source says "no more events": consumers drain what is left and
 * then observe closed().
 *
 * EXAMPLE:
 * EventChannel<Item> channel;
 * channel.push(item);                               // Producer
 * auto item = channel.pop_for(std::chrono::milliseconds(100));  // Consumer
 * channel.close();
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace scansync::events {

template<typename T>
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * @brief Append item
     *
     * RETURNS: false if the channel is already closed (item dropped)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Wait up to timeout for an item
     *
     * RETURNS: Item, or nullopt on timeout or when closed and drained.
     * Use drained() to tell the two apart.
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Stop accepting items and wake every waiting consumer. Idempotent.
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    /**
     * @brief Closed and nothing left to consume
     */
    bool drained() const {
        std::unique_lock lock(mutex_);
        return closed_ && queue_.empty();
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace scansync::events

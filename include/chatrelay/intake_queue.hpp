/**
 * @file intake_queue.hpp
 * @brief Ordered buffer between intake producers and the dispatch worker
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "relay_types.hpp"

namespace chatrelay
{

/**
 * @brief Multi-producer, single-consumer FIFO of chat events
 *
 * Ordering is strict across all producers: events leave in the order their
 * enqueue() calls acquired the lock. The queue itself never rejects, capacity
 * is enforced by the intake gate through size().
 */
class intake_queue
{
  public:
    intake_queue()                                = default;
    intake_queue(const intake_queue &)            = delete;
    intake_queue &operator=(const intake_queue &) = delete;

    void enqueue(chat_event event)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    /**
     * @brief Wait up to @p timeout for the oldest event
     * @return The event, or std::nullopt when the wait timed out
     */
    template <typename Rep, typename Period>
    std::optional<chat_event> dequeue_blocking(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) { return std::nullopt; }

        chat_event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    std::optional<chat_event> try_dequeue()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (events_.empty()) { return std::nullopt; }

        chat_event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    bool empty() const { return size() == 0; }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<chat_event> events_;
};

} // namespace chatrelay

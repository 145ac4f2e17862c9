/**
 * @file log_dispatcher.hpp
 * @brief Asynchronous log record dispatcher
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The dispatcher starts with a default stdout sink so logs are visible without
 * any setup. The default sink is replaced by the first add_sink() call;
 * set_sinks() and clear_sinks() also disable it.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "moodycamel/concurrentqueue.h"
#include "moodycamel/blockingconcurrentqueue.h"

#include "log_types.hpp"
#include "log_line.hpp"
#include "log_sink.hpp"

namespace chatrelay
{

/**
 * @brief Hands log records from any thread to the configured sinks
 */
class log_dispatcher
{
  public:
    /**
     * @brief Immutable sink configuration, swapped as a whole on modification
     */
    struct sink_config
    {
        std::vector<std::shared_ptr<log_sink>> sinks;

        std::unique_ptr<sink_config> copy() const
        {
            auto new_config   = std::make_unique<sink_config>();
            new_config->sinks = sinks; // Copies shared_ptr, not the sinks
            return new_config;
        }
    };

    /**
     * @brief Dispatcher statistics for diagnostics and tests
     */
    struct stats
    {
        uint64_t total_dispatched;       ///< Records handed to sinks
        uint64_t queue_enqueue_failures; ///< Failed enqueue attempts
        uint64_t messages_dropped;       ///< Records dropped after shutdown
        uint64_t current_queue_size;     ///< Approximate records waiting
        uint64_t total_batches;          ///< Worker batches processed
        size_t active_sinks;             ///< Number of configured sinks
    };

    static log_dispatcher &instance()
    {
        static log_dispatcher instance_;
        return instance_;
    }

    log_dispatcher(const log_dispatcher &)            = delete;
    log_dispatcher &operator=(const log_dispatcher &) = delete;

    ~log_dispatcher();

    void dispatch(std::unique_ptr<log_record> record);

    /**
     * @brief Block until every record submitted before this call reached the sinks
     */
    void flush();

    /**
     * @brief Stop the worker after draining the queue. Later records are dropped.
     */
    void shutdown();

    /**
     * @brief Add a new sink
     *
     * @warning Sink changes copy the configuration and flush the queue before
     *          releasing the old one. Configure sinks once at startup.
     */
    void add_sink(std::shared_ptr<log_sink> sink)
    {
        std::lock_guard<std::mutex> lock(sink_modify_mutex_);
        auto current = current_sinks_.load(std::memory_order_acquire);
        if (!current) return;

        auto new_config = current->copy();

        // First add_sink replaces the default stdout sink
        if (has_default_sink_)
        {
            new_config->sinks.clear();
            has_default_sink_ = false;
        }

        new_config->sinks.push_back(std::move(sink));
        update_sink_config(std::move(new_config));
    }

    void set_sinks(std::vector<std::shared_ptr<log_sink>> sinks)
    {
        std::lock_guard<std::mutex> lock(sink_modify_mutex_);
        has_default_sink_ = false;

        auto new_config   = std::make_unique<sink_config>();
        new_config->sinks = std::move(sinks);
        update_sink_config(std::move(new_config));
    }

    void clear_sinks() { set_sinks({}); }

    size_t sink_count() const
    {
        std::lock_guard<std::mutex> lock(sink_modify_mutex_);
        auto config = current_sinks_.load(std::memory_order_acquire);
        return config ? config->sinks.size() : 0;
    }

    stats get_stats() const;

    auto start_time() const noexcept { return start_time_; }

  private:
    log_dispatcher();

    void worker_thread_func();
    moodycamel::ProducerToken &producer_token();
    void update_sink_config(std::unique_ptr<sink_config> new_config);

    size_t dequeue_records(moodycamel::ConsumerToken &token, log_record **records, bool wait);
    bool process_batch(log_record **records, size_t count, sink_config *config);
    void deliver(log_record **records, size_t count, sink_config *config);
    void drain_queue(moodycamel::ConsumerToken &token);
    void notify_flushed(uint64_t count);

    std::chrono::steady_clock::time_point start_time_;

    std::atomic<sink_config *> current_sinks_{nullptr};
    mutable std::mutex sink_modify_mutex_;
    bool has_default_sink_{true};

    moodycamel::BlockingConcurrentQueue<log_record *> queue_;
    std::thread worker_thread_;
    std::atomic<bool> shutdown_{false};

    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;

    // Written by dispatch() callers
    std::atomic<uint64_t> queue_enqueue_failures_{0};
    std::atomic<uint64_t> messages_dropped_{0};

    // Written by the worker thread only
    std::atomic<uint64_t> total_dispatched_{0};
    std::atomic<uint64_t> total_batches_{0};
};

// Submits the finished record
inline log_line::~log_line()
{
    if (!record_) return;
    log_dispatcher::instance().dispatch(std::move(record_));
}

} // namespace chatrelay

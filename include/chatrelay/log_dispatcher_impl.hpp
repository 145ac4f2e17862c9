/**
 * @file log_dispatcher_impl.hpp
 * @brief Implementation of the log dispatcher and its worker thread
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include "log_line.hpp"
#include "log_dispatcher.hpp"
#include "log_sinks.hpp" // For make_stdout_sink

namespace chatrelay
{

inline log_dispatcher::log_dispatcher()
: start_time_(log_fast_timestamp()),
  queue_(LOG_DISPATCH_QUEUE_SIZE), // Initial capacity
  worker_thread_(&log_dispatcher::worker_thread_func, this)
{
    // Initialize with default stdout sink
    auto initial_config = std::make_unique<sink_config>();
    initial_config->sinks.push_back(make_stdout_sink());
    current_sinks_.store(initial_config.release(), std::memory_order_release);
}

inline log_dispatcher::~log_dispatcher()
{
    shutdown();

    // Clean up sink config
    auto *config = current_sinks_.exchange(nullptr, std::memory_order_acq_rel);
    delete config;
}

inline void log_dispatcher::shutdown()
{
    // Only shutdown once
    bool expected = false;
    if (shutdown_.compare_exchange_strong(expected, true))
    {
        // Enqueue sentinel to wake worker
        queue_.enqueue(nullptr);
    }

    if (worker_thread_.joinable() && worker_thread_.get_id() != std::this_thread::get_id()) { worker_thread_.join(); }

    // Release flushers whose marker arrived after the final drain
    std::lock_guard lk(flush_mutex_);
    flush_cv_.notify_all();
}

// One producer per thread keeps a thread's records and flush markers in order
inline moodycamel::ProducerToken &log_dispatcher::producer_token()
{
    thread_local moodycamel::ProducerToken token(queue_);
    return token;
}

inline void log_dispatcher::dispatch(std::unique_ptr<log_record> record)
{
    if (!record) return;

    if (shutdown_.load(std::memory_order_relaxed))
    {
        // The worker is gone or about to be, nothing will consume the record
        messages_dropped_++;
        return;
    }

    auto *raw = record.release();
    if (!queue_.enqueue(producer_token(), raw))
    {
        queue_enqueue_failures_++;
        delete raw;
    }
}

inline size_t log_dispatcher::dequeue_records(moodycamel::ConsumerToken &token, log_record **records, bool wait)
{
    if (!wait) { return queue_.try_dequeue_bulk(token, records, LOG_MAX_BATCH_SIZE); }

    // Wake periodically so a missed sentinel cannot hang the worker
    size_t total_dequeued = queue_.wait_dequeue_bulk_timed(token, records, LOG_MAX_BATCH_SIZE, LOG_IDLE_WAIT);
    if (total_dequeued == 0) { return 0; }

    // Got some data, try to collect more within bounded time
    auto batch_start = log_fast_timestamp();
    while (total_dequeued < LOG_MAX_BATCH_SIZE)
    {
        auto elapsed = log_fast_timestamp() - batch_start;
        if (elapsed >= LOG_BATCH_COLLECT_TIMEOUT) { break; }

        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(LOG_BATCH_COLLECT_TIMEOUT - elapsed);
        size_t additional =
            queue_.wait_dequeue_bulk_timed(token, records + total_dequeued, LOG_MAX_BATCH_SIZE - total_dequeued, remaining);
        if (additional == 0) { break; }
        total_dequeued += additional;
    }

    return total_dequeued;
}

// Hand a run of ordinary records to every sink, then free them
inline void log_dispatcher::deliver(log_record **records, size_t count, sink_config *config)
{
    if (count == 0) return;

    if (config)
    {
        for (auto &sink : config->sinks)
        {
            if (sink) { sink->process_batch(records, count); }
        }
    }

    for (size_t i = 0; i < count; ++i) { delete records[i]; }
    total_dispatched_ += count;
}

inline void log_dispatcher::notify_flushed(uint64_t count)
{
    if (count == 0) return;

    std::lock_guard lk(flush_mutex_);
    flush_cv_.notify_all();
}

inline bool log_dispatcher::process_batch(log_record **records, size_t count, sink_config *config)
{
    size_t run_start     = 0;
    uint64_t flushes     = 0;
    bool should_shutdown = false;

    for (size_t i = 0; i < count; ++i)
    {
        log_record *record = records[i];
        if (record && !record->is_flush_marker()) { continue; }

        // Markers split the batch; everything before one must reach the sinks first
        deliver(records + run_start, i - run_start, config);
        run_start = i + 1;

        if (!record)
        {
            should_shutdown = true;
            continue;
        }

        record->flush_done_->store(true, std::memory_order_release);
        delete record;
        flushes++;
    }

    deliver(records + run_start, count - run_start, config);
    total_batches_++;
    notify_flushed(flushes);

    return should_shutdown;
}

inline void log_dispatcher::drain_queue(moodycamel::ConsumerToken &token)
{
    log_record *records[LOG_MAX_BATCH_SIZE];
    size_t dequeued_count;

    while ((dequeued_count = dequeue_records(token, records, false)) > 0)
    {
        auto *config = current_sinks_.load(std::memory_order_acquire);
        process_batch(records, dequeued_count, config);
    }
}

inline void log_dispatcher::worker_thread_func()
{
    moodycamel::ConsumerToken consumer_token(queue_);
    log_record *records[LOG_MAX_BATCH_SIZE];
    bool should_shutdown = false;

    while (!should_shutdown)
    {
        size_t dequeued_count = dequeue_records(consumer_token, records, true);

        if (dequeued_count == 0)
        {
            if (shutdown_.load(std::memory_order_relaxed)) { break; }
            continue;
        }

        // Get sink config once for the batch
        auto *config    = current_sinks_.load(std::memory_order_acquire);
        should_shutdown = process_batch(records, dequeued_count, config);
    }

    // Records enqueued between the sentinel and the shutdown flag still get written
    drain_queue(consumer_token);
}

inline void log_dispatcher::update_sink_config(std::unique_ptr<sink_config> new_config)
{
    auto *old_config = current_sinks_.exchange(new_config.release(), std::memory_order_acq_rel);

    if (old_config)
    {
        // Flush so the worker is done with the old config before it is freed
        flush();
        delete old_config;
    }
}

inline void log_dispatcher::flush()
{
    if (shutdown_.load(std::memory_order_acquire)) return;

    // The flag is shared with the marker, so it outlives a flusher released by shutdown
    auto done             = std::make_shared<std::atomic<bool>>(false);
    auto marker           = std::make_unique<log_record>();
    marker->flush_done_   = done;

    auto *raw = marker.release();
    if (!queue_.enqueue(producer_token(), raw))
    {
        delete raw;
        return;
    }

    // Each flusher waits for its own marker, whatever other threads flush meanwhile
    std::unique_lock lk(flush_mutex_);
    flush_cv_.wait(lk,
                   [&]
                   {
                       return done->load(std::memory_order_acquire) || shutdown_.load(std::memory_order_acquire);
                   });
}

inline log_dispatcher::stats log_dispatcher::get_stats() const
{
    stats s;
    s.total_dispatched       = total_dispatched_;
    s.queue_enqueue_failures = queue_enqueue_failures_;
    s.messages_dropped       = messages_dropped_;
    s.current_queue_size     = queue_.size_approx();
    s.total_batches          = total_batches_;

    auto *config   = current_sinks_.load(std::memory_order_acquire);
    s.active_sinks = config ? config->sinks.size() : 0;
    return s;
}

} // namespace chatrelay

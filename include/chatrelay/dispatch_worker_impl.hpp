/**
 * @file dispatch_worker_impl.hpp
 * @brief Implementation of the dispatch worker state machine
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <iterator>

#include "dispatch_worker.hpp"
#include "log.hpp"

namespace chatrelay
{

inline void dispatch_worker::start()
{
    if (thread_.joinable()) return;

    stopping_.store(false);
    last_stats_log_ = steady_clock::now();
    thread_         = std::thread(&dispatch_worker::worker_thread_func, this);

    LOG_MOD(info, "dispatch").format("Worker started (window {}ms, max batch {}, {} request(s)/cycle)",
                                     config_.batch_window.count(),
                                     config_.max_batch_size,
                                     config_.max_requests_per_cycle);
}

inline void dispatch_worker::stop()
{
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_.store(true);
    }
    stop_cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) { thread_.join(); }
}

inline bool dispatch_worker::pause(std::chrono::milliseconds duration)
{
    if (duration.count() <= 0) { return !stopping_.load(); }

    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, duration, [this] { return stopping_.load(); });
}

inline void dispatch_worker::worker_thread_func()
{
    while (!stopping_.load())
    {
        try
        {
            run_cycle();
        }
        catch (const std::exception &e)
        {
            // A single bad event or response must never end the loop
            LOG_MOD(error, "dispatch") << "Worker error: " << e.what();
            pause(config_.error_pause);
        }
    }

    drain();
}

inline std::vector<chat_event> dispatch_worker::collect()
{
    state_.store(worker_state::collecting, std::memory_order_relaxed);

    // Prior-cycle leftovers always go first
    std::vector<chat_event> events(std::make_move_iterator(backlog_.begin()), std::make_move_iterator(backlog_.end()));
    backlog_.clear();

    const auto deadline = steady_clock::now() + config_.batch_window;
    while (events.size() < config_.max_batch_size && !stopping_.load())
    {
        auto now = steady_clock::now();
        if (now >= deadline) { break; }

        // Wait in short slices so stop() is noticed within idle_pause
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto slice     = std::max(std::chrono::milliseconds(1), std::min(remaining, config_.idle_pause));

        if (auto event = queue_.dequeue_blocking(slice)) { events.push_back(std::move(*event)); }
    }

    return events;
}

inline void dispatch_worker::run_cycle()
{
    expire_backlog();

    auto events = collect();
    stats_.update_queue_peak(queue_.size());

    auto now = steady_clock::now();
    if (now < backoff_until_)
    {
        // Keep everything, keep collecting, send nothing
        state_.store(worker_state::backoff, std::memory_order_relaxed);
        for (auto &event : events) { backlog_.push_back(std::move(event)); }
        enforce_backlog_cap();

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(backoff_until_ - now);
        LOG_MOD(debug, "dispatch").format("Rate limit active, waiting {:.1f}s (backlog: {})",
                                          std::chrono::duration<double>(wait).count(),
                                          backlog_.size());
        pause(std::min(config_.backoff_poll_ceiling, wait + std::chrono::milliseconds(1)));
        return;
    }

    const bool had_events = !events.empty();
    if (had_events) { send_events(std::move(events)); }

    enforce_backlog_cap();
    maybe_log_stats();
    state_.store(worker_state::collecting, std::memory_order_relaxed);

    // Avoid spinning when there is nothing to do
    if (!had_events && backlog_.empty()) { pause(config_.idle_pause); }
}

inline void dispatch_worker::carry_over(std::vector<batch> &batches, size_t from)
{
    for (size_t i = from; i < batches.size(); ++i)
    {
        for (auto &event : batches[i].events) { backlog_.push_back(std::move(event)); }
    }
}

inline void dispatch_worker::send_events(std::vector<chat_event> events)
{
    state_.store(worker_state::sending, std::memory_order_relaxed);

    auto batches = split_batches(std::move(events),
                                 config_.display,
                                 split_limits{config_.safe_char_limit, config_.hard_char_limit});
    size_t requests_sent = 0;
    size_t i             = 0;

    try
    {
        for (; i < batches.size(); ++i)
        {
            if (config_.max_requests_per_cycle > 0 && requests_sent >= config_.max_requests_per_cycle)
            {
                // Not an error, the rest simply waits for the next cycle
                size_t backlog_before = backlog_.size();
                carry_over(batches, i);
                LOG_MOD(info, "dispatch").format("Request limit ({}/cycle) reached, {} msg deferred to next cycle",
                                                 config_.max_requests_per_cycle,
                                                 backlog_.size() - backlog_before);
                return;
            }

            // Short-window burst limit, independent of the per-minute pacing
            if (requests_sent > 0 && config_.inter_request_delay.count() > 0)
            {
                std::this_thread::sleep_for(config_.inter_request_delay);
            }

            batch &current = batches[i];
            auto result    = sender_.send(current);
            requests_sent++;

            bool stop_cycle = std::visit(
                overloaded{
                    [&](const outcome::success &)
                    {
                        stats_.record_sent(current.size());
                        auto sent_at = steady_clock::now();
                        for (const auto &event : current.events)
                        {
                            auto latency = std::chrono::duration<double>(sent_at - event.received_steady).count();
                            stats_.record_latency(std::max(0.0, latency));
                        }
                        LOG_MOD(info, "dispatch").format("Sent {} message(s) [req {}] | Queue: {}",
                                                         current.size(),
                                                         requests_sent,
                                                         queue_.size());
                        return false;
                    },
                    [&](const outcome::rate_limited &r)
                    {
                        stats_.record_rate_limit(r.scope);
                        backoff_until_ = steady_clock::now() + std::chrono::duration_cast<steady_clock::duration>(r.retry_after);
                        carry_over(batches, i);
                        LOG_MOD(warn, "dispatch").format("Rate limited ({}), resuming in {:.1f}s | Queue: {}",
                                                         to_string(r.scope),
                                                         r.retry_after.count(),
                                                         queue_.size());
                        return true;
                    },
                    [&](const outcome::transient_failure &t)
                    {
                        stats_.record_transient_failure();
                        backoff_until_ = steady_clock::now() + std::chrono::duration_cast<steady_clock::duration>(t.retry_after);
                        carry_over(batches, i);
                        LOG_MOD(warn, "dispatch").format("Delivery failed, retrying in {:.1f}s | Queue: {}",
                                                         t.retry_after.count(),
                                                         queue_.size());
                        return true;
                    },
                    [&](const outcome::permanent_reject &p)
                    {
                        // Resending would fail the same way, the events are abandoned
                        stats_.record_failed(current.size());
                        LOG_MOD(error, "dispatch").format("{} message(s) permanently rejected ({}, HTTP {}), abandoned",
                                                          current.size(),
                                                          to_string(p.reason),
                                                          p.status);
                        return false;
                    },
                },
                result);

            if (stop_cycle) { return; }
        }
    }
    catch (...)
    {
        // The batch plan dies with this frame, account for what it still held
        size_t lost = 0;
        for (size_t j = i; j < batches.size(); ++j) { lost += batches[j].size(); }
        if (lost > 0)
        {
            stats_.record_dropped(lost);
            LOG_MOD(error, "dispatch").format("Cycle aborted, {} message(s) abandoned", lost);
        }
        throw;
    }
}

inline void dispatch_worker::enforce_backlog_cap()
{
    if (backlog_.size() <= config_.max_retry_backlog) { return; }

    size_t dropped = backlog_.size() - config_.max_retry_backlog;
    backlog_.erase(backlog_.begin(), backlog_.begin() + static_cast<std::ptrdiff_t>(dropped));
    stats_.record_dropped(dropped);
    LOG_MOD(warn, "dispatch").format("Retry backlog full, {} message(s) abandoned", dropped);
}

inline void dispatch_worker::expire_backlog()
{
    if (config_.max_event_age.count() <= 0 || backlog_.empty()) { return; }

    auto now    = steady_clock::now();
    auto before = backlog_.size();
    backlog_.erase(std::remove_if(backlog_.begin(),
                                  backlog_.end(),
                                  [&](const chat_event &event) { return now - event.received_steady > config_.max_event_age; }),
                   backlog_.end());

    if (size_t expired = before - backlog_.size(); expired > 0)
    {
        stats_.record_dropped(expired);
        LOG_MOD(warn, "dispatch").format("{} message(s) older than {:.1f}s abandoned",
                                         expired,
                                         std::chrono::duration<double>(config_.max_event_age).count());
    }
}

inline void dispatch_worker::maybe_log_stats()
{
    auto now = steady_clock::now();
    if (now - last_stats_log_ < config_.stats_log_interval) { return; }

    auto rates    = stats_.throughput_per_minute();
    auto counters = stats_.counters();
    LOG_MOD(info, "stats").format("[STATS] Received: {:.1f}/min | Sent: {:.1f}/min | Requests: {:.1f}/min | "
                                  "Queue: {}/{} | Peak queue: {} | Lost: {} | Rate limits: {} (G:{}/S:{}/U:{})",
                                  rates.received_per_minute,
                                  rates.sent_per_minute,
                                  stats_.requests_per_minute(),
                                  queue_.size(),
                                  config_.max_queue_size,
                                  counters.peak_queue_size,
                                  counters.dropped,
                                  counters.rate_limits,
                                  counters.rate_limits_global,
                                  counters.rate_limits_shared,
                                  counters.rate_limits_user);
    last_stats_log_ = now;
}

inline void dispatch_worker::drain()
{
    const auto deadline = steady_clock::now() + config_.shutdown_grace;

    while (steady_clock::now() < deadline)
    {
        while (auto event = queue_.try_dequeue()) { backlog_.push_back(std::move(*event)); }
        if (backlog_.empty()) { break; }

        auto now = steady_clock::now();
        if (now < backoff_until_)
        {
            if (backoff_until_ >= deadline) { break; }
            std::this_thread::sleep_for(backoff_until_ - now);
            continue;
        }

        std::vector<chat_event> events(std::make_move_iterator(backlog_.begin()), std::make_move_iterator(backlog_.end()));
        backlog_.clear();
        try
        {
            send_events(std::move(events));
        }
        catch (const std::exception &e)
        {
            // Nothing retries after shutdown, the rest is counted below
            LOG_MOD(error, "dispatch") << "Shutdown drain error: " << e.what();
            break;
        }

        // Pace successive cycles like the loop does between requests
        if (!backlog_.empty() && config_.inter_request_delay.count() > 0)
        {
            std::this_thread::sleep_for(config_.inter_request_delay);
        }
    }

    while (auto event = queue_.try_dequeue()) { backlog_.push_back(std::move(*event)); }
    if (!backlog_.empty())
    {
        stats_.record_dropped(backlog_.size());
        LOG_MOD(warn, "dispatch").format("Shutdown: {} message(s) abandoned", backlog_.size());
        backlog_.clear();
    }

    state_.store(worker_state::collecting, std::memory_order_relaxed);
    LOG_MOD(info, "dispatch") << "Worker stopped";
}

} // namespace chatrelay

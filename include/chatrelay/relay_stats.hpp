/**
 * @file relay_stats.hpp
 * @brief Thread-safe relay counters and sliding-window throughput
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <numeric>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "relay_types.hpp"

namespace chatrelay
{

/**
 * @brief Point-in-time copy of the monotonic counters
 */
struct relay_counters
{
    uint64_t received           = 0; ///< Events accepted past the channel filter
    uint64_t sent               = 0; ///< Events delivered
    uint64_t dropped            = 0; ///< Queue full, backlog overflow, expiry, shutdown
    uint64_t failed             = 0; ///< Events permanently rejected by the endpoint
    uint64_t requests           = 0; ///< Outbound delivery attempts
    uint64_t rate_limits        = 0;
    uint64_t rate_limits_global = 0;
    uint64_t rate_limits_shared = 0;
    uint64_t rate_limits_user   = 0;
    uint64_t transient_failures = 0;
    size_t peak_queue_size      = 0;
    std::optional<wall_clock::time_point> peak_queue_time;
    double peak_per_minute = 0.0;
};

struct throughput
{
    double received_per_minute = 0.0;
    double sent_per_minute     = 0.0;
};

/**
 * @brief Process-wide statistics, shared by reference between components
 *
 * Throughput is estimated over a ring of fixed-width time slots (30 x 10s by
 * default) plus the slot in progress. Every mutation and every window read
 * happens under one mutex, so rotation is never observed half done.
 *
 * The clock is injectable so tests can step time explicitly:
 * @code
 * wall_clock::time_point now{};
 * relay_stats stats{[&] { return now; }};
 * stats.record_received();
 * now += std::chrono::seconds(10);
 * auto rate = stats.throughput_per_minute();
 * @endcode
 */
class relay_stats
{
  public:
    using clock_fn = std::function<wall_clock::time_point()>;

    explicit relay_stats(clock_fn clock                = [] { return wall_clock::now(); },
                         std::chrono::seconds slot_width = std::chrono::seconds(10),
                         size_t max_slots                = 30,
                         size_t max_latency_samples      = 100)
    : clock_(std::move(clock)),
      slot_width_(slot_width),
      max_slots_(max_slots),
      max_latency_samples_(max_latency_samples)
    {
        start_time_   = clock_();
        current_slot_ = slot_of(start_time_);
    }

    relay_stats(const relay_stats &)            = delete;
    relay_stats &operator=(const relay_stats &) = delete;

    void record_received()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rotate_slot();
        counters_.received++;
        slot_received_++;
    }

    void record_sent(uint64_t count = 1)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rotate_slot();
        counters_.sent += count;
        slot_sent_ += count;
    }

    void record_dropped(uint64_t count = 1)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.dropped += count;
    }

    void record_failed(uint64_t count = 1)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.failed += count;
    }

    void record_request()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.requests++;
    }

    void record_rate_limit(rate_limit_scope scope)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.rate_limits++;
        switch (scope)
        {
        case rate_limit_scope::global: counters_.rate_limits_global++; break;
        case rate_limit_scope::shared: counters_.rate_limits_shared++; break;
        case rate_limit_scope::user: counters_.rate_limits_user++; break;
        }
    }

    void record_transient_failure()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.transient_failures++;
    }

    void update_queue_peak(size_t size)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (size > counters_.peak_queue_size)
        {
            counters_.peak_queue_size = size;
            counters_.peak_queue_time = clock_();
        }
    }

    // Keeps only the most recent samples
    void record_latency(double seconds)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latencies_.push_back(seconds);
        while (latencies_.size() > max_latency_samples_) { latencies_.pop_front(); }
    }

    /**
     * @brief Received and sent events per minute over the window
     *
     * Also raises the peak received-per-minute when exceeded.
     */
    throughput throughput_per_minute()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rotate_slot();

        uint64_t received_sum = std::accumulate(received_history_.begin(), received_history_.end(), slot_received_);
        uint64_t sent_sum     = std::accumulate(sent_history_.begin(), sent_history_.end(), slot_sent_);

        double slots   = static_cast<double>(received_history_.size() + 1);
        double minutes = slots * std::chrono::duration<double>(slot_width_).count() / 60.0;
        if (minutes <= 0) { return {}; }

        throughput result{static_cast<double>(received_sum) / minutes, static_cast<double>(sent_sum) / minutes};
        if (result.received_per_minute > counters_.peak_per_minute)
        {
            counters_.peak_per_minute = result.received_per_minute;
        }
        return result;
    }

    double average_latency() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (latencies_.empty()) { return 0.0; }
        return std::accumulate(latencies_.begin(), latencies_.end(), 0.0) / static_cast<double>(latencies_.size());
    }

    std::chrono::seconds uptime() const
    {
        auto elapsed = clock_() - start_time_;
        if (elapsed.count() < 0) { return std::chrono::seconds(0); }
        return std::chrono::duration_cast<std::chrono::seconds>(elapsed);
    }

    // "1h 2m 3s", "2m 3s" or "3s"
    std::string uptime_text() const
    {
        auto total   = uptime().count();
        auto hours   = total / 3600;
        auto minutes = (total % 3600) / 60;
        auto seconds = total % 60;

        if (hours > 0) { return fmt::format("{}h {}m {}s", hours, minutes, seconds); }
        if (minutes > 0) { return fmt::format("{}m {}s", minutes, seconds); }
        return fmt::format("{}s", seconds);
    }

    // Average since startup
    double requests_per_minute() const
    {
        double elapsed = std::chrono::duration<double>(clock_() - start_time_).count();
        if (elapsed <= 0) { return 0.0; }

        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<double>(counters_.requests) / elapsed * 60.0;
    }

    relay_counters counters() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return counters_;
    }

    size_t history_slots() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_history_.size();
    }

  private:
    int64_t slot_of(wall_clock::time_point t) const
    {
        auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch());
        return since_epoch.count() / slot_width_.count();
    }

    void archive_slot(uint64_t received, uint64_t sent)
    {
        received_history_.push_back(received);
        sent_history_.push_back(sent);
        while (received_history_.size() > max_slots_)
        {
            received_history_.pop_front();
            sent_history_.pop_front();
        }
    }

    // Caller holds mutex_
    void rotate_slot()
    {
        int64_t now_slot = slot_of(clock_());
        if (now_slot <= current_slot_) { return; }

        archive_slot(slot_received_, slot_sent_);

        // Idle slots count as zero, at most a full window of them matters
        int64_t skipped = now_slot - current_slot_ - 1;
        if (skipped > static_cast<int64_t>(max_slots_)) { skipped = static_cast<int64_t>(max_slots_); }
        for (int64_t i = 0; i < skipped; ++i) { archive_slot(0, 0); }

        slot_received_ = 0;
        slot_sent_     = 0;
        current_slot_  = now_slot;
    }

    clock_fn clock_;
    std::chrono::seconds slot_width_;
    size_t max_slots_;
    size_t max_latency_samples_;
    wall_clock::time_point start_time_;

    mutable std::mutex mutex_;
    relay_counters counters_;
    std::deque<uint64_t> received_history_;
    std::deque<uint64_t> sent_history_;
    std::deque<double> latencies_;
    int64_t current_slot_    = 0;
    uint64_t slot_received_  = 0;
    uint64_t slot_sent_      = 0;
};

} // namespace chatrelay

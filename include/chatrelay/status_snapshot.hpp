/**
 * @file status_snapshot.hpp
 * @brief Point-in-time relay status for external reporting
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cmath>
#include <ctime>
#include <optional>
#include <string>

#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "health.hpp"
#include "intake_queue.hpp"
#include "relay_config.hpp"
#include "relay_stats.hpp"

namespace chatrelay
{

struct status_snapshot
{
    health_status status = health_status::ok;
    std::string uptime;
    int64_t uptime_seconds = 0;

    struct
    {
        size_t current = 0;
        size_t max     = 0;
        double percent = 0.0;
        size_t peak    = 0;
        std::optional<wall_clock::time_point> peak_time;
    } queue;

    struct
    {
        uint64_t received          = 0;
        uint64_t sent              = 0;
        uint64_t dropped           = 0;
        uint64_t failed            = 0;
        double received_per_minute = 0.0;
        double sent_per_minute     = 0.0;
        double peak_per_minute     = 0.0;
    } messages;

    struct
    {
        uint64_t requests          = 0;
        double requests_per_minute = 0.0;
        uint64_t rate_limits        = 0;
        uint64_t rate_limits_global = 0;
        uint64_t rate_limits_shared = 0;
        uint64_t rate_limits_user   = 0;
        uint64_t transient_failures = 0;
        double average_latency_ms   = 0.0;
    } performance;

    struct
    {
        double batch_window_s        = 0.0;
        size_t max_batch_size        = 0;
        double inter_request_delay_s = 0.0;
        size_t max_requests_per_cycle = 0;
        size_t theoretical_capacity   = 0;
    } config;
};

inline status_snapshot take_snapshot(relay_stats &stats, const intake_queue &queue, const relay_config &config)
{
    // Window read first so the peak it may raise is part of the counters copy
    auto rates    = stats.throughput_per_minute();
    auto counters = stats.counters();

    status_snapshot s;
    s.queue.current   = queue.size();
    s.queue.max       = config.max_queue_size;
    s.queue.percent   = queue_percent(s.queue.current, s.queue.max);
    s.queue.peak      = counters.peak_queue_size;
    s.queue.peak_time = counters.peak_queue_time;

    s.status         = evaluate_health(s.queue.current, s.queue.max, counters.rate_limits, counters.sent);
    s.uptime         = stats.uptime_text();
    s.uptime_seconds = stats.uptime().count();

    s.messages.received            = counters.received;
    s.messages.sent                = counters.sent;
    s.messages.dropped             = counters.dropped;
    s.messages.failed              = counters.failed;
    s.messages.received_per_minute = rates.received_per_minute;
    s.messages.sent_per_minute     = rates.sent_per_minute;
    s.messages.peak_per_minute     = counters.peak_per_minute;

    s.performance.requests            = counters.requests;
    s.performance.requests_per_minute = stats.requests_per_minute();
    s.performance.rate_limits         = counters.rate_limits;
    s.performance.rate_limits_global  = counters.rate_limits_global;
    s.performance.rate_limits_shared  = counters.rate_limits_shared;
    s.performance.rate_limits_user    = counters.rate_limits_user;
    s.performance.transient_failures  = counters.transient_failures;
    s.performance.average_latency_ms  = stats.average_latency() * 1000.0;

    s.config.batch_window_s         = std::chrono::duration<double>(config.batch_window).count();
    s.config.max_batch_size         = config.max_batch_size;
    s.config.inter_request_delay_s  = std::chrono::duration<double>(config.inter_request_delay).count();
    s.config.max_requests_per_cycle = config.max_requests_per_cycle;
    s.config.theoretical_capacity   = config.theoretical_capacity();
    return s;
}

namespace detail
{

inline double round1(double value) { return std::round(value * 10.0) / 10.0; }

inline std::string iso_local_time(wall_clock::time_point t)
{
    std::time_t tt = wall_clock::to_time_t(t);
    std::tm local{};
    localtime_r(&tt, &local);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", local);
}

} // namespace detail

/**
 * @brief Render a snapshot for monitoring scripts, rates rounded to one decimal
 */
inline nlohmann::json to_json(const status_snapshot &s)
{
    nlohmann::json peak_time = nullptr;
    if (s.queue.peak_time) { peak_time = detail::iso_local_time(*s.queue.peak_time); }

    return {
        {"status", to_string(s.status)},
        {"uptime", s.uptime},
        {"uptime_seconds", s.uptime_seconds},
        {"queue",
         {
             {"current", s.queue.current},
             {"max", s.queue.max},
             {"percent", detail::round1(s.queue.percent)},
             {"peak", s.queue.peak},
             {"peak_time", peak_time},
         }},
        {"messages",
         {
             {"total_received", s.messages.received},
             {"total_sent", s.messages.sent},
             {"total_dropped", s.messages.dropped},
             {"total_failed", s.messages.failed},
             {"received_per_minute", detail::round1(s.messages.received_per_minute)},
             {"sent_per_minute", detail::round1(s.messages.sent_per_minute)},
             {"peak_per_minute", detail::round1(s.messages.peak_per_minute)},
         }},
        {"performance",
         {
             {"total_requests", s.performance.requests},
             {"requests_per_minute", detail::round1(s.performance.requests_per_minute)},
             {"rate_limits", s.performance.rate_limits},
             {"rate_limits_global", s.performance.rate_limits_global},
             {"rate_limits_shared", s.performance.rate_limits_shared},
             {"rate_limits_user", s.performance.rate_limits_user},
             {"transient_failures", s.performance.transient_failures},
             {"average_latency_ms", detail::round1(s.performance.average_latency_ms)},
         }},
        {"config",
         {
             {"batch_window", s.config.batch_window_s},
             {"max_batch_size", s.config.max_batch_size},
             {"inter_request_delay", s.config.inter_request_delay_s},
             {"max_requests_per_cycle", s.config.max_requests_per_cycle},
             {"theoretical_capacity", s.config.theoretical_capacity},
         }},
    };
}

} // namespace chatrelay

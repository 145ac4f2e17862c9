/**
 * @file test_relay_stats.cpp
 * @brief Tests for relay counters and the sliding throughput window
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <chrono>
#include <thread>
#include <vector>

#include "test_support.hpp"

using namespace chatrelay;
using namespace std::chrono_literals;
using Catch::Approx;

// Manually stepped clock, starting on a slot boundary
class stats_clock_fixture
{
  protected:
    wall_clock::time_point now{std::chrono::seconds(1700000000)};
    relay_stats stats{[this] { return now; }};
};

TEST_CASE_METHOD(stats_clock_fixture, "Counters", "[stats]")
{
    stats.record_received();
    stats.record_received();
    stats.record_sent(2);
    stats.record_dropped(3);
    stats.record_failed();
    stats.record_request();
    stats.record_transient_failure();
    stats.record_rate_limit(rate_limit_scope::global);
    stats.record_rate_limit(rate_limit_scope::shared);
    stats.record_rate_limit(rate_limit_scope::user);
    stats.record_rate_limit(rate_limit_scope::user);

    auto c = stats.counters();
    REQUIRE(c.received == 2);
    REQUIRE(c.sent == 2);
    REQUIRE(c.dropped == 3);
    REQUIRE(c.failed == 1);
    REQUIRE(c.requests == 1);
    REQUIRE(c.transient_failures == 1);
    REQUIRE(c.rate_limits == 4);
    REQUIRE(c.rate_limits_global == 1);
    REQUIRE(c.rate_limits_shared == 1);
    REQUIRE(c.rate_limits_user == 2);
}

TEST_CASE_METHOD(stats_clock_fixture, "Queue peak keeps the maximum and its time", "[stats]")
{
    REQUIRE_FALSE(stats.counters().peak_queue_time);

    stats.update_queue_peak(5);
    auto first_peak_time = now;
    now += 3s;
    stats.update_queue_peak(3);

    auto c = stats.counters();
    REQUIRE(c.peak_queue_size == 5);
    REQUIRE(c.peak_queue_time == first_peak_time);

    stats.update_queue_peak(9);
    REQUIRE(stats.counters().peak_queue_size == 9);
    REQUIRE(stats.counters().peak_queue_time == now);
}

TEST_CASE_METHOD(stats_clock_fixture, "Throughput over the sliding window", "[stats][window]")
{
    SECTION("Only the current slot")
    {
        for (int i = 0; i < 5; ++i) { stats.record_received(); }
        stats.record_sent(2);

        // 5 events in one 10s slot = 30/min
        auto rate = stats.throughput_per_minute();
        REQUIRE(rate.received_per_minute == Approx(30.0));
        REQUIRE(rate.sent_per_minute == Approx(12.0));
    }

    SECTION("Archived slots are averaged with the current one")
    {
        for (int i = 0; i < 6; ++i) { stats.record_received(); }
        now += 10s;
        for (int i = 0; i < 2; ++i) { stats.record_received(); }

        // 8 events over 2 slots (20s)
        REQUIRE(stats.throughput_per_minute().received_per_minute == Approx(24.0));
        REQUIRE(stats.history_slots() == 1);
    }

    SECTION("Skipped slots count as idle")
    {
        for (int i = 0; i < 6; ++i) { stats.record_received(); }
        now += 40s;

        // The busy slot plus three empty ones archived, one current: 6 events over 50s
        REQUIRE(stats.throughput_per_minute().received_per_minute == Approx(7.2));
        REQUIRE(stats.history_slots() == 4);
    }

    SECTION("History is capped at the window size")
    {
        for (int i = 0; i < 100; ++i)
        {
            stats.record_received();
            now += 10s;
        }
        stats.throughput_per_minute();
        REQUIRE(stats.history_slots() == 30);

        now += 1h;
        REQUIRE(stats.throughput_per_minute().received_per_minute == Approx(0.0));
        REQUIRE(stats.history_slots() == 30);
    }
}

TEST_CASE_METHOD(stats_clock_fixture, "Reading throughput is idempotent", "[stats][window]")
{
    for (int i = 0; i < 4; ++i) { stats.record_received(); }
    now += 10s;
    stats.record_received();

    auto first = stats.throughput_per_minute();
    for (int i = 0; i < 10; ++i)
    {
        auto again = stats.throughput_per_minute();
        REQUIRE(again.received_per_minute == first.received_per_minute);
        REQUIRE(again.sent_per_minute == first.sent_per_minute);
    }
    REQUIRE(stats.history_slots() == 1);
}

TEST_CASE_METHOD(stats_clock_fixture, "Peak per minute follows throughput reads", "[stats][window]")
{
    for (int i = 0; i < 10; ++i) { stats.record_received(); }
    auto busy = stats.throughput_per_minute().received_per_minute;

    now += 2min;
    stats.throughput_per_minute();

    REQUIRE(stats.counters().peak_per_minute == Approx(busy));
}

TEST_CASE_METHOD(stats_clock_fixture, "Average latency over recent samples", "[stats][latency]")
{
    REQUIRE(stats.average_latency() == 0.0);

    stats.record_latency(1.0);
    stats.record_latency(3.0);
    REQUIRE(stats.average_latency() == Approx(2.0));

    // Only the last 100 samples count
    for (int i = 0; i < 100; ++i) { stats.record_latency(0.5); }
    REQUIRE(stats.average_latency() == Approx(0.5));
}

TEST_CASE_METHOD(stats_clock_fixture, "Uptime and request rate", "[stats]")
{
    REQUIRE(stats.uptime_text() == "0s");
    REQUIRE(stats.requests_per_minute() == 0.0);

    now += 42s;
    REQUIRE(stats.uptime_text() == "42s");

    now += 2min;
    REQUIRE(stats.uptime_text() == "2m 42s");

    now += 1h;
    REQUIRE(stats.uptime_text() == "1h 2m 42s");
    REQUIRE(stats.uptime() == 3762s);

    for (int i = 0; i < 627; ++i) { stats.record_request(); }
    REQUIRE(stats.requests_per_minute() == Approx(10.0));
}

TEST_CASE("Concurrent writers never lose updates", "[stats][threading]")
{
    relay_stats stats;
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t)
    {
        threads.emplace_back([&] {
            for (int i = 0; i < PER_THREAD; ++i)
            {
                stats.record_received();
                stats.record_sent();
                stats.throughput_per_minute();
            }
        });
    }
    for (auto &t : threads) { t.join(); }

    auto c = stats.counters();
    REQUIRE(c.received == THREADS * PER_THREAD);
    REQUIRE(c.sent == THREADS * PER_THREAD);
}

/**
 * @file test_intake_queue.cpp
 * @brief Tests for the intake queue
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <vector>

#include "test_support.hpp"

using namespace chatrelay;
using namespace chatrelay::testing;
using namespace std::chrono_literals;

TEST_CASE("Intake queue is FIFO", "[intake_queue]")
{
    intake_queue queue;
    for (int i = 0; i < 5; ++i) { queue.enqueue(make_event("m" + std::to_string(i))); }

    REQUIRE(queue.size() == 5);
    for (int i = 0; i < 5; ++i)
    {
        auto event = queue.dequeue_blocking(10ms);
        REQUIRE(event);
        REQUIRE(event->message == "m" + std::to_string(i));
    }
    REQUIRE(queue.empty());
}

TEST_CASE("Dequeue waits a bounded time", "[intake_queue]")
{
    intake_queue queue;

    SECTION("Times out when empty")
    {
        auto start = std::chrono::steady_clock::now();
        auto event = queue.dequeue_blocking(30ms);
        auto took  = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(event);
        REQUIRE(took >= 30ms);
        REQUIRE(took < 2s);
    }

    SECTION("Wakes when a producer enqueues")
    {
        std::thread producer([&] {
            std::this_thread::sleep_for(20ms);
            queue.enqueue(make_event("late"));
        });

        auto event = queue.dequeue_blocking(5s);
        producer.join();

        REQUIRE(event);
        REQUIRE(event->message == "late");
    }

    SECTION("try_dequeue never waits")
    {
        REQUIRE_FALSE(queue.try_dequeue());
        queue.enqueue(make_event("x"));
        REQUIRE(queue.try_dequeue()->message == "x");
    }
}

TEST_CASE("Concurrent producers lose nothing and keep per-producer order", "[intake_queue][threading]")
{
    intake_queue queue;
    constexpr int PRODUCERS    = 4;
    constexpr int PER_PRODUCER = 250;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p)
    {
        producers.emplace_back([&, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) { queue.enqueue(make_event(std::to_string(i), "p" + std::to_string(p))); }
        });
    }

    std::vector<int> next(PRODUCERS, 0);
    int received = 0;
    while (received < PRODUCERS * PER_PRODUCER)
    {
        auto event = queue.dequeue_blocking(1s);
        REQUIRE(event);

        int producer = std::stoi(event->sender.substr(1));
        REQUIRE(std::stoi(event->message) == next[producer]);
        next[producer]++;
        received++;
    }

    for (auto &t : producers) { t.join(); }
    REQUIRE(queue.empty());
}

/**
 * @file test_batch_splitter.cpp
 * @brief Tests for character-bounded batch splitting
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "test_support.hpp"

using namespace chatrelay;
using namespace chatrelay::testing;

namespace
{

// "**p**: " is 7 characters
constexpr size_t PREFIX = 7;

display_options plain()
{
    display_options options;
    options.timestamp_format.clear();
    options.show_radius  = false;
    options.show_channel = false;
    return options;
}

std::vector<chat_event> events_of(const std::vector<std::string> &messages)
{
    std::vector<chat_event> events;
    for (const auto &m : messages) { events.push_back(make_event(m)); }
    return events;
}

std::vector<std::string> flatten(const std::vector<batch> &batches)
{
    std::vector<std::string> messages;
    for (const auto &b : batches)
    {
        for (const auto &e : b.events) { messages.push_back(e.message); }
    }
    return messages;
}

} // namespace

TEST_CASE("Everything fits in one batch", "[splitter]")
{
    auto batches = split_batches(events_of({"a", "b", "c"}), plain(), {1900, 2000});

    REQUIRE(batches.size() == 1);
    REQUIRE(batches[0].size() == 3);
    REQUIRE(batches[0].content == "**p**: a\n**p**: b\n**p**: c");
    REQUIRE(batches[0].chars == batches[0].content.size());
}

TEST_CASE("Budget boundary counts the joining newline", "[splitter]")
{
    // Each line is PREFIX + 3 = 10 chars, 11 with its newline
    auto events = events_of({"aaa", "bbb", "ccc"});

    SECTION("Exactly two lines fit in 22")
    {
        auto batches = split_batches(events, plain(), {22, 2000});
        REQUIRE(batches.size() == 2);
        REQUIRE(batches[0].size() == 2);
        REQUIRE(batches[1].size() == 1);
    }

    SECTION("One less forces one line per batch")
    {
        auto batches = split_batches(events, plain(), {21, 2000});
        REQUIRE(batches.size() == 3);
    }
}

TEST_CASE("Order is preserved across batches and no batch exceeds the budget", "[splitter]")
{
    std::vector<std::string> messages;
    for (int i = 0; i < 200; ++i) { messages.push_back(std::string(static_cast<size_t>(i % 37 + 1), 'x') + std::to_string(i)); }

    auto batches = split_batches(events_of(messages), plain(), {300, 400});

    REQUIRE(batches.size() > 1);
    REQUIRE(flatten(batches) == messages);
    for (const auto &b : batches)
    {
        REQUIRE_FALSE(b.events.empty());
        REQUIRE(b.chars <= 300);
        REQUIRE(utf8::length(b.content) == b.chars);
    }
}

TEST_CASE("Oversized lines", "[splitter]")
{
    SECTION("Line over the hard limit is truncated with a marker and sent alone")
    {
        auto long_message = std::string(2500 - PREFIX, 'L');
        auto batches      = split_batches(events_of({"before", long_message, "after"}), plain(), {1900, 2000});

        REQUIRE(batches.size() == 3);
        REQUIRE(batches[1].size() == 1);
        REQUIRE(batches[1].chars == 2000);
        REQUIRE(batches[1].content.substr(batches[1].content.size() - 3) == "...");
        REQUIRE(batches[1].content.size() == 2000);
        REQUIRE(batches[1].content.substr(0, 1997) == ("**p**: " + long_message).substr(0, 1997));
        REQUIRE(flatten(batches) == std::vector<std::string>{"before", long_message, "after"});
    }

    SECTION("Line between the safe and hard limit is kept whole and alone")
    {
        auto message = std::string(1950 - PREFIX, 'M');
        auto batches = split_batches(events_of({"a", message, "b"}), plain(), {1900, 2000});

        REQUIRE(batches.size() == 3);
        REQUIRE(batches[1].chars == 1950);
        REQUIRE(batches[1].content.find("...") == std::string::npos);
    }

    SECTION("Multibyte text is measured in characters")
    {
        std::string accented;
        for (int i = 0; i < 100; ++i) { accented += "\xC3\xA9"; } // 100 chars, 200 bytes

        auto batches = split_batches(events_of({accented, accented}), plain(), {250, 300});
        REQUIRE(batches.size() == 1);
        REQUIRE(batches[0].chars == 2 * (PREFIX + 100) + 1);
    }
}

TEST_CASE("Empty messages are dropped", "[splitter]")
{
    auto batches = split_batches(events_of({"", "x", ""}), plain(), {1900, 2000});

    REQUIRE(batches.size() == 1);
    REQUIRE(batches[0].size() == 1);

    REQUIRE(split_batches(events_of({"", ""}), plain(), {1900, 2000}).empty());
    REQUIRE(split_batches({}, plain(), {1900, 2000}).empty());
}

/**
 * @file batch_splitter.hpp
 * @brief Splits an ordered run of events into character-bounded batches
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <string>
#include <vector>

#include "message_formatter.hpp"
#include "relay_types.hpp"
#include "utf8.hpp"

namespace chatrelay
{

/**
 * @brief Events sent together in one request, with their rendered content
 */
struct batch
{
    std::vector<chat_event> events;
    std::string content; ///< Lines joined by '\n'
    size_t chars = 0;    ///< Length of content in code points

    size_t size() const { return events.size(); }
};

struct split_limits
{
    size_t safe_chars = 1900; ///< Budget for a batch of several lines
    size_t hard_chars = 2000; ///< Transport maximum for a single message
};

/**
 * @brief Group events into batches without reordering or splitting them
 *
 * A line is appended while `current + line + 1 <= safe_chars` (the extra
 * character is the joining newline), otherwise the current batch is closed
 * and the line starts a new one. A line longer than the safe budget always
 * gets a batch of its own, truncated to `hard_chars` with a "..." marker when
 * it exceeds even that. Events whose body is empty produce no line and are
 * left out.
 */
inline std::vector<batch> split_batches(std::vector<chat_event> events, const display_options &display, split_limits limits)
{
    std::vector<batch> batches;
    batch current;
    size_t current_length = 0;

    auto close_current = [&]
    {
        if (current.events.empty()) return;
        current.chars = current_length - 1;
        batches.push_back(std::move(current));
        current        = batch{};
        current_length = 0;
    };

    for (auto &event : events)
    {
        auto formatted = format_event(event, display);
        if (!formatted) { continue; }

        std::string line = utf8::length(*formatted) > limits.hard_chars ? utf8::truncate(*formatted, limits.hard_chars)
                                                                        : std::move(*formatted);
        size_t line_length = utf8::length(line) + 1;

        if (current_length + line_length > limits.safe_chars && !current.events.empty()) { close_current(); }

        if (!current.content.empty()) { current.content.push_back('\n'); }
        current.content.append(line);
        current.events.push_back(std::move(event));
        current_length += line_length;

        // An oversized line must not share its batch with what follows
        if (current_length > limits.safe_chars) { close_current(); }
    }

    close_current();
    return batches;
}

} // namespace chatrelay

/**
 * @file message_formatter.hpp
 * @brief Renders one chat event as a line of chat markdown
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cctype>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "relay_config.hpp"
#include "relay_types.hpp"

namespace chatrelay
{

namespace detail
{

// "WHISPER" -> "Whisper"
inline std::string capitalize(std::string_view word)
{
    std::string result;
    result.reserve(word.size());
    for (char c : word) { result.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c)))); }
    if (!result.empty()) { result[0] = static_cast<char>(::toupper(static_cast<unsigned char>(result[0]))); }
    return result;
}

} // namespace detail

/**
 * @brief Format an event for the endpoint
 *
 * Layout: `<t:UNIX:T> **sender** (character) [Radius]: message`, optionally
 * followed by a small-text footer line `-# Location: ... | Channel: ...`.
 * The timestamp is the reception time, never the send time.
 *
 * @return The line, or std::nullopt when the event has no message body
 */
inline std::optional<std::string> format_event(const chat_event &event, const display_options &options)
{
    if (event.message.empty()) { return std::nullopt; }

    std::string line;
    auto out = std::back_inserter(line);

    if (!options.timestamp_format.empty())
    {
        auto unix_seconds =
            std::chrono::duration_cast<std::chrono::seconds>(event.received_wall.time_since_epoch()).count();
        fmt::format_to(out, "<t:{}:{}> ", unix_seconds, options.timestamp_format);
    }

    const std::string &sender = event.sender.empty() ? std::string("Unknown") : event.sender;
    if (options.show_character && event.character && !event.character->empty() && *event.character != sender)
    {
        fmt::format_to(out, "**{}** ({})", sender, *event.character);
    }
    else { fmt::format_to(out, "**{}**", sender); }

    if (options.show_radius)
    {
        fmt::format_to(out, " [{}]: {}", detail::capitalize(event.radius.empty() ? "say" : event.radius), event.message);
    }
    else { fmt::format_to(out, ": {}", event.message); }

    std::vector<std::string> footer;
    if (options.show_location && event.location && !event.location->empty())
    {
        footer.push_back(fmt::format("Location: {}", *event.location));
    }
    if (options.show_channel && event.channel && !event.channel->empty())
    {
        footer.push_back(fmt::format("Channel: {}", *event.channel));
    }
    if (!footer.empty()) { fmt::format_to(out, "\n-# {}", fmt::join(footer, " | ")); }

    return line;
}

} // namespace chatrelay

/**
 * @file intake_gate.hpp
 * @brief Admission of incoming events into the intake queue
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "intake_queue.hpp"
#include "log.hpp"
#include "relay_config.hpp"
#include "relay_stats.hpp"
#include "relay_types.hpp"
#include "utf8.hpp"

namespace chatrelay
{

/**
 * @brief Build an event from a JSON object and stamp its reception time
 *
 * Only string members are read; unknown keys and non-string values are
 * ignored. Missing sender and radius fall back to "Unknown" and "say".
 *
 * @throws std::invalid_argument when @p object is not a JSON object
 */
inline chat_event parse_event(const nlohmann::json &object)
{
    if (!object.is_object()) { throw std::invalid_argument("event must be a JSON object"); }

    chat_event event;
    event.stamp_reception();

    auto text = [&](const char *key) -> std::optional<std::string>
    {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string()) { return std::nullopt; }
        return it->get<std::string>();
    };

    if (auto sender = text("sender"); sender && !sender->empty()) { event.sender = *sender; }
    if (auto radius = text("radius"); radius && !radius->empty()) { event.radius = *radius; }
    event.message   = text("message").value_or("");
    event.character = text("character");
    event.location  = text("location");
    event.channel   = text("channel");
    return event;
}

/**
 * @brief Front door of the relay, applies the channel filter and the capacity check
 *
 * Safe to call from any number of threads.
 */
class intake_gate
{
  public:
    intake_gate(intake_queue &queue, relay_stats &stats, const relay_config &config)
    : queue_(queue),
      stats_(stats),
      max_queue_size_(config.max_queue_size),
      allowed_channels_(config.allowed_channels)
    {
    }

    intake_status submit(chat_event event)
    {
        try
        {
            const std::string channel = event.channel.value_or("");
            if (!allowed_channels_.empty() &&
                std::find(allowed_channels_.begin(), allowed_channels_.end(), channel) == allowed_channels_.end())
            {
                LOG_MOD(info, "intake").format("[Channel {} ignored] {}: {}", channel, event.sender, preview(event.message, 50));
                return intake_status::ignored;
            }

            stats_.record_received();

            size_t current_size = queue_.size();
            stats_.update_queue_peak(current_size);

            LOG_MOD(info, "intake").format("[{}] {}: {}", event.radius, event.sender, preview(event.message, 80));

            if (current_size >= max_queue_size_)
            {
                stats_.record_dropped();
                LOG_MOD(warn, "intake").format("Queue full ({}), message ignored", max_queue_size_);
                return intake_status::queue_full;
            }

            if (event.message.find_first_not_of(" \t\r\n") != std::string::npos) { queue_.enqueue(std::move(event)); }
            return intake_status::accepted;
        }
        catch (const std::exception &e)
        {
            LOG_MOD(error, "intake") << "Error admitting event: " << e.what();
            return intake_status::internal_error;
        }
    }

  private:
    static std::string preview(std::string_view message, size_t max_chars)
    {
        if (message.empty()) { return "(empty)"; }
        return std::string(message.substr(0, utf8::offset_of(message, max_chars)));
    }

    intake_queue &queue_;
    relay_stats &stats_;
    size_t max_queue_size_;
    std::vector<std::string> allowed_channels_;
};

/**
 * @brief Submit one line of newline-delimited JSON
 *
 * Rejections are logged here so every caller surfaces them the same way.
 *
 * @return The gate's status, or nothing for a blank or malformed line
 */
inline std::optional<intake_status> submit_line(intake_gate &gate, std::string_view line)
{
    if (line.find_first_not_of(" \t\r") == std::string_view::npos) { return std::nullopt; }

    auto json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded() || !json.is_object())
    {
        LOG_MOD(warn, "intake") << "Skipping malformed event line: " << line.substr(0, utf8::offset_of(line, 80));
        return std::nullopt;
    }

    auto status = gate.submit(parse_event(json));
    if (status == intake_status::queue_full || status == intake_status::internal_error)
    {
        LOG_MOD(warn, "intake").format("Event not relayed ({})", to_string(status));
    }
    return status;
}

} // namespace chatrelay

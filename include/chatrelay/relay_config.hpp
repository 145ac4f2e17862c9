/**
 * @file relay_config.hpp
 * @brief Relay configuration, environment loading and validation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Every setting has a name used both for the environment (`CHATRELAY_<NAME>`,
 * upper case) and for command-line overrides (`--<name>` with dashes):
 *
 * @code
 * CHATRELAY_WEBHOOK_URL=https://... CHATRELAY_BATCH_WINDOW=2.5 chatrelay-bridge --max-queue-size 800
 * @endcode
 *
 * Durations are given in (fractional) seconds.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "log_types.hpp"

namespace chatrelay
{

class config_error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief How a single event is rendered into a chat line
 */
struct display_options
{
    std::string timestamp_format{"T"}; ///< Discord timestamp style (t, T, d, D, f, F, R), empty to omit
    bool show_character = true;
    bool show_radius    = true;
    bool show_location  = false;
    bool show_channel   = true;
};

struct relay_config
{
    // Endpoint
    std::string webhook_url;
    std::string bot_name{"CONAN_CHAT"};
    std::string bot_avatar;
    uint16_t port = 3000;

    // Batching and pacing
    std::chrono::milliseconds batch_window{2500};
    size_t max_batch_size = 20;
    std::chrono::milliseconds inter_request_delay{500};
    size_t max_requests_per_cycle = 1; ///< 0 = unlimited

    // Buffers
    size_t max_queue_size    = 500;
    size_t max_retry_backlog = 200;

    // Character budget
    size_t safe_char_limit = 1900;
    size_t hard_char_limit = 2000;

    // Worker timing
    std::chrono::milliseconds stats_log_interval{300000};
    std::chrono::milliseconds http_timeout{10000};
    std::chrono::milliseconds transient_backoff{2000};
    std::chrono::milliseconds max_retry_after{3600000}; ///< Upper bound on a server-requested retry delay
    std::chrono::milliseconds backoff_poll_ceiling{500};
    std::chrono::milliseconds idle_pause{100};
    std::chrono::milliseconds error_pause{1000};
    std::chrono::milliseconds shutdown_grace{5000};
    std::chrono::milliseconds max_event_age{0}; ///< 0 = events never expire

    std::vector<std::string> allowed_channels; ///< Empty accepts every channel
    display_options display;

    // Logging
    std::string log_file{"bridge.log"};
    uint64_t log_max_bytes = LOG_DEFAULT_ROTATE_BYTES;
    int log_backup_count   = LOG_DEFAULT_KEEP_FILES;
    std::string log_level{"info"};

    /**
     * @brief Events per minute the pacing allows, (60 / window) x max batch size
     */
    size_t theoretical_capacity() const
    {
        double window_s = std::chrono::duration<double>(batch_window).count();
        if (window_s <= 0) return 0;
        return static_cast<size_t>((60.0 / window_s) * static_cast<double>(max_batch_size));
    }

    /**
     * @brief Reject configurations the worker cannot run with
     * @throws config_error describing the first problem found
     */
    void validate() const
    {
        if (webhook_url.empty() || webhook_url == "PASTE_YOUR_WEBHOOK")
        {
            throw config_error("webhook_url is not configured");
        }
        if (webhook_url.rfind("http://", 0) != 0 && webhook_url.rfind("https://", 0) != 0)
        {
            throw config_error("webhook_url must be an http(s) URL: " + webhook_url);
        }
        if (batch_window.count() <= 0) { throw config_error("batch_window must be positive"); }
        if (max_batch_size == 0) { throw config_error("max_batch_size must be at least 1"); }
        if (inter_request_delay.count() < 0) { throw config_error("inter_request_delay must not be negative"); }
        if (max_queue_size == 0) { throw config_error("max_queue_size must be at least 1"); }
        if (hard_char_limit <= 3) { throw config_error("hard_char_limit must be larger than 3"); }
        if (safe_char_limit == 0 || safe_char_limit > hard_char_limit)
        {
            throw config_error("safe_char_limit must be between 1 and hard_char_limit");
        }
        if (backoff_poll_ceiling.count() <= 0) { throw config_error("backoff_poll_ceiling must be positive"); }
        if (http_timeout.count() <= 0) { throw config_error("http_timeout must be positive"); }
        if (max_retry_after.count() <= 0) { throw config_error("max_retry_after must be positive"); }
        if (shutdown_grace.count() < 0) { throw config_error("shutdown_grace must not be negative"); }
        if (max_event_age.count() < 0) { throw config_error("max_event_age must not be negative"); }
        if (log_backup_count < 0) { throw config_error("log_backup_count must not be negative"); }

        static constexpr std::string_view formats = "tTdDfFR";
        const auto &ts                            = display.timestamp_format;
        if (!ts.empty() && (ts.size() != 1 || formats.find(ts[0]) == std::string_view::npos))
        {
            throw config_error("timestamp_format must be one of t, T, d, D, f, F, R or empty: " + ts);
        }

        if (log_level_from_string(log_level.c_str()) == log_level::nolog && log_level != "off" && log_level != "nolog" &&
            log_level != "none")
        {
            throw config_error("unknown log_level: " + log_level);
        }
    }
};

namespace detail
{

inline constexpr double MAX_SETTING_SECONDS = 1e9;

template <typename T> T parse_integer(std::string_view name, std::string_view value)
{
    T result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size())
    {
        throw config_error(fmt::format("{}: expected an unsigned integer, got '{}'", name, value));
    }
    return result;
}

inline std::chrono::milliseconds parse_seconds(std::string_view name, std::string_view value)
{
    double seconds{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc() || ptr != value.data() + value.size() || seconds < 0)
    {
        throw config_error(fmt::format("{}: expected a duration in seconds, got '{}'", name, value));
    }
    if (seconds > MAX_SETTING_SECONDS)
    {
        throw config_error(fmt::format("{}: {}s is larger than {}s", name, value, MAX_SETTING_SECONDS));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0 + 0.5));
}

inline bool parse_bool(std::string_view name, std::string_view value)
{
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw config_error(fmt::format("{}: expected a boolean, got '{}'", name, value));
}

inline std::vector<std::string> parse_list(std::string_view value)
{
    std::vector<std::string> items;
    while (!value.empty())
    {
        auto comma            = value.find(',');
        std::string_view item = value.substr(0, comma);
        while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
        while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
        if (!item.empty()) { items.emplace_back(item); }
        if (comma == std::string_view::npos) break;
        value.remove_prefix(comma + 1);
    }
    return items;
}

} // namespace detail

/**
 * @brief Apply one named setting
 * @param name Setting name, lower case with underscores or dashes
 * @throws config_error for unknown names and unparsable values
 */
inline void apply_setting(relay_config &config, std::string_view name, std::string_view value)
{
    std::string key(name);
    std::replace(key.begin(), key.end(), '-', '_');
    std::transform(key.begin(), key.end(), key.begin(), ::tolower);

    if (key == "webhook_url") config.webhook_url = value;
    else if (key == "bot_name") config.bot_name = value;
    else if (key == "bot_avatar") config.bot_avatar = value;
    else if (key == "port") config.port = detail::parse_integer<uint16_t>(key, value);
    else if (key == "batch_window") config.batch_window = detail::parse_seconds(key, value);
    else if (key == "max_batch_size") config.max_batch_size = detail::parse_integer<size_t>(key, value);
    else if (key == "inter_request_delay") config.inter_request_delay = detail::parse_seconds(key, value);
    else if (key == "max_requests_per_cycle") config.max_requests_per_cycle = detail::parse_integer<size_t>(key, value);
    else if (key == "max_queue_size") config.max_queue_size = detail::parse_integer<size_t>(key, value);
    else if (key == "max_retry_backlog") config.max_retry_backlog = detail::parse_integer<size_t>(key, value);
    else if (key == "safe_char_limit") config.safe_char_limit = detail::parse_integer<size_t>(key, value);
    else if (key == "hard_char_limit") config.hard_char_limit = detail::parse_integer<size_t>(key, value);
    else if (key == "stats_log_interval") config.stats_log_interval = detail::parse_seconds(key, value);
    else if (key == "http_timeout") config.http_timeout = detail::parse_seconds(key, value);
    else if (key == "transient_backoff") config.transient_backoff = detail::parse_seconds(key, value);
    else if (key == "max_retry_after") config.max_retry_after = detail::parse_seconds(key, value);
    else if (key == "backoff_poll_ceiling") config.backoff_poll_ceiling = detail::parse_seconds(key, value);
    else if (key == "shutdown_grace") config.shutdown_grace = detail::parse_seconds(key, value);
    else if (key == "max_event_age") config.max_event_age = detail::parse_seconds(key, value);
    else if (key == "allowed_channels") config.allowed_channels = detail::parse_list(value);
    else if (key == "timestamp_format") config.display.timestamp_format = value;
    else if (key == "show_character") config.display.show_character = detail::parse_bool(key, value);
    else if (key == "show_radius") config.display.show_radius = detail::parse_bool(key, value);
    else if (key == "show_location") config.display.show_location = detail::parse_bool(key, value);
    else if (key == "show_channel") config.display.show_channel = detail::parse_bool(key, value);
    else if (key == "log_file") config.log_file = value;
    else if (key == "log_max_bytes") config.log_max_bytes = detail::parse_integer<uint64_t>(key, value);
    else if (key == "log_backup_count") config.log_backup_count = detail::parse_integer<int>(key, value);
    else if (key == "log_level") config.log_level = value;
    else throw config_error(fmt::format("unknown setting '{}'", name));
}

// Names understood by apply_setting(), in the order they are documented
inline constexpr std::string_view config_setting_names[] = {
    "webhook_url",          "bot_name",            "bot_avatar",          "port",
    "batch_window",         "max_batch_size",      "inter_request_delay", "max_requests_per_cycle",
    "max_queue_size",       "max_retry_backlog",   "safe_char_limit",     "hard_char_limit",
    "stats_log_interval",   "http_timeout",        "transient_backoff",   "max_retry_after",
    "backoff_poll_ceiling", "shutdown_grace",      "max_event_age",       "allowed_channels",
    "timestamp_format",     "show_character",      "show_radius",         "show_location",
    "show_channel",         "log_file",            "log_max_bytes",       "log_backup_count",
    "log_level",
};

using env_lookup = std::function<const char *(const char *)>;

/**
 * @brief Build a configuration from defaults overridden by `CHATRELAY_*` variables
 * @param lookup Environment accessor, replaceable in tests
 */
inline relay_config load_config_from_env(const env_lookup &lookup = [](const char *name) { return std::getenv(name); })
{
    relay_config config;
    for (auto name : config_setting_names)
    {
        std::string var = "CHATRELAY_";
        for (char c : name) { var.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c)))); }

        if (const char *value = lookup(var.c_str())) { apply_setting(config, name, value); }
    }
    return config;
}

} // namespace chatrelay

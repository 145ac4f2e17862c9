/**
 * @file webhook_sender.hpp
 * @brief Single-attempt delivery of a batch to the chat webhook
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "batch_splitter.hpp"
#include "http_transport.hpp"
#include "log.hpp"
#include "relay_config.hpp"
#include "relay_stats.hpp"
#include "relay_types.hpp"
#include "utf8.hpp"

namespace chatrelay
{

/**
 * @brief Posts content to the webhook and classifies the response
 *
 * The sender never sleeps and never retries: every call is exactly one
 * request, counted in the stats whatever its outcome. Waiting and retrying
 * are decided by the dispatch worker from the returned outcome. Transports
 * report network failures as transport_error; any other exception is not a
 * delivery outcome and propagates to the caller.
 *
 * | Response                  | Outcome                              |
 * |---------------------------|--------------------------------------|
 * | 2xx                       | success                              |
 * | 429                       | rate_limited (body retry_after, X-RateLimit-Scope) |
 * | 401, 404                  | permanent_reject (invalid_endpoint)  |
 * | 5xx, timeout, no response | transient_failure                    |
 * | anything else             | permanent_reject (rejected)          |
 */
class webhook_sender
{
  public:
    static constexpr double DEFAULT_RETRY_AFTER = 2.0; // Seconds, when a 429 carries none

    webhook_sender(http_transport &transport, relay_stats &stats, const relay_config &config)
    : transport_(transport),
      stats_(stats),
      url_(config.webhook_url),
      bot_name_(config.bot_name),
      bot_avatar_(config.bot_avatar),
      hard_chars_(config.hard_char_limit),
      timeout_(config.http_timeout),
      transient_backoff_(config.transient_backoff),
      max_retry_after_(config.max_retry_after)
    {
    }

    dispatch_outcome send(const batch &b) { return send(b.content); }

    dispatch_outcome send(std::string_view content)
    {
        if (content.empty()) { return outcome::success{}; }

        http_request request;
        request.url     = url_;
        request.timeout = timeout_;
        // Chat text comes from arbitrary producers, invalid UTF-8 is replaced rather than rejected
        request.body = build_payload(content).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        stats_.record_request();

        http_response response;
        try
        {
            response = transport_.post(request);
        }
        catch (const transport_error &e)
        {
            if (e.timed_out())
            {
                LOG_MOD(error, "sender").format("Timeout sending to webhook ({}s)",
                                                std::chrono::duration<double>(timeout_).count());
            }
            else { LOG_MOD(error, "sender") << "Send error: " << e.what(); }
            return outcome::transient_failure{transient_backoff_};
        }

        return classify(response);
    }

    /**
     * @brief JSON body for one message
     *
     * Mentions are always disabled so relayed chat text can never ping anyone.
     * Content over the hard limit is truncated here as a last resort.
     */
    nlohmann::json build_payload(std::string_view content) const
    {
        std::string text;
        if (utf8::length(content) > hard_chars_)
        {
            text = utf8::truncate(content, hard_chars_);
            LOG_MOD(warn, "sender") << "Message truncated to " << hard_chars_ << " characters";
        }
        else { text = std::string(content); }

        nlohmann::json payload = {
            {"username", bot_name_},
            {"content", text},
            {"allowed_mentions", {{"parse", nlohmann::json::array()}}},
        };

        if (bot_avatar_.find_first_not_of(" \t") != std::string::npos) { payload["avatar_url"] = bot_avatar_; }
        return payload;
    }

    dispatch_outcome classify(const http_response &response) const
    {
        const int status = response.status;

        if (status >= 200 && status < 300) { return outcome::success{}; }

        if (status == 429) { return classify_rate_limit(response); }

        if (status == 404 || status == 401)
        {
            LOG_MOD(error, "sender") << "============================================================\n"
                                     << "CRITICAL ERROR: webhook invalid or deleted (HTTP " << status << ")!\n"
                                     << "Check the webhook URL in the configuration.\n"
                                     << "============================================================";
            return outcome::permanent_reject{reject_reason::invalid_endpoint, status};
        }

        LOG_MOD(error, "sender").format("Webhook error {}: {}", status, response.body);
        if (status >= 500) { return outcome::transient_failure{transient_backoff_}; }
        return outcome::permanent_reject{reject_reason::rejected, status};
    }

  private:
    dispatch_outcome classify_rate_limit(const http_response &response) const
    {
        double retry_after = DEFAULT_RETRY_AFTER;
        auto body          = nlohmann::json::parse(response.body, nullptr, false);
        if (!body.is_discarded() && body.is_object())
        {
            auto it = body.find("retry_after");
            if (it != body.end() && it->is_number() && it->get<double>() >= 0) { retry_after = it->get<double>(); }
        }

        const double ceiling = std::chrono::duration<double>(max_retry_after_).count();
        if (retry_after > ceiling)
        {
            LOG_MOD(warn, "sender").format("retry_after {}s exceeds the {}s ceiling, capped", retry_after, ceiling);
            retry_after = ceiling;
        }

        auto scope_header = response.header("X-RateLimit-Scope");
        auto scope        = rate_limit_scope_from_string(scope_header.value_or("user"));
        auto remaining    = response.header("X-RateLimit-Remaining").value_or("?");
        auto reset_after  = response.header("X-RateLimit-Reset-After").value_or("?");

        switch (scope)
        {
        case rate_limit_scope::global:
            LOG_MOD(error, "sender").format("GLOBAL RATE LIMIT! Wait {}s - REDUCE TRAFFIC IMMEDIATELY!", retry_after);
            break;
        case rate_limit_scope::shared:
            LOG_MOD(warn, "sender").format("Rate limit (shared resource) - {}s - other bots may share this channel",
                                           retry_after);
            break;
        case rate_limit_scope::user:
            LOG_MOD(warn, "sender").format("Rate limit (endpoint) - {}s (remaining: {}, reset: {}s)",
                                           retry_after,
                                           remaining,
                                           reset_after);
            break;
        }

        return outcome::rate_limited{seconds_d(retry_after), scope};
    }

    http_transport &transport_;
    relay_stats &stats_;
    std::string url_;
    std::string bot_name_;
    std::string bot_avatar_;
    size_t hard_chars_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds transient_backoff_;
    std::chrono::milliseconds max_retry_after_;
};

} // namespace chatrelay

/**
 * @file relay_types.hpp
 * @brief Event record, dispatch outcomes and status enumerations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace chatrelay
{

using wall_clock   = std::chrono::system_clock;
using steady_clock = std::chrono::steady_clock;
using seconds_d    = std::chrono::duration<double>;

/**
 * @brief One chat message as received
 *
 * The reception time is stamped once at intake on both clocks. The wall clock
 * value is rendered downstream, the monotonic value measures latency.
 */
struct chat_event
{
    std::string sender{"Unknown"};
    std::optional<std::string> character;
    std::string message;
    std::string radius{"say"};
    std::optional<std::string> location;
    std::optional<std::string> channel;
    wall_clock::time_point received_wall{};
    steady_clock::time_point received_steady{};

    void stamp_reception()
    {
        received_wall   = wall_clock::now();
        received_steady = steady_clock::now();
    }
};

/**
 * @brief Granularity at which a rate limit applies
 */
enum class rate_limit_scope
{
    global,
    shared,
    user,
};

inline const char *to_string(rate_limit_scope scope)
{
    switch (scope)
    {
    case rate_limit_scope::global: return "global";
    case rate_limit_scope::shared: return "shared";
    case rate_limit_scope::user: return "user";
    }
    return "user";
}

// Unknown or missing scopes are treated as per-user limits
inline rate_limit_scope rate_limit_scope_from_string(std::string_view str)
{
    if (str == "global") return rate_limit_scope::global;
    if (str == "shared") return rate_limit_scope::shared;
    return rate_limit_scope::user;
}

enum class reject_reason
{
    invalid_endpoint, ///< 401/404, the webhook itself is gone or unauthorized
    rejected,         ///< Any other non-retryable status
};

inline const char *to_string(reject_reason reason)
{
    switch (reason)
    {
    case reject_reason::invalid_endpoint: return "invalid_endpoint";
    case reject_reason::rejected: return "rejected";
    }
    return "rejected";
}

namespace outcome
{
struct success
{
};

struct rate_limited
{
    seconds_d retry_after;
    rate_limit_scope scope;
};

struct permanent_reject
{
    reject_reason reason;
    int status;
};

struct transient_failure
{
    seconds_d retry_after;
};
} // namespace outcome

/**
 * @brief Result of one delivery attempt for one batch
 */
using dispatch_outcome =
    std::variant<outcome::success, outcome::rate_limited, outcome::permanent_reject, outcome::transient_failure>;

// Helper for std::visit with lambdas
template <class... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

enum class health_status
{
    ok,
    warning,
    critical,
    rate_limited,
};

inline const char *to_string(health_status status)
{
    switch (status)
    {
    case health_status::ok: return "OK";
    case health_status::warning: return "WARNING";
    case health_status::critical: return "CRITICAL";
    case health_status::rate_limited: return "RATE LIMITED";
    }
    return "OK";
}

/**
 * @brief Synchronous answer given to an intake caller
 */
enum class intake_status
{
    accepted,
    ignored,
    queue_full,
    internal_error,
};

inline const char *to_string(intake_status status)
{
    switch (status)
    {
    case intake_status::accepted: return "ok";
    case intake_status::ignored: return "ignored";
    case intake_status::queue_full: return "queue_full";
    case intake_status::internal_error: return "error";
    }
    return "error";
}

} // namespace chatrelay

/**
 * @file health.hpp
 * @brief Qualitative relay health derived from queue occupancy and rate limits
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>

#include "relay_types.hpp"

namespace chatrelay
{

inline constexpr double HEALTH_CRITICAL_QUEUE_PERCENT = 80.0;
inline constexpr double HEALTH_WARNING_QUEUE_PERCENT  = 50.0;
inline constexpr double HEALTH_RATE_LIMIT_PERCENT     = 10.0; // Rate limits per 100 sent events

inline double queue_percent(size_t occupancy, size_t max_queue)
{
    if (max_queue == 0) { return 0.0; }
    return static_cast<double>(occupancy) / static_cast<double>(max_queue) * 100.0;
}

/**
 * @brief Evaluate health on demand, queue pressure taking precedence over rate limits
 */
inline health_status evaluate_health(size_t occupancy, size_t max_queue, uint64_t total_rate_limits, uint64_t total_sent)
{
    double percent = queue_percent(occupancy, max_queue);

    if (percent > HEALTH_CRITICAL_QUEUE_PERCENT) { return health_status::critical; }
    if (percent > HEALTH_WARNING_QUEUE_PERCENT) { return health_status::warning; }

    if (total_rate_limits > 0 && total_sent > 0)
    {
        double rate_limit_percent = static_cast<double>(total_rate_limits) / static_cast<double>(total_sent) * 100.0;
        if (rate_limit_percent > HEALTH_RATE_LIMIT_PERCENT) { return health_status::rate_limited; }
    }

    return health_status::ok;
}

} // namespace chatrelay

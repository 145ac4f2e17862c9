/**
 * @file log_sinks.hpp
 * @brief Factory functions for the sinks the relay installs
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string_view>
#include <unistd.h>

#include "log_sink.hpp"
#include "log_formatters.hpp"
#include "log_writers.hpp"

namespace chatrelay
{

inline std::shared_ptr<log_sink> make_stdout_sink(log_level min_level = log_level::trace, bool use_color = true)
{
    return std::make_shared<log_sink>(
        text_formatter{
            .use_color   = use_color,
            .add_newline = true,
        },
        file_writer{STDOUT_FILENO},
        min_level);
}

inline std::shared_ptr<log_sink> make_rotating_file_sink(std::string_view filename,
                                                         rotate_policy policy = {},
                                                         log_level min_level  = log_level::trace)
{
    return std::make_shared<log_sink>(
        text_formatter{
            .use_color   = false,
            .add_newline = true,
        },
        rotating_file_writer{std::string(filename), policy},
        min_level);
}

} // namespace chatrelay

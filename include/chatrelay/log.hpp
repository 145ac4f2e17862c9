/**
 * @file log.hpp
 * @brief Asynchronous logging used throughout the relay
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Records are formatted on the calling thread and written by a dedicated
 * worker, so logging never blocks the intake or dispatch paths on I/O.
 *
 * Basic Usage:
 * @code
 * LOG(info) << "Bridge started";
 * LOG(warn).format("Rate limit hit ({}) - waiting {:.2f}s", scope, seconds);
 *
 * // Header code names its module at the call site
 * LOG_MOD(error, "sender") << "Webhook rejected";
 * @endcode
 *
 * Module Support:
 * @code
 * // At file scope, all LOG() calls in this compilation unit use "bridge"
 * LOG_MODULE_NAME("bridge");
 * @endcode
 *
 * Sink Configuration:
 * @code
 * // By default, logs go to stdout. The first add_sink() replaces the default:
 * log_dispatcher::instance().add_sink(make_rotating_file_sink("bridge.log"));
 * // Further sinks append:
 * log_dispatcher::instance().add_sink(make_stdout_sink(log_level::warn));
 * @endcode
 *
 * Log Levels (in order of severity): trace, debug, info, warn, error, fatal.
 * Levels below GLOBAL_MIN_LOG_LEVEL are removed at compile time, levels below
 * runtime_log_level() are rejected before any formatting happens.
 *
 * Thread Safety:
 * - All logging operations are thread-safe
 * - Log order is preserved within each thread
 * - Timestamps reflect log creation time, not output time
 * - Don't call LOG() from destructors of global/static objects
 */
#pragma once

#include <cstring>
#include <memory>

#include "log_types.hpp"           // IWYU pragma: keep
#include "log_line.hpp"            // IWYU pragma: keep
#include "log_sink.hpp"            // IWYU pragma: keep
#include "log_formatters.hpp"      // IWYU pragma: keep
#include "log_writers.hpp"         // IWYU pragma: keep
#include "log_sinks.hpp"           // IWYU pragma: keep
#include "log_dispatcher.hpp"      // IWYU pragma: keep
#include "log_dispatcher_impl.hpp" // IWYU pragma: keep
#include "version.hpp"             // IWYU pragma: keep

/**
 * @brief keep the filename + @p KeepParts parts of the path (KeepParts = 1 e.g. "/dev/relay/src/main.cpp" -> "src/main.cpp")
 */
template <size_t N, int KeepParts = 1> constexpr const char *get_path_suffix(const char (&path)[N])
{
    int total_separators = 0;
    for (size_t i = 0; i < N && path[i]; ++i)
    {
        if (path[i] == '/' || path[i] == '\\') { total_separators++; }
    }

    int skip_separators = total_separators - KeepParts;
    if (skip_separators <= 0) { return path; }

    const char *result = path;
    int skipped        = 0;
    for (size_t i = 0; i < N && path[i]; ++i)
    {
        if (path[i] == '/' || path[i] == '\\')
        {
            skipped++;
            if (skipped == skip_separators)
            {
                result = &path[i + 1];
                break;
            }
        }
    }

    return result;
}

#define file_source() get_path_suffix(__FILE__)

/**
 * @brief Base macro for log line creation
 * @internal
 *
 * 1. Compile-time filtering: Logs below GLOBAL_MIN_LOG_LEVEL are completely eliminated
 * 2. Runtime filtering: Checks against runtime_log_level()
 * 3. Returns a log_line that submits itself at the end of the full expression
 */
#define LOG_BASE(_level, _module_name)                                                      \
    []()                                                                                    \
    {                                                                                       \
        constexpr ::chatrelay::log_level level = ::chatrelay::log_level::_level;            \
        if constexpr (level >= ::chatrelay::GLOBAL_MIN_LOG_LEVEL)                           \
        {                                                                                   \
            if (::chatrelay::log_enabled(level))                                            \
            {                                                                               \
                return ::chatrelay::log_line(level, _module_name, file_source(), __LINE__); \
            }                                                                               \
        }                                                                                   \
        return ::chatrelay::log_line(::chatrelay::log_level::nolog, "", "", 0);             \
    }()

/**
 * @brief Log using the module of the current compilation unit
 * @param _level Log level (trace, debug, info, warn, error, fatal)
 */
#define LOG(_level) LOG_BASE(_level, ::chatrelay::g_log_module_info.name)

/**
 * @brief Log using a module named at the call site
 * @param _level Log level (trace, debug, info, warn, error, fatal)
 * @param _module_name Module name as a string literal
 */
#define LOG_MOD(_level, _module_name) LOG_BASE(_level, _module_name)

namespace chatrelay
{

/**
 * @brief Helper struct to set the module name during static initialization
 */
struct log_module_configurator
{
    log_module_configurator(const char *name) { g_log_module_info.name = name; }
};

} // namespace chatrelay

/**
 * @brief Set the module name for all LOG() calls in the current compilation unit
 *
 * @code
 * // At file scope
 * LOG_MODULE_NAME("bridge");
 * @endcode
 */
#define LOG_MODULE_NAME(name)                                                     \
    namespace                                                                     \
    {                                                                             \
    ::chatrelay::log_module_configurator _log_module_name_configurator{name};    \
    }

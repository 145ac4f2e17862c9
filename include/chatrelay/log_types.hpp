/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the relay's logging layer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <algorithm>
#include <chrono>
#include <concepts>

// fmt is used in header-only mode so the library needs no compiled fmt
#ifndef FMT_HEADER_ONLY
    #define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>

namespace chatrelay
{

// Log dispatcher constants
inline constexpr size_t LOG_MAX_BATCH_SIZE     = 64;   // Max records to dequeue in one batch
inline constexpr size_t LOG_DISPATCH_QUEUE_SIZE = 1024; // Initial queue capacity
inline constexpr size_t LOG_INLINE_TEXT_SIZE    = 256;  // Inline storage of a record's text before it allocates

// Batching configuration constants
inline constexpr auto LOG_BATCH_COLLECT_TIMEOUT = std::chrono::microseconds(50); // Max time to collect a batch
inline constexpr auto LOG_IDLE_WAIT             = std::chrono::milliseconds(100); // Wait before re-checking shutdown

// File rotation constants
inline constexpr uint64_t LOG_DEFAULT_ROTATE_BYTES = 5 * 1024 * 1024;
inline constexpr int LOG_DEFAULT_KEEP_FILES        = 3;

/**
 * @brief Concept for types that can be logged
 * @tparam T The type to check
 */
template <typename T>
concept Loggable = requires(T value) {
    { fmt::format("{}", value) } -> std::convertible_to<std::string>;
};

/**
 * @brief Enumeration of available log levels in ascending order of severity
 */
enum class log_level : int8_t
{
    nolog = -1, ///< No logging
    trace = 0,  ///< Finest-grained information
    debug = 1,  ///< Debugging information
    info  = 2,  ///< General information
    warn  = 3,  ///< Warning messages
    error = 4,  ///< Error messages
    fatal = 5,  ///< Critical errors
};

/**
 * @brief Global minimal log level. Messages below this level are eliminated at compile time.
 */
inline constexpr log_level GLOBAL_MIN_LOG_LEVEL = log_level::trace;

// Log level names for formatting
inline const char *log_level_names[] = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

inline const std::array<const char *, 6> log_level_colors = {
    "\033[37m", // trace
    "\033[36m", // debug
    "\033[32m", // info
    "\033[33m", // warn
    "\033[31m", // error
    "\033[35m", // fatal
};

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level, or log_level::nolog if invalid
 *
 * Recognized values: "trace", "debug", "info", "warn", "error", "fatal", "nolog", "off"
 */
inline log_level log_level_from_string(const char *str)
{
    if (!str) return log_level::nolog;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal" || lower == "critical") return log_level::fatal;
    if (lower == "nolog" || lower == "off" || lower == "none") return log_level::nolog;

    return log_level::nolog;
}

/**
 * @brief Convert log_level to string
 */
inline const char *string_from_log_level(log_level level)
{
    switch (level)
    {
    case log_level::trace: return "trace";
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
    case log_level::fatal: return "fatal";
    case log_level::nolog: return "nolog";
    default: return "unknown";
    }
}

} // namespace chatrelay

// Platform-specific fast timing utilities
#if defined(__linux__)
    #include <time.h>

inline std::chrono::steady_clock::time_point log_fast_timestamp()
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);

    auto duration = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return std::chrono::steady_clock::time_point(std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration));
}

#else
// Fallback to standard chrono
inline std::chrono::steady_clock::time_point log_fast_timestamp() { return std::chrono::steady_clock::now(); }
#endif

/**
 * @file log_line.hpp
 * @brief Represents a single log message with metadata
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "log_types.hpp"

namespace chatrelay
{

/**
 * @brief One finished (or in-progress) log message
 *
 * Records are created on the logging thread and owned by the dispatcher queue
 * once submitted. The worker thread hands them to sinks in batches and deletes
 * them afterwards.
 */
struct log_record
{
    log_level level_{log_level::nolog};
    std::chrono::system_clock::time_point wall_time_;
    std::chrono::steady_clock::time_point timestamp_;
    const char *module_{"generic"};
    std::string_view file_;
    uint32_t line_{0};
    fmt::basic_memory_buffer<char, LOG_INLINE_TEXT_SIZE> text_;
    std::shared_ptr<std::atomic<bool>> flush_done_; ///< Set only on flush markers, raised once the marker is processed

    std::string_view get_text() const { return {text_.data(), text_.size()}; }
    size_t len() const { return text_.size(); }
    bool is_flush_marker() const { return static_cast<bool>(flush_done_); }
};

/**
 * @brief Module handle used by the LOG() macro
 *
 * Each compilation unit has its own copy, reassigned by LOG_MODULE_NAME().
 */
struct log_module_info
{
    const char *name;
};

namespace
{
// Initialize with the generic module
log_module_info g_log_module_info{"generic"};
} // namespace

/**
 * @brief Process-wide runtime log level, adjustable while running
 */
inline std::atomic<log_level> &runtime_log_level()
{
    static std::atomic<log_level> level{log_level::info};
    return level;
}

inline void set_log_level(log_level level) { runtime_log_level().store(level, std::memory_order_relaxed); }

inline bool log_enabled(log_level level)
{
    auto current = runtime_log_level().load(std::memory_order_relaxed);
    return current != log_level::nolog && level >= current;
}

/**
 * @brief Builder for a single log message
 *
 * Text is formatted into the record as it is streamed. The destructor submits
 * the record to the dispatcher, so a log_line normally lives for exactly one
 * full expression:
 *
 * @code
 * LOG(info) << "Sent " << count << " message(s)";
 * LOG(warn).format("Rate limit ({}) - {:.1f}s", scope, seconds);
 * @endcode
 */
class log_line
{
  public:
    log_line() = delete;

    log_line(log_level level, const char *module, std::string_view file, uint32_t line)
    : record_(level != log_level::nolog ? std::make_unique<log_record>() : nullptr)
    {
        if (record_)
        {
            record_->level_     = level;
            record_->module_    = module;
            record_->file_      = file;
            record_->line_      = line;
            record_->timestamp_ = log_fast_timestamp();
            record_->wall_time_ = std::chrono::system_clock::now();
        }
    }

    log_line(log_line &&other) noexcept : record_(std::move(other.record_)) {}

    log_line(const log_line &)            = delete;
    log_line &operator=(const log_line &) = delete;
    log_line &operator=(log_line &&)      = delete;

    ~log_line(); // Defined after log_dispatcher

    log_line &print(std::string_view str)
    {
        if (!record_) { return *this; }
        record_->text_.append(str.data(), str.data() + str.size());
        return *this;
    }

    template <typename... Args> log_line &format(fmt::format_string<Args...> fmt, Args &&...args)
    {
        if (!record_) { return *this; }
        fmt::format_to(std::back_inserter(record_->text_), fmt, std::forward<Args>(args)...);
        return *this;
    }

    // Generic version for any formattable type
    template <typename T>
        requires Loggable<T>
    log_line &operator<<(const T &value)
    {
        if (!record_) { return *this; }
        fmt::format_to(std::back_inserter(record_->text_), "{}", value);
        return *this;
    }

    template <typename T> log_line &operator<<(T *ptr)
    {
        if (!record_) { return *this; }
        if (ptr == nullptr) { print("nullptr"); }
        else { fmt::format_to(std::back_inserter(record_->text_), "{}", static_cast<const void *>(ptr)); }
        return *this;
    }

    log_line &operator<<(const char *str)
    {
        if (!record_) { return *this; }
        return print(str ? std::string_view(str) : std::string_view("nullptr"));
    }

    bool active() const { return static_cast<bool>(record_); }

  private:
    std::unique_ptr<log_record> record_;
};

} // namespace chatrelay

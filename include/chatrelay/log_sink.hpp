/**
 * @file log_sink.hpp
 * @brief Sink abstraction pairing a formatter with a writer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "log_types.hpp"
#include "log_line.hpp"

namespace chatrelay
{

// Intermediate buffer size for batching formatted records into one write
inline constexpr size_t LOG_SINK_BUFFER_SIZE = 64 * 1024;

/**
 * @brief Abstract interface for log sink operations
 */
struct sink_concept
{
    virtual ~sink_concept() = default;

    virtual size_t process_batch(log_record *const *records, size_t count, log_level min_level, std::string &write_buffer) const = 0;
};

/**
 * @brief Concrete sink model holding a formatter and a writer
 *
 * Formatter must provide `void format(const log_record &, std::string &out) const`
 * (appending to @p out) and Writer must provide `ssize_t write(const char *, size_t) const`.
 */
template <typename Formatter, typename Writer> struct sink_model final : sink_concept
{
    Formatter formatter_;
    Writer writer_;

    sink_model(Formatter f, Writer w) : formatter_(std::move(f)), writer_(std::move(w)) {}

    size_t process_batch(log_record *const *records, size_t count, log_level min_level, std::string &write_buffer) const override
    {
        size_t processed = 0;
        write_buffer.clear();

        for (size_t i = 0; i < count; ++i)
        {
            if (records[i]->level_ < min_level) { continue; }

            formatter_.format(*records[i], write_buffer);
            processed++;

            if (write_buffer.size() >= LOG_SINK_BUFFER_SIZE)
            {
                writer_.write(write_buffer.data(), write_buffer.size());
                write_buffer.clear();
            }
        }

        if (!write_buffer.empty())
        {
            writer_.write(write_buffer.data(), write_buffer.size());
            write_buffer.clear();
        }

        return processed;
    }
};

/**
 * @brief Log sink with a per-sink minimum level
 *
 * ## Usage Example:
 * @code
 * auto console = std::make_shared<log_sink>(text_formatter{.use_color = true}, file_writer{STDOUT_FILENO});
 * log_dispatcher::instance().add_sink(console);
 * @endcode
 */
class log_sink
{
    std::unique_ptr<sink_concept> impl_;
    log_level min_level_{log_level::trace};
    mutable std::string write_buffer_; // Only touched by the dispatcher worker

  public:
    template <typename Formatter, typename Writer>
    log_sink(Formatter f, Writer w, log_level min_level = log_level::trace)
    : impl_(std::make_unique<sink_model<Formatter, Writer>>(std::move(f), std::move(w))),
      min_level_(min_level)
    {
        write_buffer_.reserve(LOG_SINK_BUFFER_SIZE);
    }

    // Process a batch of records, returning how many passed the level filter
    size_t process_batch(log_record *const *records, size_t count) const
    {
        if (impl_) { return impl_->process_batch(records, count, min_level_, write_buffer_); }
        return 0;
    }

    log_level min_level() const { return min_level_; }
    bool empty() const { return !impl_; }
    explicit operator bool() const { return static_cast<bool>(impl_); }
};

} // namespace chatrelay

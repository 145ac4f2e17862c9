/**
 * @file log_formatters.hpp
 * @brief Log record formatting implementations
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <ctime>
#include <string>
#include <string_view>

#include <fmt/chrono.h>

#include "log_types.hpp"
#include "log_line.hpp"

namespace chatrelay
{

/**
 * @brief Human readable single-line formatter
 *
 * Format: `[YYYY-mm-dd HH:MM:SS] LEVEL module    message`
 *
 * Continuation lines of multi-line messages are indented to the width of the
 * header so the message text stays aligned.
 */
class text_formatter
{
  public:
    bool use_color   = false;
    bool add_newline = true;

    void format(const log_record &record, std::string &out) const
    {
        const bool colored = use_color && record.level_ >= log_level::trace && record.level_ <= log_level::fatal;
        if (colored) { out.append(log_level_colors[static_cast<int>(record.level_)]); }

        std::time_t t = std::chrono::system_clock::to_time_t(record.wall_time_);
        std::tm local{};
        localtime_r(&t, &local);

        const size_t header_start = out.size();
        fmt::format_to(std::back_inserter(out),
                       "[{:%Y-%m-%d %H:%M:%S}] {} {:<9} ",
                       local,
                       level_name(record.level_),
                       record.module_ ? record.module_ : "generic");
        const size_t header_width = out.size() - header_start;

        // Copy message, padding continuation lines
        std::string_view text = record.get_text();
        size_t pos            = 0;
        while (pos < text.size())
        {
            size_t nl = text.find('\n', pos);
            if (nl == std::string_view::npos)
            {
                out.append(text.substr(pos));
                break;
            }
            out.append(text.substr(pos, nl - pos + 1));
            if (nl + 1 < text.size()) { out.append(header_width, ' '); }
            pos = nl + 1;
        }

        if (colored) { out.append("\033[0m"); }
        if (add_newline) { out.push_back('\n'); }
    }

  private:
    static const char *level_name(log_level level)
    {
        if (level < log_level::trace || level > log_level::fatal) { return "     "; }
        return log_level_names[static_cast<int>(level)];
    }
};

} // namespace chatrelay

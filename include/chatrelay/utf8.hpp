/**
 * @file utf8.hpp
 * @brief Code point counting and truncation for UTF-8 text
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * The endpoint limits messages in characters, not bytes. Counting lead bytes
 * is enough since input is taken as-is; malformed sequences count one per byte.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chatrelay::utf8
{

inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

inline size_t length(std::string_view text)
{
    size_t count = 0;
    for (unsigned char c : text)
    {
        if (!is_continuation(c)) { count++; }
    }
    return count;
}

/**
 * @brief Byte offset at which the first @p count code points end
 */
inline size_t offset_of(std::string_view text, size_t count)
{
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i)
    {
        if (!is_continuation(static_cast<unsigned char>(text[i])))
        {
            if (seen == count) { return i; }
            seen++;
        }
    }
    return text.size();
}

/**
 * @brief Limit @p text to @p max_chars code points, ending with @p marker when cut
 *
 * The result including the marker never exceeds @p max_chars.
 */
inline std::string truncate(std::string_view text, size_t max_chars, std::string_view marker = "...")
{
    if (length(text) <= max_chars) { return std::string(text); }

    size_t marker_chars = length(marker);
    size_t keep         = max_chars > marker_chars ? max_chars - marker_chars : 0;

    std::string result(text.substr(0, offset_of(text, keep)));
    result.append(marker);
    return result;
}

} // namespace chatrelay::utf8

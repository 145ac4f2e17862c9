/**
 * @file version.hpp
 * @brief Version information for the chatrelay bridge
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace chatrelay
{

#ifndef CHATRELAY_VERSION_STRING
    #define CHATRELAY_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = CHATRELAY_VERSION_STRING;

} // namespace chatrelay

/**
 * @file http_transport.hpp
 * @brief Minimal HTTP POST seam used by the webhook sender
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chatrelay
{

/**
 * @brief The request never produced an HTTP status (connect, DNS, timeout, ...)
 */
class transport_error : public std::runtime_error
{
  public:
    transport_error(const std::string &what, bool timed_out = false) : std::runtime_error(what), timed_out_(timed_out) {}

    bool timed_out() const noexcept { return timed_out_; }

  private:
    bool timed_out_;
};

struct http_request
{
    std::string url;
    std::string body;
    std::string content_type{"application/json"};
    std::chrono::milliseconds timeout{10000};
};

struct http_response
{
    int status = 0;
    std::string body;
    std::map<std::string, std::string> headers; ///< Names lower-cased

    std::optional<std::string> header(std::string_view name) const
    {
        std::string key(name);
        std::transform(key.begin(), key.end(), key.begin(), ::tolower);
        auto it = headers.find(key);
        if (it == headers.end()) { return std::nullopt; }
        return it->second;
    }
};

/**
 * @brief Performs one blocking POST
 *
 * Implementations return any HTTP status as a response and throw
 * transport_error only when no status was received.
 */
class http_transport
{
  public:
    virtual ~http_transport() = default;

    virtual http_response post(const http_request &request) = 0;
};

} // namespace chatrelay

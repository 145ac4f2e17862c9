/**
 * @file curl_transport.hpp
 * @brief libcurl implementation of http_transport
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include <curl/curl.h>
#include <fmt/format.h>

#include "http_transport.hpp"

namespace chatrelay
{

namespace detail
{

inline size_t curl_write_body(char *contents, size_t size, size_t nmemb, void *userp)
{
    size_t total_size = size * nmemb;
    static_cast<std::string *>(userp)->append(contents, total_size);
    return total_size;
}

// Collects "Name: value" lines, lower-casing the name
inline size_t curl_write_header(char *contents, size_t size, size_t nmemb, void *userp)
{
    size_t total_size = size * nmemb;
    auto *headers     = static_cast<std::map<std::string, std::string> *>(userp);

    std::string_view line(contents, total_size);
    auto colon = line.find(':');
    if (colon == std::string_view::npos) { return total_size; }

    std::string name(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);

    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) value.remove_suffix(1);

    (*headers)[name] = std::string(value);
    return total_size;
}

// curl_global_init once per process
inline void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace detail

/**
 * @brief Blocking POST over one reused easy handle
 *
 * Only the dispatch worker sends, the mutex guards the handle against
 * accidental sharing.
 */
class curl_transport : public http_transport
{
  public:
    curl_transport()
    {
        detail::ensure_curl_initialized();
        handle_ = curl_easy_init();
        if (!handle_) { throw transport_error("Failed to initialize libcurl"); }
    }

    curl_transport(const curl_transport &)            = delete;
    curl_transport &operator=(const curl_transport &) = delete;

    ~curl_transport() override
    {
        if (handle_) { curl_easy_cleanup(handle_); }
    }

    http_response post(const http_request &request) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        http_response response;
        curl_easy_reset(handle_);
        curl_easy_setopt(handle_, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle_, CURLOPT_POST, 1L);
        curl_easy_setopt(handle_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(handle_, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, detail::curl_write_body);
        curl_easy_setopt(handle_, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle_, CURLOPT_HEADERFUNCTION, detail::curl_write_header);
        curl_easy_setopt(handle_, CURLOPT_HEADERDATA, &response.headers);

        std::string content_type = "Content-Type: " + request.content_type;
        struct curl_slist *headers = nullptr;
        headers                    = curl_slist_append(headers, content_type.c_str());
        curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(handle_);
        curl_slist_free_all(headers);

        if (res != CURLE_OK)
        {
            throw transport_error(fmt::format("POST failed: {}", curl_easy_strerror(res)), res == CURLE_OPERATION_TIMEDOUT);
        }

        long status = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);
        return response;
    }

  private:
    CURL *handle_ = nullptr;
    std::mutex mutex_;
};

} // namespace chatrelay

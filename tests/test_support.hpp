/**
 * @file test_support.hpp
 * @brief Fixtures shared by the relay tests
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatrelay/chatrelay.hpp"

namespace chatrelay::testing
{

/**
 * @brief Scripted http_transport recording every request
 *
 * Responses are consumed in order; once the script runs out every request
 * gets a 204.
 */
class fake_transport : public http_transport
{
  public:
    struct sent_request
    {
        http_request request;
        nlohmann::json payload;
        steady_clock::time_point at;
    };

    using step = std::function<http_response(const http_request &)>;

    void push_response(int status, std::string body = {}, std::map<std::string, std::string> headers = {})
    {
        http_response response;
        response.status  = status;
        response.body    = std::move(body);
        response.headers = std::move(headers);
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back([response](const http_request &) { return response; });
    }

    void push_rate_limit(double retry_after, const std::string &scope)
    {
        push_response(429, nlohmann::json{{"retry_after", retry_after}}.dump(), {{"x-ratelimit-scope", scope}});
    }

    void push_error(const std::string &what, bool timed_out = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back([what, timed_out](const http_request &) -> http_response { throw transport_error(what, timed_out); });
    }

    // Arbitrary scripted behaviour, e.g. throwing something other than transport_error
    void push_step(step next)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(next));
    }

    http_response post(const http_request &request) override
    {
        step next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back({request, nlohmann::json::parse(request.body), steady_clock::now()});
            if (!script_.empty())
            {
                next = std::move(script_.front());
                script_.pop_front();
            }
        }

        if (next) { return next(request); }

        http_response ok;
        ok.status = 204;
        return ok;
    }

    std::vector<sent_request> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t request_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    // Content of every request, in order
    std::vector<std::string> contents() const
    {
        std::vector<std::string> result;
        for (const auto &r : requests()) { result.push_back(r.payload["content"].get<std::string>()); }
        return result;
    }

  private:
    mutable std::mutex mutex_;
    std::deque<step> script_;
    std::vector<sent_request> requests_;
};

// Defaults with timings short enough for unit tests
inline relay_config fast_config()
{
    relay_config config;
    config.webhook_url          = "https://chat.example.com/api/webhooks/1/token";
    config.batch_window         = std::chrono::milliseconds(20);
    config.inter_request_delay  = std::chrono::milliseconds(0);
    config.backoff_poll_ceiling = std::chrono::milliseconds(10);
    config.idle_pause           = std::chrono::milliseconds(1);
    config.error_pause          = std::chrono::milliseconds(1);
    config.shutdown_grace       = std::chrono::milliseconds(500);
    config.display.timestamp_format.clear();
    config.display.show_radius  = false;
    config.display.show_channel = false;
    return config;
}

// Event whose formatted line is "**sender**: message" with fast_config() display options
inline chat_event make_event(std::string message, std::string sender = "p")
{
    chat_event event;
    event.sender  = std::move(sender);
    event.message = std::move(message);
    event.stamp_reception();
    return event;
}

/**
 * @brief Wires a queue, stats, sender and worker around a fake transport
 */
struct relay_fixture
{
    relay_config config;
    relay_stats stats;
    intake_queue queue;
    fake_transport transport;
    webhook_sender sender;
    intake_gate gate;
    dispatch_worker worker;

    explicit relay_fixture(relay_config cfg = fast_config())
    : config(std::move(cfg)),
      sender(transport, stats, config),
      gate(queue, stats, config),
      worker(queue, stats, sender, config)
    {
    }

    void enqueue(size_t count, const std::string &prefix = "m")
    {
        for (size_t i = 0; i < count; ++i) { queue.enqueue(make_event(prefix + std::to_string(i))); }
    }
};

/**
 * @brief Log sink capturing formatted records for assertions
 */
class capture_sink
{
  public:
    capture_sink()
    {
        sink_ = std::make_shared<log_sink>(capturing_formatter{this}, discard_writer{});
    }

    std::shared_ptr<log_sink> get_sink() const { return sink_; }

    std::vector<std::string> lines() const
    {
        log_dispatcher::instance().flush();
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    // What the sink has received so far, without flushing first
    std::vector<std::string> written() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    bool contains(const std::string &needle) const
    {
        for (const auto &line : lines())
        {
            if (line.find(needle) != std::string::npos) { return true; }
        }
        return false;
    }

    void clear()
    {
        log_dispatcher::instance().flush();
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

  private:
    class capturing_formatter
    {
        capture_sink *parent_;

      public:
        explicit capturing_formatter(capture_sink *parent) : parent_(parent) {}

        void format(const log_record &record, std::string &out) const
        {
            std::string line = fmt::format("{} {} {}", string_from_log_level(record.level_), record.module_, record.get_text());
            out.append(line);
            std::lock_guard<std::mutex> lock(parent_->mutex_);
            parent_->lines_.push_back(std::move(line));
        }
    };

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::shared_ptr<log_sink> sink_;
};

/**
 * @brief Installs a capture_sink for the lifetime of a test, restoring a quiet setup after
 */
struct scoped_log_capture
{
    capture_sink capture;

    scoped_log_capture(log_level level = log_level::trace)
    {
        set_log_level(level);
        log_dispatcher::instance().set_sinks({capture.get_sink()});
    }

    ~scoped_log_capture()
    {
        log_dispatcher::instance().clear_sinks();
        set_log_level(log_level::info);
    }
};

} // namespace chatrelay::testing

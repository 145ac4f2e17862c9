/**
 * @file dispatch_worker.hpp
 * @brief Background loop moving events from the intake queue to the webhook
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * One cycle of the worker:
 *
 * 1. **collecting** - take the retry backlog, then drain the intake queue until
 *    the batch window elapses or the cycle holds max_batch_size events.
 * 2. **backoff** - while a rate limit is active nothing is sent; the events go
 *    back to the backlog and the worker sleeps at most backoff_poll_ceiling
 *    before collecting again, so intake keeps flowing during long penalties.
 * 3. **sending** - split into batches and send them in order, pausing
 *    inter_request_delay between requests and deferring everything past
 *    max_requests_per_cycle to the backlog.
 *
 * After every cycle the backlog is capped at max_retry_backlog by evicting the
 * oldest events.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "batch_splitter.hpp"
#include "intake_queue.hpp"
#include "relay_config.hpp"
#include "relay_stats.hpp"
#include "relay_types.hpp"
#include "webhook_sender.hpp"

namespace chatrelay
{

enum class worker_state
{
    collecting,
    backoff,
    sending,
};

inline const char *to_string(worker_state state)
{
    switch (state)
    {
    case worker_state::collecting: return "collecting";
    case worker_state::backoff: return "backoff";
    case worker_state::sending: return "sending";
    }
    return "collecting";
}

class dispatch_worker
{
  public:
    dispatch_worker(intake_queue &queue, relay_stats &stats, webhook_sender &sender, const relay_config &config)
    : queue_(queue),
      stats_(stats),
      sender_(sender),
      config_(config),
      last_stats_log_(steady_clock::now())
    {
    }

    dispatch_worker(const dispatch_worker &)            = delete;
    dispatch_worker &operator=(const dispatch_worker &) = delete;

    ~dispatch_worker() { stop(); }

    /**
     * @brief Start the worker thread
     */
    void start();

    /**
     * @brief End the loop, then drain for at most shutdown_grace
     *
     * Events still pending after the grace period are counted as dropped.
     * Safe to call more than once.
     */
    void stop();

    /**
     * @brief Run one collect/backoff/send cycle on the calling thread
     *
     * Used by the worker thread; tests drive the state machine through it
     * directly without starting a thread.
     */
    void run_cycle();

    worker_state state() const { return state_.load(std::memory_order_relaxed); }

    bool running() const { return thread_.joinable() && !stopping_.load(); }

    // The backlog belongs to the worker thread; only inspect it while the worker is not running
    const std::deque<chat_event> &backlog() const { return backlog_; }

    bool in_backoff() const { return steady_clock::now() < backoff_until_; }

    steady_clock::time_point backoff_until() const { return backoff_until_; }

  private:
    void worker_thread_func();

    std::vector<chat_event> collect();
    void send_events(std::vector<chat_event> events);
    void carry_over(std::vector<batch> &batches, size_t from);
    void enforce_backlog_cap();
    void expire_backlog();
    void maybe_log_stats();
    void drain();

    // Sleep unless stop() is called first; false when interrupted
    bool pause(std::chrono::milliseconds duration);

    intake_queue &queue_;
    relay_stats &stats_;
    webhook_sender &sender_;
    const relay_config &config_;

    std::deque<chat_event> backlog_;
    steady_clock::time_point backoff_until_{};
    steady_clock::time_point last_stats_log_;
    std::atomic<worker_state> state_{worker_state::collecting};

    std::thread thread_;
    std::atomic<bool> stopping_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

} // namespace chatrelay

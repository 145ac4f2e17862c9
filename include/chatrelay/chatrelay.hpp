/**
 * @file chatrelay.hpp
 * @brief Rate-limited relay of chat events to a webhook
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Pipeline: intake_gate -> intake_queue -> dispatch_worker -> split_batches
 * -> webhook_sender -> http_transport. relay_stats receives writes from every
 * stage and status snapshots read it together with the queue.
 *
 * @code
 * relay_config config = load_config_from_env();
 * config.validate();
 *
 * relay_stats stats;
 * intake_queue queue;
 * curl_transport transport;
 * webhook_sender sender{transport, stats, config};
 * dispatch_worker worker{queue, stats, sender, config};
 * intake_gate gate{queue, stats, config};
 *
 * worker.start();
 * gate.submit(parse_event(nlohmann::json::parse(line)));
 * ...
 * worker.stop();
 * fmt::print("{}\n", to_json(take_snapshot(stats, queue, config)).dump(2));
 * @endcode
 */
#pragma once

#include "log.hpp"                   // IWYU pragma: keep
#include "version.hpp"               // IWYU pragma: keep
#include "relay_types.hpp"           // IWYU pragma: keep
#include "relay_config.hpp"          // IWYU pragma: keep
#include "utf8.hpp"                  // IWYU pragma: keep
#include "intake_queue.hpp"          // IWYU pragma: keep
#include "relay_stats.hpp"           // IWYU pragma: keep
#include "message_formatter.hpp"     // IWYU pragma: keep
#include "batch_splitter.hpp"        // IWYU pragma: keep
#include "http_transport.hpp"        // IWYU pragma: keep
#include "curl_transport.hpp"        // IWYU pragma: keep
#include "webhook_sender.hpp"        // IWYU pragma: keep
#include "health.hpp"                // IWYU pragma: keep
#include "intake_gate.hpp"           // IWYU pragma: keep
#include "status_snapshot.hpp"       // IWYU pragma: keep
#include "dispatch_worker.hpp"       // IWYU pragma: keep
#include "dispatch_worker_impl.hpp"  // IWYU pragma: keep

/**
 * @file relay_main.cpp
 * @brief chatrelay-bridge: relays JSON chat events from stdin to a webhook
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "chatrelay/chatrelay.hpp"

using namespace chatrelay;

LOG_MODULE_NAME("bridge");

namespace
{

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) { g_stop_requested.store(true); }

// No SA_RESTART, so a blocked read on stdin returns when a signal arrives
void install_signal_handlers()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(const char *prog_name)
{
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Reads one JSON chat event per line from stdin and relays it to the webhook.\n"
              << "Event keys: sender, character, message, radius, location, channel\n"
              << "Options:\n"
              << "  --<setting> <value>   Override a setting (also --<setting>=<value>)\n"
              << "  -h, --help            Show this help\n"
              << "  --version             Show the version\n"
              << "Settings (environment CHATRELAY_<SETTING>, durations in seconds):\n";
    for (auto name : config_setting_names)
    {
        std::string flag(name);
        std::replace(flag.begin(), flag.end(), '_', '-');
        std::cerr << "  --" << flag << "\n";
    }
}

void setup_logging(const relay_config &config)
{
    set_log_level(log_level_from_string(config.log_level.c_str()));

    auto &dispatcher = log_dispatcher::instance();
    dispatcher.add_sink(make_stdout_sink());

    if (config.log_file.empty()) return;
    try
    {
        dispatcher.add_sink(make_rotating_file_sink(
            config.log_file,
            rotate_policy{.max_bytes = config.log_max_bytes, .keep_files = config.log_backup_count}));
    }
    catch (const std::runtime_error &e)
    {
        LOG(warn) << e.what() << ", logging to stdout only";
    }
}

} // namespace

int main(int argc, char *argv[])
{
    relay_config config;
    try
    {
        config = load_config_from_env();

        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help")
            {
                print_usage(argv[0]);
                return 0;
            }
            if (arg == "--version")
            {
                std::cout << "chatrelay-bridge " << VERSION << "\n";
                return 0;
            }
            if (arg.rfind("--", 0) != 0)
            {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }

            auto eq = arg.find('=');
            if (eq != std::string::npos) { apply_setting(config, arg.substr(2, eq - 2), arg.substr(eq + 1)); }
            else if (i + 1 < argc) { apply_setting(config, arg.substr(2), argv[++i]); }
            else { throw config_error("missing value for " + arg); }
        }

        config.validate();
    }
    catch (const config_error &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    setup_logging(config);
    install_signal_handlers();

    LOG(info).format("chatrelay-bridge {} starting", VERSION);
    LOG(info).format("Batch window {}ms, max {} msg/batch, {} request(s)/cycle, capacity {} msg/min",
                     config.batch_window.count(),
                     config.max_batch_size,
                     config.max_requests_per_cycle,
                     config.theoretical_capacity());
    if (!config.allowed_channels.empty())
    {
        LOG(info).format("Relaying channels: {}", fmt::join(config.allowed_channels, ", "));
    }

    relay_stats stats;
    intake_queue queue;

    std::unique_ptr<curl_transport> transport;
    try
    {
        transport = std::make_unique<curl_transport>();
    }
    catch (const transport_error &e)
    {
        LOG(fatal) << e.what();
        log_dispatcher::instance().flush();
        return 1;
    }

    webhook_sender sender{*transport, stats, config};
    intake_gate gate{queue, stats, config};

    {
        dispatch_worker worker{queue, stats, sender, config};
        worker.start();

        std::string line;
        uint64_t lines_read = 0, skipped = 0, not_relayed = 0;
        while (!g_stop_requested.load() && std::getline(std::cin, line))
        {
            lines_read++;
            auto status = submit_line(gate, line);
            if (!status) { skipped++; }
            else if (*status == intake_status::queue_full || *status == intake_status::internal_error) { not_relayed++; }
        }

        LOG(info).format("Input: {} line(s), {} skipped, {} not relayed", lines_read, skipped, not_relayed);
        LOG(info) << (g_stop_requested.load() ? "Stop requested, draining" : "End of input, draining");
        worker.stop();
    }

    auto snapshot = to_json(take_snapshot(stats, queue, config));
    LOG(info).format("Final status: {} | sent {} | dropped {} | failed {}",
                     snapshot["status"].get<std::string>(),
                     snapshot["messages"]["total_sent"].get<uint64_t>(),
                     snapshot["messages"]["total_dropped"].get<uint64_t>(),
                     snapshot["messages"]["total_failed"].get<uint64_t>());
    log_dispatcher::instance().flush();

    std::cout << snapshot.dump(2) << std::endl;

    log_dispatcher::instance().shutdown();
    return 0;
}

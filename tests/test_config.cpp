/**
 * @file test_config.cpp
 * @brief Tests for configuration defaults, parsing and validation
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#include <catch2/catch_test_macros.hpp>
#include <map>
#include <string>

#include "test_support.hpp"

using namespace chatrelay;
using namespace std::chrono_literals;

TEST_CASE("Default configuration", "[config]")
{
    relay_config config;

    REQUIRE(config.bot_name == "CONAN_CHAT");
    REQUIRE(config.batch_window == 2500ms);
    REQUIRE(config.max_batch_size == 20);
    REQUIRE(config.inter_request_delay == 500ms);
    REQUIRE(config.max_requests_per_cycle == 1);
    REQUIRE(config.max_queue_size == 500);
    REQUIRE(config.max_retry_backlog == 200);
    REQUIRE(config.safe_char_limit == 1900);
    REQUIRE(config.hard_char_limit == 2000);
    REQUIRE(config.stats_log_interval == 300s);
    REQUIRE(config.http_timeout == 10s);
    REQUIRE(config.max_retry_after == 3600s);
    REQUIRE(config.allowed_channels.empty());
    REQUIRE(config.display.timestamp_format == "T");
    REQUIRE_FALSE(config.display.show_location);

    REQUIRE(config.theoretical_capacity() == 480);
}

TEST_CASE("Applying settings", "[config]")
{
    relay_config config;

    apply_setting(config, "batch-window", "1.5");
    apply_setting(config, "MAX_BATCH_SIZE", "10");
    apply_setting(config, "allowed_channels", " 1, 2 ,,3 ");
    apply_setting(config, "show_radius", "no");
    apply_setting(config, "timestamp_format", "");

    REQUIRE(config.batch_window == 1500ms);
    REQUIRE(config.max_batch_size == 10);
    REQUIRE(config.allowed_channels == std::vector<std::string>{"1", "2", "3"});
    REQUIRE_FALSE(config.display.show_radius);
    REQUIRE(config.display.timestamp_format.empty());
    REQUIRE(config.theoretical_capacity() == 400);

    REQUIRE_THROWS_AS(apply_setting(config, "no_such_setting", "1"), config_error);
    REQUIRE_THROWS_AS(apply_setting(config, "max_batch_size", "ten"), config_error);
    REQUIRE_THROWS_AS(apply_setting(config, "max_batch_size", "-1"), config_error);
    REQUIRE_THROWS_AS(apply_setting(config, "batch_window", "-2"), config_error);
    REQUIRE_THROWS_AS(apply_setting(config, "show_channel", "maybe"), config_error);
    REQUIRE_THROWS_AS(apply_setting(config, "max_retry_after", "1e12"), config_error);

    apply_setting(config, "max-retry-after", "90");
    REQUIRE(config.max_retry_after == 90s);
}

TEST_CASE("Every documented setting is understood", "[config]")
{
    relay_config config;
    for (auto name : config_setting_names)
    {
        INFO(name);
        // Each name must at least be recognized; values may be rejected
        try
        {
            apply_setting(config, name, "1");
        }
        catch (const config_error &e)
        {
            REQUIRE(std::string(e.what()).find("unknown setting") == std::string::npos);
        }
    }
}

TEST_CASE("Loading from the environment", "[config][env]")
{
    std::map<std::string, std::string> env = {
        {"CHATRELAY_WEBHOOK_URL", "https://chat.example.com/hook"},
        {"CHATRELAY_MAX_QUEUE_SIZE", "50"},
        {"CHATRELAY_INTER_REQUEST_DELAY", "0.25"},
        {"UNRELATED", "x"},
    };
    auto lookup = [&env](const char *name) -> const char *
    {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    };

    auto config = load_config_from_env(lookup);
    REQUIRE(config.webhook_url == "https://chat.example.com/hook");
    REQUIRE(config.max_queue_size == 50);
    REQUIRE(config.inter_request_delay == 250ms);
    REQUIRE(config.max_batch_size == 20);
    REQUIRE_NOTHROW(config.validate());

    env["CHATRELAY_MAX_BATCH_SIZE"] = "many";
    REQUIRE_THROWS_AS(load_config_from_env(lookup), config_error);
}

TEST_CASE("Validation", "[config][validate]")
{
    auto config = testing::fast_config();
    REQUIRE_NOTHROW(config.validate());

    SECTION("Webhook must be configured")
    {
        config.webhook_url.clear();
        REQUIRE_THROWS_AS(config.validate(), config_error);
        config.webhook_url = "PASTE_YOUR_WEBHOOK";
        REQUIRE_THROWS_AS(config.validate(), config_error);
        config.webhook_url = "ftp://example.com";
        REQUIRE_THROWS_AS(config.validate(), config_error);
    }

    SECTION("Batching bounds")
    {
        config.max_batch_size = 0;
        REQUIRE_THROWS_AS(config.validate(), config_error);
    }

    SECTION("Retry ceiling")
    {
        config.max_retry_after = 0ms;
        REQUIRE_THROWS_AS(config.validate(), config_error);
    }

    SECTION("Character budget")
    {
        config.safe_char_limit = 2500;
        REQUIRE_THROWS_AS(config.validate(), config_error);
    }

    SECTION("Timestamp style")
    {
        config.display.timestamp_format = "X";
        REQUIRE_THROWS_AS(config.validate(), config_error);
        config.display.timestamp_format = "R";
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Log level")
    {
        config.log_level = "loud";
        REQUIRE_THROWS_AS(config.validate(), config_error);
        config.log_level = "debug";
        REQUIRE_NOTHROW(config.validate());
    }
}

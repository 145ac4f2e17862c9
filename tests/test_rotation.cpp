/**
 * @file test_rotation.cpp
 * @brief Tests for the rotating log file writer
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "chatrelay/log.hpp"

using namespace chatrelay;
namespace fs = std::filesystem;

// Test fixtures
class rotation_test_fixture
{
  protected:
    std::string test_dir;
    std::string base_filename;

    rotation_test_fixture()
    {
        auto pid = getpid();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        test_dir = "/tmp/test_rotation_" + std::to_string(pid) + "_" + std::to_string(tid);
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        base_filename = test_dir + "/bridge.log";
    }

    ~rotation_test_fixture()
    {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    bool file_exists(const std::string &path) { return fs::exists(path); }

    std::string read_file(const std::string &path)
    {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    void write_data(const rotating_file_writer &writer, size_t bytes, char fill = 'A')
    {
        std::string data(bytes, fill);
        writer.write(data.c_str(), data.size());
    }
};

TEST_CASE_METHOD(rotation_test_fixture, "Size-based rotation", "[rotation][size]")
{
    SECTION("No rotation below the limit")
    {
        rotating_file_writer writer(base_filename, rotate_policy{.max_bytes = 1024, .keep_files = 3});

        write_data(writer, 1000);
        write_data(writer, 24);

        REQUIRE(writer.rotations() == 0);
        REQUIRE(fs::file_size(base_filename) == 1024);
        REQUIRE_FALSE(file_exists(writer.backup_name(1)));
    }

    SECTION("Write crossing the limit rotates first")
    {
        rotating_file_writer writer(base_filename, rotate_policy{.max_bytes = 1024, .keep_files = 3});

        write_data(writer, 1020, 'A');
        write_data(writer, 100, 'B');

        REQUIRE(writer.rotations() == 1);
        REQUIRE(read_file(writer.backup_name(1)) == std::string(1020, 'A'));
        REQUIRE(read_file(base_filename) == std::string(100, 'B'));
        REQUIRE(writer.bytes_written() == 100);
    }

    SECTION("Backups shift and the oldest is deleted")
    {
        rotating_file_writer writer(base_filename, rotate_policy{.max_bytes = 512, .keep_files = 3});

        const char fills[] = {'1', '2', '3', '4', '5'};
        for (char fill : fills) { write_data(writer, 600, fill); }

        REQUIRE(writer.rotations() == 4);
        REQUIRE(read_file(base_filename) == std::string(600, '5'));
        REQUIRE(read_file(writer.backup_name(1)) == std::string(600, '4'));
        REQUIRE(read_file(writer.backup_name(2)) == std::string(600, '3'));
        REQUIRE(read_file(writer.backup_name(3)) == std::string(600, '2'));
        REQUIRE_FALSE(file_exists(writer.backup_name(4)));
    }

    SECTION("An oversized first write is kept whole")
    {
        rotating_file_writer writer(base_filename, rotate_policy{.max_bytes = 100, .keep_files = 2});

        write_data(writer, 300);

        REQUIRE(writer.rotations() == 0);
        REQUIRE(fs::file_size(base_filename) == 300);
    }
}

TEST_CASE_METHOD(rotation_test_fixture, "Reopening continues size accounting", "[rotation][append]")
{
    {
        rotating_file_writer writer(base_filename, rotate_policy{.max_bytes = 1000, .keep_files = 2});
        write_data(writer, 900, 'A');
    }

    rotating_file_writer reopened(base_filename, rotate_policy{.max_bytes = 1000, .keep_files = 2});
    REQUIRE(reopened.bytes_written() == 900);

    write_data(reopened, 200, 'B');
    REQUIRE(reopened.rotations() == 1);
    REQUIRE(read_file(reopened.backup_name(1)) == std::string(900, 'A'));
}

TEST_CASE_METHOD(rotation_test_fixture, "Zero max_bytes disables rotation", "[rotation]")
{
    rotating_file_writer writer(base_filename, rotate_policy{.max_bytes = 0, .keep_files = 3});

    for (int i = 0; i < 10; ++i) { write_data(writer, 1000); }

    REQUIRE(writer.rotations() == 0);
    REQUIRE(fs::file_size(base_filename) == 10000);
}

TEST_CASE_METHOD(rotation_test_fixture, "Unopenable log file throws", "[rotation][error]")
{
    REQUIRE_THROWS_AS(rotating_file_writer(test_dir + "/missing/dir/bridge.log"), std::runtime_error);
    REQUIRE_THROWS_AS(file_writer(test_dir + "/missing/dir/plain.log"), std::runtime_error);
}

TEST_CASE_METHOD(rotation_test_fixture, "Rotating sink writes formatted records", "[rotation][sink]")
{
    auto sink = make_rotating_file_sink(base_filename, rotate_policy{.max_bytes = 0, .keep_files = 1});

    log_record record;
    record.level_     = log_level::info;
    record.module_    = "bridge";
    record.wall_time_ = std::chrono::system_clock::now();
    record.text_.append(std::string_view("Bridge started"));
    log_record *records[] = {&record};

    REQUIRE(sink->process_batch(records, 1) == 1);

    auto contents = read_file(base_filename);
    REQUIRE(contents.find("INFO  bridge    Bridge started\n") != std::string::npos);
}

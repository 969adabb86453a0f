/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logging/logger.hpp"
#include "client/secret_cache.hpp"
#include "fake_backend.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace secretcache;
using json = nlohmann::json;

namespace {

// Route the logger to a fresh file and return its path
std::string log_to_file(const std::string& path, LogLevel min_level, bool enable_json = true) {
    std::filesystem::remove(path);

    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = enable_json;
    Logger::get_instance().configure(config);
    return path;
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();

    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

// Release the file and go back to the quiet test configuration
void finish(const std::string& path) {
    testing::quiet_logger();
    std::filesystem::remove(path);
}

} // namespace

TEST_CASE("Logger configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "secretcache.log");
    }

    SECTION("Level filtering") {
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::WARN);
        REQUIRE_FALSE(logger.is_enabled(LogLevel::INFO));
        REQUIRE(logger.is_enabled(LogLevel::ERROR));

        logger.set_min_level(LogLevel::DEBUG);
        REQUIRE(logger.is_enabled(LogLevel::DEBUG));
        testing::quiet_logger();
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }
}

TEST_CASE("Logger refresh events", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = log_to_file("test_refresh_events.log", LogLevel::DEBUG);

    SECTION("Successful refresh") {
        logger.log_refresh("version", "db-password", "v1");

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);

        json entry = json::parse(lines[0]);
        REQUIRE(entry["event"] == "secret_refresh");
        REQUIRE(entry["level"] == "INFO");
        REQUIRE(entry["message"] == "Refreshed cached version");
        REQUIRE(entry["entry_kind"] == "version");
        REQUIRE(entry["secret_id"] == "db-password");
        REQUIRE(entry["version_id"] == "v1");
        REQUIRE(entry.contains("timestamp"));
    }

    SECTION("Metadata refresh has no version id") {
        logger.log_refresh("secret", "db-password", "");

        json entry = json::parse(read_lines(path).at(0));
        REQUIRE(entry["entry_kind"] == "secret");
        REQUIRE_FALSE(entry.contains("version_id"));
    }

    SECTION("Failed refresh") {
        logger.log_refresh_failed("secret", "db-password", "", "connection \"refused\"", 3,
                                  std::chrono::milliseconds(4000));

        json entry = json::parse(read_lines(path).at(0));
        REQUIRE(entry["event"] == "secret_refresh_failed");
        REQUIRE(entry["level"] == "WARN");
        REQUIRE(entry["error_message"] == "connection \"refused\"");
        REQUIRE(entry["failure_count"] == "3");
        REQUIRE(entry["retry_delay_ms"] == "4000");
    }

    SECTION("Events below the minimum level are dropped") {
        logger.set_min_level(LogLevel::WARN);
        logger.log_refresh("secret", "db-password", "");
        logger.log_debug("stage_unresolved", {{"secret_id", "db-password"}});
        logger.log_error("db-password", "unavailable");

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(json::parse(lines[0])["event"] == "error");
    }

    finish(path);
}

TEST_CASE("Logger plain text output", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = log_to_file("test_plain_text.log", LogLevel::INFO, false);

    logger.log_refresh("version", "api-key", "v7");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[INFO] Refreshed cached version") != std::string::npos);
    REQUIRE(lines[0].find("secret_id=api-key") != std::string::npos);
    REQUIRE(lines[0].find("version_id=v7") != std::string::npos);

    finish(path);
}

TEST_CASE("Cache activity is logged without payloads", "[logger]") {
    std::string path = log_to_file("test_cache_activity.log", LogLevel::DEBUG);

    auto backend = std::make_shared<testing::FakeBackend>();
    backend->set_stages("db", {{"v1", {"AWSCURRENT"}}});
    backend->set_string("db", "v1", "hunter2");

    {
        SecretCache cache(backend);
        REQUIRE(*cache.get_secret_string("db") == "hunter2");

        backend->fail_describe = true;
        cache.refresh_secret_now("db");
        REQUIRE(*cache.get_secret_string("db") == "hunter2");
    }

    std::vector<std::string> events;
    for (const auto& line : read_lines(path)) {
        REQUIRE(line.find("hunter2") == std::string::npos);
        events.push_back(json::parse(line)["event"].get<std::string>());
    }

    REQUIRE(events.size() == 4);
    REQUIRE(events[0] == "config_loaded");
    REQUIRE(events[1] == "secret_refresh");
    REQUIRE(events[2] == "secret_refresh");
    REQUIRE(events[3] == "secret_refresh_failed");

    finish(path);
}

TEST_CASE("Logger line format", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = log_to_file("test_line_format.log", LogLevel::DEBUG);

    SECTION("UTC timestamp with milliseconds") {
        logger.log_refresh("secret", "db-password", "");

        std::string timestamp = json::parse(read_lines(path).at(0))["timestamp"];
        REQUIRE(timestamp.size() == 24);
        REQUIRE(timestamp[10] == 'T');
        REQUIRE(timestamp[19] == '.');
        REQUIRE(timestamp.back() == 'Z');
    }

    SECTION("Invalid UTF-8 in an error message is replaced") {
        logger.log_error("db-password", std::string("bad byte \xff here"));

        json entry = json::parse(read_lines(path).at(0));
        REQUIRE(entry["event"] == "error");
        REQUIRE(entry["error_message"].get<std::string>().find("bad byte") == 0);
    }

    finish(path);
}

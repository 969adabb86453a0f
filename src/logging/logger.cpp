/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logging/logger.hpp"
#include "config/cache_config.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace secretcache {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_config_loaded(const CacheConfig& config) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["max_cache_size"] = std::to_string(config.max_cache_size);
    fields["exception_retry_delay_base_ms"] = std::to_string(config.exception_retry_delay_base.count());
    fields["exception_retry_growth_factor"] = std::to_string(config.exception_retry_growth_factor);
    fields["exception_retry_delay_max_ms"] = std::to_string(config.exception_retry_delay_max.count());
    fields["default_version_stage"] = config.default_version_stage;
    fields["secret_refresh_interval_s"] = std::to_string(config.secret_refresh_interval.count());
    fields["hook"] = config.secret_cache_hook ? "true" : "false";

    log(LogLevel::INFO, "Secret cache configured", fields);
}

void Logger::log_refresh(
    const std::string& entry_kind,
    const std::string& secret_id,
    const std::string& version_id
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "secret_refresh";
    fields["entry_kind"] = entry_kind;
    fields["secret_id"] = secret_id;
    if (!version_id.empty()) {
        fields["version_id"] = version_id;
    }

    log(LogLevel::INFO, "Refreshed cached " + entry_kind, fields);
}

void Logger::log_refresh_failed(
    const std::string& entry_kind,
    const std::string& secret_id,
    const std::string& version_id,
    const std::string& error_message,
    size_t failure_count,
    std::chrono::milliseconds retry_delay
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "secret_refresh_failed";
    fields["entry_kind"] = entry_kind;
    fields["secret_id"] = secret_id;
    if (!version_id.empty()) {
        fields["version_id"] = version_id;
    }
    fields["error_message"] = error_message;
    fields["failure_count"] = std::to_string(failure_count);
    fields["retry_delay_ms"] = std::to_string(retry_delay.count());

    log(LogLevel::WARN, "Failed to refresh cached " + entry_kind, fields);
}

void Logger::log_error(const std::string& secret_id, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["secret_id"] = secret_id;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Secret unavailable", fields);
}

void Logger::log_debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    const std::string timestamp = get_timestamp();
    write_output(config_.enable_json
        ? format_json(timestamp, level, message, fields)
        : format_text(timestamp, level, message, fields));
}

std::string Logger::get_timestamp() const {
    // UTC, ISO 8601 with milliseconds: 2024-05-01T12:00:00.123Z
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc;
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);

    char stamped[40];
    std::snprintf(stamped, sizeof(stamped), "%s.%03lldZ", buffer, millis);
    return stamped;
}

std::string Logger::format_json(
    const std::string& timestamp,
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) const {
    nlohmann::json line(fields);
    line["timestamp"] = timestamp;
    line["level"] = level_to_string(level);
    line["message"] = message;

    // Backend error text is not guaranteed to be valid UTF-8
    return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text(
    const std::string& timestamp,
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) const {
    std::string line = timestamp + " [" + level_to_string(level) + "] " + message;
    for (const auto& [key, value] : fields) {
        line += ' ';
        line += key;
        line += '=';
        line += value;
    }
    return line;
}

void Logger::write_output(const std::string& line) {
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line << '\n';
    }
}

} // namespace secretcache

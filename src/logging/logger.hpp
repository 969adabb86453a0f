/**
 * @file logger.hpp
 * @brief Structured logging for the secret cache with JSON output
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing (or plain text)
 * - Refresh outcome events (secret id, version id, failure count, backoff)
 * - Thread-safe writes
 *
 * Secret payloads are never passed to the logger.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef SECRETCACHE_LOGGER_HPP
#define SECRETCACHE_LOGGER_HPP

#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace secretcache {

struct CacheConfig;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Cache hits, stage resolution details
    INFO,    ///< Successful refreshes, configuration
    WARN,    ///< Failed refreshes (recovered by backoff)
    ERROR    ///< Failures surfaced to callers
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("secretcache.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "secretcache.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_refresh_failed("secret", "db-password", "", "timeout", 1, 1000ms);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the configuration a cache was built with
     */
    void log_config_loaded(const CacheConfig& config);

    /**
     * @brief Log a successful refresh of a cache entry
     *
     * @param entry_kind "secret" (metadata) or "version"
     * @param secret_id Secret identifier
     * @param version_id Version identifier (empty for metadata refreshes)
     */
    void log_refresh(
        const std::string& entry_kind,
        const std::string& secret_id,
        const std::string& version_id
    );

    /**
     * @brief Log a failed refresh and the backoff scheduled after it
     *
     * @param entry_kind "secret" (metadata) or "version"
     * @param secret_id Secret identifier
     * @param version_id Version identifier (empty for metadata refreshes)
     * @param error_message Backend error message
     * @param failure_count Consecutive failures so far
     * @param retry_delay Delay before the next attempt is allowed
     */
    void log_refresh_failed(
        const std::string& entry_kind,
        const std::string& secret_id,
        const std::string& version_id,
        const std::string& error_message,
        size_t failure_count,
        std::chrono::milliseconds retry_delay
    );

    /**
     * @brief Log an error surfaced to a caller
     */
    void log_error(const std::string& secret_id, const std::string& error_message);

    /**
     * @brief Log a debug message with arbitrary fields
     */
    void log_debug(const std::string& message, const std::map<std::string, std::string>& fields);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);

    LogLevel get_min_level() const;

    /**
     * @brief Check whether a level would currently be emitted
     */
    bool is_enabled(LogLevel level) const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);

    // Called from log() with mutex_ held
    std::string get_timestamp() const;
    std::string format_json(const std::string& timestamp, LogLevel level, const std::string& message,
                            const std::map<std::string, std::string>& fields) const;
    std::string format_text(const std::string& timestamp, LogLevel level, const std::string& message,
                            const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& line);
};

} // namespace secretcache

#endif // SECRETCACHE_LOGGER_HPP

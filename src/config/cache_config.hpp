#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace secretcache {

class SecretCacheHook;

/**
 * Exception thrown for malformed configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Cache configuration
 *
 * Treated as immutable once built: the cache and every entry share it as
 * std::shared_ptr<const CacheConfig>.
 */
struct CacheConfig {
    size_t max_cache_size;                                  ///< Top-level LRU capacity
    std::chrono::milliseconds exception_retry_delay_base;   ///< First retry delay after a failure
    double exception_retry_growth_factor;                   ///< Backoff multiplier per failure
    std::chrono::milliseconds exception_retry_delay_max;    ///< Backoff cap
    std::string default_version_stage;                      ///< Stage used when none is requested
    std::chrono::seconds secret_refresh_interval;           ///< Metadata refresh interval
    std::shared_ptr<SecretCacheHook> secret_cache_hook;     ///< Optional store/load transform

    CacheConfig()
        : max_cache_size(1024),
          exception_retry_delay_base(1000),
          exception_retry_growth_factor(2.0),
          exception_retry_delay_max(3600000),
          default_version_stage("AWSCURRENT"),
          secret_refresh_interval(3600) {}
};

/**
 * Settings for the HTTP secrets backend
 */
struct HttpBackendConfig {
    std::string endpoint;
    int timeout_ms;
    std::map<std::string, std::string> headers;  ///< Extra static request headers

    HttpBackendConfig() : timeout_ms(30000) {}
};

/**
 * @brief Upper bound for every delay and interval option (100 years)
 *
 * Keeps deadlines computed as now + delay inside the range of
 * std::chrono::steady_clock.
 */
constexpr std::chrono::hours MAX_CONFIG_DURATION(24 * 365 * 100);

/**
 * @brief Checks value ranges of a configuration built field by field
 *
 * - delays and the refresh interval in [0, MAX_CONFIG_DURATION]
 * - exception_retry_delay_max >= exception_retry_delay_base
 * - exception_retry_growth_factor finite and >= 1
 * - default_version_stage not empty
 *
 * @throws ConfigError naming the first offending field
 */
void validate_cache_config(const CacheConfig& config);

/**
 * @brief Option names recognised by make_cache_config()
 */
bool is_known_option(const std::string& name);

/**
 * @brief Builds a configuration from named options
 *
 * Values are given as strings (e.g. {"max_cache_size", "16"}). Options not
 * listed keep their defaults.
 *
 * @throws ConfigError on unknown names, unparsable or out-of-range values
 */
CacheConfig make_cache_config(const std::map<std::string, std::string>& options,
                              std::shared_ptr<SecretCacheHook> hook = nullptr);

/**
 * @brief Parses a configuration from a JSON string
 *
 * Accepts either a flat object of options or an object with a "cache"
 * section (and an optional "backend" section, ignored here).
 *
 * @throws ConfigError if JSON is invalid or an option is rejected
 */
CacheConfig parse_cache_config_from_string(const std::string& json_string);

/**
 * @brief Parses a configuration from a JSON file
 * @throws ConfigError if the file cannot be read or parsing fails
 */
CacheConfig parse_cache_config_from_file(const std::string& file_path);

/**
 * @brief Parses the "backend" section of a JSON configuration
 * @throws ConfigError if the section is missing or malformed
 */
HttpBackendConfig parse_http_backend_config_from_string(const std::string& json_string);

HttpBackendConfig parse_http_backend_config_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

} // namespace secretcache

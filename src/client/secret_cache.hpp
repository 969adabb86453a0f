#pragma once

#include "api/secrets_backend.hpp"
#include "cache/lru_cache.hpp"
#include "cache/secret_entry.hpp"
#include "config/cache_config.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace secretcache {

/**
 * Secret cache error
 */
class SecretCacheError : public std::runtime_error {
public:
    explicit SecretCacheError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * In-process cache for secrets held in a secrets backend
 *
 * Features:
 * - Bounded LRU of secrets (max_cache_size)
 * - Metadata refreshed on a jittered interval, version payloads fetched once
 * - Stale values served when a refresh fails; exponential backoff between
 *   failed attempts
 * - At most one in-flight backend call per secret / version
 * - Thread-safe
 *
 * Example usage:
 *   auto backend = std::make_shared<HttpSecretsBackend>(backend_config);
 *   SecretCache cache(make_cache_config({{"secret_refresh_interval", "600"}}), backend);
 *   std::optional<std::string> password = cache.get_secret_string("db-password");
 */
class SecretCache {
public:
    /**
     * Constructor
     * @param config Cache configuration (copied; immutable afterwards)
     * @param backend Secrets backend shared by all entries
     * @throws SecretCacheError if backend is null
     * @throws ConfigError if a field is out of range (see validate_cache_config)
     */
    SecretCache(const CacheConfig& config, std::shared_ptr<SecretsBackend> backend);

    /**
     * Constructor with default configuration
     */
    explicit SecretCache(std::shared_ptr<SecretsBackend> backend);

    SecretCache(const SecretCache&) = delete;
    SecretCache& operator=(const SecretCache&) = delete;

    /**
     * Get the string payload of a secret
     * @param secret_id Secret identifier
     * @param version_stage Stage (empty: configured default)
     * @return Secret string, std::nullopt if the stage or the field is absent
     * @throws the last backend failure when nothing is cached for the request
     */
    std::optional<std::string> get_secret_string(const std::string& secret_id,
                                                 const std::string& version_stage = "");

    /**
     * Get the binary payload of a secret
     * @return Secret bytes, std::nullopt if the stage or the field is absent
     */
    std::optional<SecretBinary> get_secret_binary(const std::string& secret_id,
                                                  const std::string& version_stage = "");

    /**
     * Get the whole cached version payload
     */
    std::optional<SecretValue> get_secret_value(const std::string& secret_id,
                                                const std::string& version_stage = "");

    /**
     * Force the secret's metadata to be refreshed on its next read
     */
    void refresh_secret_now(const std::string& secret_id);

    /**
     * Get top-level cache statistics
     */
    CacheStats get_cache_stats() const;

    const CacheConfig& config() const { return *config_; }

private:
    std::shared_ptr<const CacheConfig> config_;
    std::shared_ptr<SecretsBackend> backend_;
    LRUCache<std::string, std::shared_ptr<SecretEntry>> cache_;

    std::shared_ptr<SecretEntry> get_cached_secret(const std::string& secret_id);
};

} // namespace secretcache

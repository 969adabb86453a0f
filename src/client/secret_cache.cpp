#include "client/secret_cache.hpp"
#include "logging/logger.hpp"

namespace secretcache {

SecretCache::SecretCache(const CacheConfig& config, std::shared_ptr<SecretsBackend> backend)
    : config_(std::make_shared<CacheConfig>(config))
    , backend_(std::move(backend))
    , cache_(config.max_cache_size)
{
    if (!backend_) {
        throw SecretCacheError("Secret cache requires a secrets backend");
    }
    validate_cache_config(*config_);

    Logger::get_instance().log_config_loaded(*config_);
}

SecretCache::SecretCache(std::shared_ptr<SecretsBackend> backend)
    : SecretCache(CacheConfig(), std::move(backend))
{
}

std::shared_ptr<SecretEntry> SecretCache::get_cached_secret(const std::string& secret_id) {
    // Construction does no I/O; the first get_value() performs the fetch
    return cache_.get_or_put(secret_id, [&]() {
        return std::make_shared<SecretEntry>(config_, backend_, secret_id);
    });
}

std::optional<SecretValue> SecretCache::get_secret_value(const std::string& secret_id,
                                                         const std::string& version_stage) {
    std::shared_ptr<SecretEntry> secret = get_cached_secret(secret_id);

    try {
        return secret->get_value(version_stage);
    } catch (const std::exception& e) {
        Logger::get_instance().log_error(secret_id, e.what());
        throw;
    }
}

std::optional<std::string> SecretCache::get_secret_string(const std::string& secret_id,
                                                          const std::string& version_stage) {
    std::optional<SecretValue> secret = get_secret_value(secret_id, version_stage);
    if (!secret) {
        return std::nullopt;
    }
    return secret->secret_string;
}

std::optional<SecretBinary> SecretCache::get_secret_binary(const std::string& secret_id,
                                                           const std::string& version_stage) {
    std::optional<SecretValue> secret = get_secret_value(secret_id, version_stage);
    if (!secret) {
        return std::nullopt;
    }
    return secret->secret_binary;
}

void SecretCache::refresh_secret_now(const std::string& secret_id) {
    get_cached_secret(secret_id)->refresh_now();
}

CacheStats SecretCache::get_cache_stats() const {
    return cache_.stats();
}

} // namespace secretcache
